#include "stream_chunker/delimiter.hpp"
#include <iostream>
#include <string>

static int failures = 0;

static void expect(bool cond, const std::string& what) {
  if (cond) { std::cout << "[PASS] " << what << "\n"; return; }
  std::cerr << "[FAIL] " << what << "\n";
  ++failures;
}

static bool same(const sc::DelimitResult& r, bool ready, std::string_view rec, std::string_view rem) {
  return r.ready == ready && r.record == rec && r.remainder == rem;
}

static sc::DelimitResult lines(std::string_view buf) {
  return sc::delimit_by_byte(buf, sc::kDefaultDelimiter);
}

int main(){
  expect(same(lines(""), false, "", ""), "empty buffer is not ready");
  expect(same(lines("partial"), false, "partial", ""), "no delimiter returns input unchanged");
  expect(same(lines("abc\ndef"), true, "abc", "def"), "splits at first delimiter");
  expect(same(lines("abc\ndef\n"), true, "abc", "def\n"), "keeps delimiter after a closed segment");
  expect(same(lines("abc\n"), true, "abc", ""), "trailing empty segment contributes nothing");
  expect(same(lines("\nabc"), true, "", "abc"), "leading delimiter gives empty record");
  expect(same(lines("\n\n\n"), true, "", ""), "delimiter-only input consumes everything");
  expect(same(lines("a\n\nb"), true, "a", "b"), "empty interior segment dropped");
  expect(same(lines("x\ny\n\nz"), true, "x", "y\nz"), "remainder re-joins kept segments");
  expect(same(lines("x\ny\nz"), true, "x", "y\nz"), "remainder may hold further records");
  expect(same(lines("a\nb\n\n"), true, "a", "b\n"), "trailing delimiter run collapses");

  {
    const std::string buf = "first line\nsecond\nthi";
    auto a = lines(buf);
    auto b = lines(buf);
    expect(same(a, b.ready, b.record, b.remainder) && a.consumed == b.consumed, "idempotent on the same buffer");
  }

  // consumed covers the boundary and the empty segments right after it
  expect(lines("abc\ndef").consumed == 4, "consumed stops after the boundary");
  expect(lines("a\n\n\nb").consumed == 4, "consumed skips the delimiter run");
  expect(lines("\n\n\n").consumed == 3, "consumed covers a delimiter-only buffer");
  expect(lines("partial").consumed == 0, "nothing consumed without a boundary");

  {
    auto semi = sc::byte_delimiter(';');
    auto r = semi("k=v;;k2=v2;");
    expect(r.ready && r.record == "k=v" && r.consumed == 5, "custom byte delimiter");
    expect(r.remainder.empty(), "strategy form leaves the remainder to the caller");
    auto n = semi("k=v\nk2");
    expect(!n.ready && n.record == "k=v\nk2", "newline is data for a custom delimiter");
    expect(same(sc::delimit_by_byte("k=v;;k2=v2;", ';'), true, "k=v", "k2=v2;"), "contract form on a custom delimiter");
  }

  {
    // the strategy's cut points reproduce the contract's remainder records
    const std::string buf = "r1\n\nr2\nr3\n\n\nr4";
    auto fn = sc::byte_delimiter();
    std::string_view rest(buf);
    std::string walked;
    auto r = fn(rest);
    rest.remove_prefix(r.consumed);
    while (true) {
      auto c = fn(rest);
      if (!walked.empty()) walked.push_back('\n');
      walked.append(c.record.data(), c.record.size());
      if (!c.ready) break;
      rest.remove_prefix(c.consumed);
    }
    expect(walked == lines(buf).remainder, "offset walk matches the materialized remainder");
  }

  {
    std::string r = "a\nb\n\nc";
    sc::strip_delimiter(r, '\n');
    expect(r == "abc", "strip_delimiter removes every occurrence");
    std::string untouched = "plain";
    sc::strip_delimiter(untouched, '\n');
    expect(untouched == "plain", "strip_delimiter leaves clean records alone");
  }

  if (failures) { std::cerr << "[FAIL] delimiter: " << failures << " check(s) failed\n"; return 1; }
  std::cout << "[PASS] delimiter\n";
  return 0;
}
