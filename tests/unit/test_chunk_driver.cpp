#include "stream_chunker/byte_source.hpp"
#include "stream_chunker/chunk_driver.hpp"

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <iostream>
#include <string>
#include <vector>

static int failures = 0;

static void expect(bool cond, const std::string& what) {
  if (cond) { std::cout << "[PASS] " << what << "\n"; return; }
  std::cerr << "[FAIL] " << what << "\n";
  ++failures;
}

using Records = std::vector<std::string>;

static std::string show(const Records& v) {
  std::string out = "[";
  for (size_t i = 0; i < v.size(); ++i) {
    if (i) out += ",";
    out += "\"";
    for (char c : v[i]) out += (c == '\n') ? std::string("\\n") : std::string(1, c);
    out += "\"";
  }
  return out + "]";
}

static Records split_all(const std::string& s, char delim) {
  Records out;
  std::string cur;
  for (char c : s) {
    if (c == delim) { out.push_back(cur); cur.clear(); }
    else cur.push_back(c);
  }
  out.push_back(cur);
  return out;
}

struct Run {
  sc::ChunkStatus st;
  Records recs;
  std::size_t peak = 0;
  std::uint64_t bytes = 0;
};

static Run collect(sc::ByteSource& src, std::size_t chunk, char delim = '\n') {
  Run r;
  sc::ChunkDriver::Config cfg;
  cfg.chunk_bytes = chunk;
  cfg.delimiter = delim;
  sc::ChunkDriver d(cfg);
  r.st = d.run(src, [&](std::string_view rec, std::string*){
    r.recs.emplace_back(rec);
    return true;
  });
  r.peak = d.peak_buffer_bytes();
  r.bytes = d.bytes_read();
  return r;
}

static Run collect(const std::string& data, std::size_t chunk, std::size_t max_read = 0) {
  sc::MemoryByteSource src(data, max_read);
  return collect(src, chunk);
}

static void test_examples() {
  auto r = collect("alpha\nbeta\ngamma", 4);
  expect(r.st.ok() && r.recs == Records{"alpha", "beta", "gamma"},
         "alpha/beta/gamma with chunk 4 -> " + show(r.recs));

  r = collect("\n\n", 128);
  expect(r.st.ok() && r.recs == Records{"", ""}, "delimiter-only stream yields two empty records -> " + show(r.recs));

  r = collect("abc", 128);
  expect(r.st.ok() && r.recs == Records{"abc"}, "final partial record without delimiter -> " + show(r.recs));

  r = collect("a\nb\n", 128);
  expect(r.st.ok() && r.recs == Records{"a", "b", ""}, "stream ending on a delimiter adds an empty record -> " + show(r.recs));

  r = collect("", 16);
  expect(r.st.ok() && r.recs == Records{""}, "empty stream delivers one empty record");

  r = collect("one record that is much longer than the chunk\nx", 3);
  expect(r.st.ok() && r.recs == Records{"one record that is much longer than the chunk", "x"},
         "records longer than the chunk are reassembled");
}

static void test_chunk_boundary_independence() {
  const std::vector<std::string> inputs = {
    "",
    "abc",
    "a\nb",
    "a\nb\n",
    "\nleading",
    "one\ntwo\nthree\n",
    "{\"id\":1,\"v\":\"x\"}\n{\"id\":2,\"v\":\"yy\"}\n{\"id\":3}",
    std::string(300, 'q') + "\n" + std::string(7, 'r') + "\n" + std::string(129, 's'),
  };
  const std::vector<std::size_t> caps = {0, 1, 3};

  bool all = true;
  for (const auto& in : inputs) {
    const Records want = split_all(in, '\n');
    for (std::size_t chunk = 1; chunk <= in.size() + 2; ++chunk) {
      for (auto cap : caps) {
        auto r = collect(in, chunk, cap);
        if (!r.st.ok() || r.recs != want || r.bytes != in.size()) {
          std::cerr << "  mismatch chunk=" << chunk << " cap=" << cap
                    << " got=" << show(r.recs) << " want=" << show(want) << "\n";
          all = false;
        }
        // same stream, final bytes handed over together with Eof
        sc::MemoryByteSource eof_src(in, cap);
        eof_src.set_eof_with_last_read(true);
        auto e = collect(eof_src, chunk);
        if (!e.st.ok() || e.recs != want) {
          std::cerr << "  eof-with-data mismatch chunk=" << chunk << " cap=" << cap
                    << " got=" << show(e.recs) << "\n";
          all = false;
        }
      }
    }
  }
  expect(all, "records independent of chunk size and short reads");
}

static void test_round_trip() {
  const std::string in = "lorem ipsum\ndolor sit amet\n\xff\x01" "binary\nlast";
  bool all = true;
  for (std::size_t chunk : {1, 2, 5, 16, 1024}) {
    auto r = collect(in, chunk);
    std::string joined;
    for (size_t i = 0; i < r.recs.size(); ++i) {
      if (i) joined.push_back('\n');
      joined += r.recs[i];
    }
    all = all && r.st.ok() && joined == in;
  }
  expect(all, "joining records with the delimiter reconstructs the stream");
}

static void test_bounded_memory() {
  std::string in;
  std::size_t longest = 0;
  for (int i = 0; i < 5000; ++i) {
    const std::size_t len = 1 + (i * 7919) % 50;
    longest = std::max(longest, len);
    in.append(len, static_cast<char>('a' + i % 26));
    in.push_back('\n');
  }
  const std::size_t chunk = 64;
  auto r = collect(in, chunk);
  expect(r.st.ok() && r.recs.size() == 5001, "bounded-memory run delivers every record");
  expect(r.peak <= chunk + longest,
         "accumulation stays within chunk + longest record (peak=" + std::to_string(r.peak) + ")");
}

static void test_handler_failure() {
  sc::MemoryByteSource src("r1\nr2\nr3\nr4\nr5");
  std::size_t calls = 0;
  sc::ChunkDriver d;
  auto st = d.run(src, [&](std::string_view rec, std::string* err){
    ++calls;
    if (rec == "r2") { *err = "refused r2"; return false; }
    return true;
  });
  expect(st.code == sc::ChunkErrc::HandlerFailed, "handler failure ends the run");
  expect(st.message == "refused r2", "handler message propagated verbatim");
  expect(calls == 2 && d.records() == 1, "no record delivered after the failing one");

  sc::MemoryByteSource src2("a\nb\nc");
  sc::ChunkDriver d2;
  auto st2 = d2.run(src2, [&](std::string_view rec, std::string*){ return rec != "b"; });
  expect(st2.code == sc::ChunkErrc::HandlerFailed && st2.message == "record 2 rejected",
         "silent handler failure names the record (" + st2.message + ")");
}

static void test_read_failure() {
  sc::MemoryByteSource src("aaa\nbbb\nccc");
  src.fail_after(6, "disk on fire", EIO);
  auto r = collect(src, 4);
  expect(r.st.code == sc::ChunkErrc::ReadFailed, "read error aborts the run");
  expect(r.st.message == "disk on fire" && r.st.sys_errno == EIO, "read error propagated verbatim");
  expect(r.recs == Records{"aaa"}, "records before the failure were delivered -> " + show(r.recs));
  expect(r.st.describe() == "read failed: disk on fire", "describe() names code and message");
}

static void test_invalid_config() {
  sc::MemoryByteSource src("never\nread");
  bool called = false;
  sc::ChunkDriver::Config cfg;
  cfg.chunk_bytes = 0;
  sc::ChunkDriver d(cfg);
  auto st = d.run(src, [&](std::string_view, std::string*){ called = true; return true; });
  expect(st.code == sc::ChunkErrc::InvalidConfig, "zero chunk size rejected");
  expect(src.reads() == 0 && !called, "rejected before any read or handler call");

  sc::MemoryByteSource src2("x");
  auto st2 = sc::process_in_chunks(src2, 0, [](std::string_view, std::string*){ return true; },
                                   sc::byte_delimiter());
  expect(st2.code == sc::ChunkErrc::InvalidConfig && src2.reads() == 0, "process_in_chunks rejects zero chunk size");

  sc::MemoryByteSource src3("x");
  sc::ChunkDriver d3;
  auto st3 = d3.run(src3, sc::RecordHandler{});
  expect(st3.code == sc::ChunkErrc::InvalidConfig, "missing handler rejected");
}

static void test_custom_delimiters() {
  sc::MemoryByteSource psrc("a|bb|ccc");
  auto r = collect(psrc, 2, '|');
  expect(r.st.ok() && r.recs == Records{"a", "bb", "ccc"}, "configured delimiter byte -> " + show(r.recs));

  std::string nul("k1\0k2\0", 6);
  sc::MemoryByteSource nsrc(nul);
  r = collect(nsrc, 3, '\0');
  expect(r.st.ok() && r.recs == Records{"k1", "k2", ""}, "NUL delimited stream");

  // Boundary policy on ';' while newlines are stripped from each record.
  sc::MemoryByteSource src("a\nb;c");
  Records got;
  auto st = sc::process_in_chunks(src, 2, [&](std::string_view rec, std::string*){
    got.emplace_back(rec);
    return true;
  }, sc::byte_delimiter(';'), '\n');
  expect(st.ok() && got == Records{"ab", "c"}, "stray delimiter bytes stripped before delivery -> " + show(got));
}

static void test_many_records_in_one_block() {
  std::string in;
  for (int i = 0; i < 100000; ++i) in += "ab\n";

  sc::MemoryByteSource src(in);
  sc::ChunkDriver::Config cfg;
  cfg.chunk_bytes = in.size();
  sc::ChunkDriver d(cfg);
  std::size_t calls = 0, bad = 0;
  auto lines = sc::byte_delimiter();
  const auto t0 = std::chrono::steady_clock::now();
  auto st = d.run(src, [&](std::string_view rec, std::string*){
    if (rec != "ab" && !rec.empty()) ++bad;
    return true;
  }, [&](std::string_view buf){ ++calls; return lines(buf); });
  const double sec = std::chrono::duration<double>(std::chrono::steady_clock::now() - t0).count();

  expect(st.ok() && d.records() == 100001 && bad == 0, "100000 short records from a single read");
  // one evaluation per record plus the two reads
  expect(calls <= d.records() + 2, "one delimiter evaluation per record (calls=" + std::to_string(calls) + ")");
  expect(d.peak_buffer_bytes() <= cfg.chunk_bytes, "block is never copied into a second buffer");
  expect(sec < 5.0, "single-block run stays linear (" + std::to_string(sec) + "s)");
}

// Splits on "\r\n" and returns only the contract triple.
static sc::DelimitResult crlf(std::string_view buf) {
  sc::DelimitResult r;
  const std::size_t pos = buf.find("\r\n");
  if (pos == std::string_view::npos) { r.record = buf; return r; }
  r.ready = true;
  r.record = buf.substr(0, pos);
  r.remainder.assign(buf.substr(pos + 2));
  return r;
}

static void test_policy_without_consumed() {
  const std::string in = "GET /a\r\nHost: x\r\n\r\nbody\nwith newline";
  for (std::size_t chunk : {1, 3, 7, 64}) {
    sc::MemoryByteSource src(in);
    Records got;
    auto st = sc::process_in_chunks(src, chunk, [&](std::string_view rec, std::string*){
      got.emplace_back(rec);
      return true;
    }, crlf, '\r');
    if (!st.ok() || got != Records{"GET /a", "Host: x", "", "body\nwith newline"}) {
      expect(false, "remainder-only policy at chunk " + std::to_string(chunk) + " -> " + show(got));
      return;
    }
  }
  expect(true, "policy filling only remainder drives the run");
}

int main(){
  test_examples();
  test_chunk_boundary_independence();
  test_round_trip();
  test_bounded_memory();
  test_handler_failure();
  test_read_failure();
  test_invalid_config();
  test_custom_delimiters();
  test_many_records_in_one_block();
  test_policy_without_consumed();

  if (failures) { std::cerr << "[FAIL] chunk_driver: " << failures << " check(s) failed\n"; return 1; }
  std::cout << "[PASS] chunk_driver\n";
  return 0;
}
