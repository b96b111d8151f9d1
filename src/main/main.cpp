#include "stream_chunker/artifact_writer.hpp"
#include "stream_chunker/byte_source.hpp"
#include "stream_chunker/chunk_driver.hpp"
#include "stream_chunker/json_record_check.hpp"
#include "stream_chunker/path_utils.hpp"
#include "stream_chunker/run_json.hpp"
#include "stream_chunker/zip_entry_source.hpp"

#include <algorithm>
#include <charconv>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace {

struct Cli {
  std::size_t chunk_bytes = 128;
  char delimiter = '\n';
  bool force_zip = false;
  std::string entry;                 // archive entry to open; first one if empty
  bool jsonl = false;
  bool lenient = false;
  std::string report_dir;            // no report when empty
  std::string slug_mode = "basename"; // hashprefix|basename|keypath
  int slug_len = 64;
  bool samples = false;
  bool quiet = false;
  std::vector<std::string> inputs;
};

void print_usage(std::ostream& os) {
  os <<
    "Usage: stream-chunker [--chunk-bytes=N] [--delimiter=C] [--zip] [--entry=NAME]\n"
    "                      [--jsonl] [--lenient] [--quiet] [--samples]\n"
    "                      [--report-dir=DIR] [--slug-mode=hashprefix|basename|keypath]\n"
    "                      [--slug-len=N] [FILE...]\n";
}

bool parse_positive(std::string_view v, long long* out) {
  long long x = 0;
  auto [ptr, ec] = std::from_chars(v.data(), v.data() + v.size(), x);
  if (ec != std::errc() || ptr != v.data() + v.size() || x <= 0) return false;
  *out = x;
  return true;
}

// Accepts one literal byte or one of the escapes \n \r \t \0 \\.
bool parse_delimiter(std::string_view v, char* out) {
  if (v.size() == 1) { *out = v[0]; return true; }
  if (v.size() == 2 && v[0] == '\\') {
    switch (v[1]) {
      case 'n':  *out = '\n'; return true;
      case 'r':  *out = '\r'; return true;
      case 't':  *out = '\t'; return true;
      case '0':  *out = '\0'; return true;
      case '\\': *out = '\\'; return true;
      default: break;
    }
  }
  return false;
}

bool parse_cli(int argc, char** argv, Cli& c) {
  for (int i = 1; i < argc; ++i) {
    std::string a(argv[i]);
    auto eat = [&](const char* pfx, std::string* out){
      if (a.rfind(pfx, 0) == 0) { *out = a.substr(std::string(pfx).size()); return true; }
      return false;
    };
    std::string v;
    if (eat("--chunk-bytes=", &v)) {
      long long n = 0;
      if (!parse_positive(v, &n)) { std::cerr << "[chunk] chunk size must be a positive integer: " << v << "\n"; return false; }
      c.chunk_bytes = static_cast<std::size_t>(n);
      continue;
    }
    if (eat("--delimiter=", &v)) {
      if (!parse_delimiter(v, &c.delimiter)) { std::cerr << "[chunk] delimiter must be a single byte: " << v << "\n"; return false; }
      continue;
    }
    if (eat("--slug-len=", &v)) {
      long long n = 0;
      if (!parse_positive(v, &n)) { std::cerr << "[chunk] bad --slug-len: " << v << "\n"; return false; }
      c.slug_len = static_cast<int>(std::min<long long>(n, 255));
      continue;
    }
    if (eat("--entry=", &c.entry)) { c.force_zip = true; continue; }
    if (eat("--report-dir=", &c.report_dir)) continue;
    if (eat("--slug-mode=", &c.slug_mode)) continue;
    if (a == "--zip")     { c.force_zip = true; continue; }
    if (a == "--jsonl")   { c.jsonl = true; continue; }
    if (a == "--lenient") { c.lenient = true; continue; }
    if (a == "--samples") { c.samples = true; continue; }
    if (a == "--quiet")   { c.quiet = true; continue; }
    if (a == "-h" || a == "--help") {
      print_usage(std::cout);
      std::exit(0);
    }
    if (a.rfind("--", 0) == 0) { std::cerr << "[chunk] unknown flag: " << a << "\n"; return false; }
    c.inputs.push_back(a);
  }
  return true;
}

int process_input(const std::string& path, const Cli& cli) {
  namespace ch = std::chrono;
  const auto t0 = ch::steady_clock::now();

  const sc::InputFormat fmt = sc::detect_format(path);
  const bool zip = cli.force_zip || fmt == sc::InputFormat::Zip;
  std::cerr << "[chunk] Starting to process " << (zip ? "a compressed zip file: " : "a text file: ")
            << path << "\n";

  sc::FileByteSource file(path);
  if (!file.is_open()) {
    std::cerr << "[chunk] " << file.error() << "\n";
    return 1;
  }

  sc::ByteSource* src = &file;
  std::unique_ptr<sc::ZipEntrySource> archive;
  std::string entry_name;
  if (zip) {
    archive = std::make_unique<sc::ZipEntrySource>(file);
    const bool opened = cli.entry.empty() ? archive->next() : archive->open_entry(cli.entry);
    if (!opened) {
      std::cerr << "[zip] " << (archive->error().empty() ? "archive has no entries" : archive->error())
                << ": " << path << "\n";
      return 1;
    }
    entry_name = archive->entry().name;
    std::cerr << "[zip] entry: " << entry_name << "\n";
    src = archive.get();
  }

  // JSON validation applies to .jsonl inputs, or to any input with --jsonl.
  const bool check_json = cli.jsonl || fmt == sc::InputFormat::Jsonl;
  sc::JsonCheckConfig jcfg;
  jcfg.strict = !cli.lenient;
  sc::JsonRecordCheck check(jcfg);

  sc::ChunkDriver::Config dcfg;
  dcfg.chunk_bytes = cli.chunk_bytes;
  dcfg.delimiter = cli.delimiter;
  sc::ChunkDriver driver(dcfg);

  std::uint64_t seen = 0;
  auto on_record = [&](std::string_view rec, std::string* err) {
    ++seen;
    if (!cli.quiet)
      std::cout << "Text: " << rec << ", size: [" << rec.size() << "] characters\n";
    // blank lines carry no document
    if (check_json && !rec.empty() && !check.check(rec)) {
      *err = "invalid JSON at record " + std::to_string(seen) + ": " + check.error();
      return false;
    }
    return true;
  };

  const sc::ChunkStatus st = driver.run(*src, on_record);

  const auto t1 = ch::steady_clock::now();
  const double wall_ms = ch::duration<double, std::milli>(t1 - t0).count();

  if (st.ok()) {
    std::cerr << "[chunk] ok: " << path << " records=" << driver.records()
              << " bytes=" << driver.bytes_read() << "\n";
  } else {
    std::cerr << "[chunk] Exit due to [" << st.describe() << "]: " << path << "\n";
  }

  if (!cli.report_dir.empty()) {
    const double mb = driver.bytes_read() / (1024.0 * 1024.0);
    const double sec = wall_ms / 1000.0;

    sc::RunJsonPayload p{};
    p.records = driver.records();
    p.bytes = driver.bytes_read();
    p.wall_time_ms = wall_ms;
    p.throughput_mb_s = sec > 0.0 ? (mb / sec) : 0.0;
    p.records_per_sec = sec > 0.0 ? (driver.records() / sec) : 0.0;
    p.chunk_bytes = dcfg.chunk_bytes;
    p.peak_buffer_bytes = driver.peak_buffer_bytes();
    p.filename = path;
    p.content_type = sc::content_type_for(zip ? sc::InputFormat::Zip : fmt);
    p.entry = entry_name;
    std::error_code fec;
    const auto fsize = std::filesystem::file_size(path, fec);
    p.file_size = fec ? 0 : fsize;
    p.ok = st.ok();
    p.error = st.ok() ? std::string() : st.describe();

    const std::string key = (cli.slug_mode == "hashprefix")
        ? std::filesystem::weakly_canonical(std::filesystem::path(path)).string()
        : path;
    const std::string slug = sc::make_slug(key, cli.slug_mode, cli.slug_len);
    std::string err;
    if (!sc::write_report_dir(cli.report_dir, slug, sc::RunJsonWriter::to_json(p), &err)) {
      std::cerr << "[chunk] write_report_dir failed: " << err << "\n";
      return 1;
    }
    std::cerr << "[chunk] report: " << cli.report_dir << "/" << slug << "/run.json\n";
  }

  return st.ok() ? 0 : 1;
}

std::vector<std::string> sample_inputs() {
  std::vector<std::string> out;
  const std::filesystem::path samples = "data/samples";
  std::error_code ec;
  if (!std::filesystem::exists(samples, ec)) return out;
  for (auto& e : std::filesystem::directory_iterator(samples, ec)) {
    if (!e.is_regular_file(ec)) continue;
    const std::string path = e.path().string();
    if (sc::detect_format(path) == sc::InputFormat::Unknown) continue;
    out.push_back(path);
  }
  std::sort(out.begin(), out.end());
  return out;
}

}

int main(int argc, char** argv) {
  Cli cli;
  if (!parse_cli(argc, argv, cli)) {
    print_usage(std::cerr);
    return 2;
  }

  std::vector<std::string> inputs = cli.inputs;
  if (cli.samples) {
    auto s = sample_inputs();
    if (s.empty()) std::cerr << "[chunk] no samples under data/samples\n";
    inputs.insert(inputs.end(), s.begin(), s.end());
  }
  if (inputs.empty()) {
    print_usage(std::cerr);
    return 2;
  }

  int rc = 0;
  for (const auto& f : inputs) {
    if (process_input(f, cli) != 0) rc = 1;
  }
  return rc;
}
