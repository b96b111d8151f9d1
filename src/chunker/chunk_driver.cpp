#include "stream_chunker/chunk_driver.hpp"
#include <algorithm>
#include <utility>

namespace sc {

const char* chunk_errc_string(ChunkErrc c) noexcept {
  switch (c) {
    case ChunkErrc::None:          return "ok";
    case ChunkErrc::InvalidConfig: return "invalid configuration";
    case ChunkErrc::ReadFailed:    return "read failed";
    case ChunkErrc::HandlerFailed: return "handler failed";
  }
  return "unknown";
}

std::string ChunkStatus::describe() const {
  std::string out = chunk_errc_string(code);
  if (!message.empty()) { out += ": "; out += message; }
  return out;
}

static ChunkStatus failed(ChunkErrc code, std::string msg, int sys_errno = 0) {
  ChunkStatus st;
  st.code = code;
  st.sys_errno = sys_errno;
  st.message = std::move(msg);
  return st;
}

ChunkDriver::ChunkDriver()
  : ChunkDriver(Config{}) {}

ChunkDriver::ChunkDriver(Config cfg)
  : cfg_(cfg) {}

ChunkStatus ChunkDriver::run(ByteSource& src, const RecordHandler& handler) {
  return run(src, handler, byte_delimiter(cfg_.delimiter));
}

ChunkStatus ChunkDriver::run(ByteSource& src, const RecordHandler& handler,
                             const DelimiterFn& delimit) {
  records_ = 0;
  bytes_ = 0;
  peak_ = 0;

  // Checked before the first read so a zero width never spins on empty reads.
  if (cfg_.chunk_bytes == 0) return failed(ChunkErrc::InvalidConfig, "chunk size must be positive");
  if (!handler) return failed(ChunkErrc::InvalidConfig, "no record handler");
  if (!delimit) return failed(ChunkErrc::InvalidConfig, "no delimiter function");

  // Unconsumed bytes are buf[off, size). The consumed prefix is dropped
  // once per refill, so a block holding many records is scanned once.
  std::string buf;
  std::size_t off = 0;
  bool source_done = false;

  while (true) {
    DelimitResult cut;
    bool final_record = false;
    bool use_tail = off < buf.size(); // leftover bytes are evaluated before any read

    // Grow the accumulation until a boundary shows up or the source ends.
    while (true) {
      if (use_tail) {
        use_tail = false;
      } else if (!source_done) {
        buf.erase(0, off);
        off = 0;
        const std::size_t at = buf.size();
        buf.resize(at + cfg_.chunk_bytes);
        std::size_t n = 0;
        const ReadStatus st = src.read(&buf[at], cfg_.chunk_bytes, n);
        buf.resize(at + n);
        if (st == ReadStatus::Error) {
          return failed(ChunkErrc::ReadFailed,
                        src.error().empty() ? "byte source read error" : src.error(),
                        src.last_error());
        }
        bytes_ += n;
        if (st == ReadStatus::Eof) source_done = true;
      }
      peak_ = std::max(peak_, buf.size());

      cut = delimit(std::string_view(buf).substr(off));
      if (cut.ready) break;
      if (source_done) { final_record = true; break; }
    }

    std::string record;
    if (final_record) {
      record.assign(buf, off, std::string::npos);
      off = buf.size();
    } else {
      record.assign(cut.record.data(), cut.record.size());
      if (cut.consumed > 0) {
        off += std::min(cut.consumed, buf.size() - off);
      } else {
        buf = std::move(cut.remainder);
        off = 0;
      }
    }
    strip_delimiter(record, cfg_.delimiter);

    std::string err;
    if (!handler(record, &err)) {
      if (err.empty()) err = "record " + std::to_string(records_ + 1) + " rejected";
      return failed(ChunkErrc::HandlerFailed, std::move(err));
    }
    ++records_;

    if (final_record) break;
  }
  return {};
}

ChunkStatus process_in_chunks(ByteSource& src,
                              std::size_t chunk_bytes,
                              const RecordHandler& handler,
                              const DelimiterFn& delimit,
                              char strip) {
  ChunkDriver::Config cfg;
  cfg.chunk_bytes = chunk_bytes;
  cfg.delimiter = strip;
  ChunkDriver d(cfg);
  return d.run(src, handler, delimit);
}

}
