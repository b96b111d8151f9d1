#pragma once
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>

#include "stream_chunker/byte_source.hpp"
#include "stream_chunker/delimiter.hpp"

namespace sc {

enum class ChunkErrc { None = 0, InvalidConfig, ReadFailed, HandlerFailed };

const char* chunk_errc_string(ChunkErrc c) noexcept;

// Terminal result of one run. A failed run reports exactly one error.
struct ChunkStatus {
  ChunkErrc   code = ChunkErrc::None;
  int         sys_errno = 0; // from the source, ReadFailed only
  std::string message;       // verbatim from the source or handler

  bool ok() const noexcept { return code == ChunkErrc::None; }
  std::string describe() const;
};

// Receives one record without its delimiter. Return false to abort the
// run; `err` (never null) may carry the reason back to the caller.
using RecordHandler = std::function<bool(std::string_view record, std::string* err)>;

// Pulls fixed-size reads from a ByteSource and hands each delimited record
// to a handler, in stream order, before reading further. Memory stays
// bounded by chunk_bytes plus the longest record.
class ChunkDriver {
public:
  struct Config {
    std::size_t chunk_bytes = 128;           // fixed read width, must be > 0
    char        delimiter   = kDefaultDelimiter;
  };

  ChunkDriver();               // uses default Config{}
  explicit ChunkDriver(Config cfg);

  // Byte delimiter from the config.
  ChunkStatus run(ByteSource& src, const RecordHandler& handler);
  // Custom boundary policy; cfg.delimiter is still stripped from records.
  ChunkStatus run(ByteSource& src, const RecordHandler& handler, const DelimiterFn& delimit);

  const Config& config() const noexcept { return cfg_; }

  // Counters of the most recent run.
  std::uint64_t records() const noexcept { return records_; }
  std::uint64_t bytes_read() const noexcept { return bytes_; }
  std::size_t   peak_buffer_bytes() const noexcept { return peak_; }

private:
  Config cfg_;
  std::uint64_t records_{0};
  std::uint64_t bytes_{0};
  std::size_t   peak_{0};
};

// One-shot form of ChunkDriver::run.
ChunkStatus process_in_chunks(ByteSource& src,
                              std::size_t chunk_bytes,
                              const RecordHandler& handler,
                              const DelimiterFn& delimit,
                              char strip = kDefaultDelimiter);

}
