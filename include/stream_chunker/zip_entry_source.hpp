#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

#include "stream_chunker/byte_source.hpp"

namespace sc {

struct ZipEntry {
  std::string   name;
  std::uint16_t flags = 0;
  std::uint16_t method = 0;      // 0 stored, 8 deflate
  std::uint32_t crc32 = 0;
  std::uint64_t compressed_size = 0;
  std::uint64_t uncompressed_size = 0;

  bool has_data_descriptor() const noexcept { return (flags & 0x0008u) != 0; }
};

// Streams the entries of a zip archive from a forward-only ByteSource by
// walking local file headers; the central directory is never consulted.
// read() yields the uncompressed bytes of the current entry, then Eof.
class ZipEntrySource : public ByteSource {
public:
  explicit ZipEntrySource(ByteSource& archive);
  ~ZipEntrySource() override;

  ZipEntrySource(const ZipEntrySource&) = delete;
  ZipEntrySource& operator=(const ZipEntrySource&) = delete;

  // Skips the rest of the current entry and opens the next one. Returns
  // false at the end of the archive (error() empty) or on malformed input.
  bool next();
  // Calls next() until an entry named `name` is open.
  bool open_entry(std::string_view name);

  const ZipEntry& entry() const noexcept;

  ReadStatus read(char* dst, std::size_t max, std::size_t& n) override;

private:
  struct Impl; Impl* p_;
};

}
