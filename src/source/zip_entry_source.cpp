#include "stream_chunker/zip_entry_source.hpp"

#include <zlib.h>

#include <algorithm>
#include <cstring>
#include <limits>
#include <vector>

namespace sc {

namespace {

constexpr std::uint32_t kLocalHeaderSig    = 0x04034b50u;
constexpr std::uint32_t kCentralDirSig     = 0x02014b50u;
constexpr std::uint32_t kEndOfCentralSig   = 0x06054b50u;
constexpr std::uint32_t kDataDescriptorSig = 0x08074b50u;
constexpr std::uint16_t kZip64ExtraId      = 0x0001u;
constexpr std::uint32_t kZip64Marker       = 0xFFFFFFFFu;
constexpr std::size_t   kLocalHeaderBytes  = 30;
constexpr std::size_t   kWindowBytes       = 64 * 1024; // fits any name/extra field

std::uint16_t le16(const unsigned char* p) {
  return static_cast<std::uint16_t>(p[0] | (p[1] << 8));
}

std::uint32_t le32(const unsigned char* p) {
  return  static_cast<std::uint32_t>(p[0])        | (static_cast<std::uint32_t>(p[1]) << 8) |
         (static_cast<std::uint32_t>(p[2]) << 16) | (static_cast<std::uint32_t>(p[3]) << 24);
}

std::uint64_t le64(const unsigned char* p) {
  return static_cast<std::uint64_t>(le32(p)) | (static_cast<std::uint64_t>(le32(p + 4)) << 32);
}

// Applies a zip64 extended-information field to sizes saturated at 0xFFFFFFFF.
bool apply_zip64_extra(const unsigned char* x, std::size_t n, ZipEntry& e) {
  std::size_t i = 0;
  while (i + 4 <= n) {
    const std::uint16_t id = le16(x + i);
    const std::uint16_t sz = le16(x + i + 2);
    if (i + 4 + sz > n) break;
    if (id == kZip64ExtraId) {
      const unsigned char* d = x + i + 4;
      std::size_t off = 0;
      if (e.uncompressed_size == kZip64Marker && off + 8 <= sz) { e.uncompressed_size = le64(d + off); off += 8; }
      if (e.compressed_size == kZip64Marker && off + 8 <= sz)   { e.compressed_size = le64(d + off); }
      return true;
    }
    i += 4 + sz;
  }
  return false;
}

}

struct ZipEntrySource::Impl {
  enum class State { Idle, Stored, Deflate, Done, End, Failed };

  ByteSource& in;
  std::vector<unsigned char> buf; // archive bytes not yet consumed: [pos, len)
  std::size_t pos{0};
  std::size_t len{0};
  bool in_eof{false};

  z_stream zs{};
  bool z_ready{false};

  State state{State::Idle};
  ZipEntry entry;
  bool zip64{false};
  std::uint64_t stored_left{0};
  std::uint64_t produced{0};
  uLong crc{0};

  std::string err;
  int err_no{0};

  explicit Impl(ByteSource& src) : in(src), buf(kWindowBytes) {}
  ~Impl() { if (z_ready) inflateEnd(&zs); }

  bool set_error(std::string msg, int e = 0) {
    err = std::move(msg);
    err_no = e;
    state = State::Failed;
    return false;
  }

  std::size_t avail() const { return len - pos; }
  const unsigned char* cur() const { return buf.data() + pos; }

  bool fill() {
    if (in_eof) return true;
    if (pos > 0) {
      std::memmove(buf.data(), buf.data() + pos, len - pos);
      len -= pos;
      pos = 0;
    }
    if (len == buf.size()) return true;
    std::size_t n = 0;
    const ReadStatus st = in.read(reinterpret_cast<char*>(buf.data() + len), buf.size() - len, n);
    if (st == ReadStatus::Error)
      return set_error(in.error().empty() ? "archive read error" : in.error(), in.last_error());
    len += n;
    if (st == ReadStatus::Eof) in_eof = true;
    return true;
  }

  bool need(std::size_t k) {
    while (avail() < k) {
      if (in_eof) return set_error("truncated zip archive");
      if (!fill()) return false;
    }
    return true;
  }

  void account(const char* p, std::size_t k) {
    crc = ::crc32(crc, reinterpret_cast<const Bytef*>(p), static_cast<uInt>(k));
    produced += k;
  }

  // Reads the data descriptor if one follows, then checks CRC and size.
  bool finish() {
    if (entry.has_data_descriptor()) {
      if (!need(4)) return false;
      if (le32(cur()) == kDataDescriptorSig) pos += 4;
      const std::size_t body = zip64 ? 20 : 12;
      if (!need(body)) return false;
      const unsigned char* d = cur();
      entry.crc32 = le32(d);
      entry.compressed_size   = zip64 ? le64(d + 4)  : le32(d + 4);
      entry.uncompressed_size = zip64 ? le64(d + 12) : le32(d + 8);
      pos += body;
    }
    if (crc != entry.crc32) return set_error("crc mismatch in zip entry " + entry.name);
    if (produced != entry.uncompressed_size) return set_error("size mismatch in zip entry " + entry.name);
    state = State::Done;
    return true;
  }

  ReadStatus read_stored(char* dst, std::size_t max, std::size_t& n) {
    if (stored_left == 0) return finish() ? ReadStatus::Eof : ReadStatus::Error;
    if (max == 0) return ReadStatus::Ok;
    while (avail() == 0) {
      if (in_eof) { set_error("truncated zip entry " + entry.name); return ReadStatus::Error; }
      if (!fill()) return ReadStatus::Error;
    }
    const std::size_t k = static_cast<std::size_t>(
        std::min<std::uint64_t>(std::min(max, avail()), stored_left));
    std::memcpy(dst, cur(), k);
    pos += k;
    stored_left -= k;
    account(dst, k);
    n = k;
    return ReadStatus::Ok;
  }

  ReadStatus read_deflate(char* dst, std::size_t max, std::size_t& n) {
    if (max == 0) return ReadStatus::Ok;
    const std::size_t cap = std::min<std::size_t>(max, std::numeric_limits<uInt>::max());
    while (true) {
      if (avail() == 0 && !in_eof && !fill()) return ReadStatus::Error;

      const std::size_t in_before = avail();
      zs.next_in   = buf.data() + pos;
      zs.avail_in  = static_cast<uInt>(in_before);
      zs.next_out  = reinterpret_cast<Bytef*>(dst + n);
      zs.avail_out = static_cast<uInt>(cap - n);
      const int rc = inflate(&zs, Z_NO_FLUSH);

      pos += in_before - zs.avail_in;
      const std::size_t got = (cap - n) - zs.avail_out;
      account(dst + n, got);
      n += got;

      if (rc == Z_STREAM_END) {
        if (!finish()) return ReadStatus::Error;
        return n > 0 ? ReadStatus::Ok : ReadStatus::Eof;
      }
      if (rc == Z_OK || rc == Z_BUF_ERROR) {
        if (n > 0) return ReadStatus::Ok;
        if (avail() == 0 && in_eof) {
          set_error("truncated deflate stream in zip entry " + entry.name);
          return ReadStatus::Error;
        }
        continue;
      }
      set_error("inflate failed in zip entry " + entry.name + ": " +
                (zs.msg ? std::string(zs.msg) : "zlib error " + std::to_string(rc)));
      return ReadStatus::Error;
    }
  }

  ReadStatus read_entry(char* dst, std::size_t max, std::size_t& n) {
    n = 0;
    switch (state) {
      case State::Stored:  return read_stored(dst, max, n);
      case State::Deflate: return read_deflate(dst, max, n);
      case State::Done:
      case State::End:     return ReadStatus::Eof;
      case State::Idle:    err = "no zip entry open"; err_no = 0; return ReadStatus::Error;
      case State::Failed:  return ReadStatus::Error;
    }
    return ReadStatus::Error;
  }

  bool drain() {
    std::vector<char> sink(16 * 1024);
    while (true) {
      std::size_t n = 0;
      const ReadStatus st = read_entry(sink.data(), sink.size(), n);
      if (st == ReadStatus::Error) return false;
      if (st == ReadStatus::Eof) return true;
    }
  }

  // False with state End when no local header follows.
  bool open_next() {
    if (state == State::Failed || state == State::End) return false;
    if ((state == State::Stored || state == State::Deflate) && !drain()) return false;

    while (avail() < 4 && !in_eof) {
      if (!fill()) return false;
    }
    if (avail() == 0) { state = State::End; return false; }
    if (avail() < 4) return set_error("truncated zip archive");

    const std::uint32_t sig = le32(cur());
    if (sig == kCentralDirSig || sig == kEndOfCentralSig) { state = State::End; return false; }
    if (sig != kLocalHeaderSig) return set_error("bad zip local header signature");

    if (!need(kLocalHeaderBytes)) return false;
    const unsigned char* h = cur();
    ZipEntry e;
    e.flags             = le16(h + 6);
    e.method            = le16(h + 8);
    e.crc32             = le32(h + 14);
    e.compressed_size   = le32(h + 18);
    e.uncompressed_size = le32(h + 22);
    const std::size_t name_len  = le16(h + 26);
    const std::size_t extra_len = le16(h + 28);
    pos += kLocalHeaderBytes;

    if (!need(name_len)) return false;
    e.name.assign(reinterpret_cast<const char*>(cur()), name_len);
    pos += name_len;

    if (!need(extra_len)) return false;
    zip64 = apply_zip64_extra(cur(), extra_len, e);
    pos += extra_len;

    if (e.flags & 0x0001u) return set_error("encrypted zip entry not supported: " + e.name);

    if (e.method == 0) {
      if (e.has_data_descriptor())
        return set_error("stored zip entry with data descriptor not supported: " + e.name);
      stored_left = e.compressed_size;
      state = State::Stored;
    } else if (e.method == 8) {
      const int rc = z_ready ? inflateReset(&zs) : inflateInit2(&zs, -MAX_WBITS);
      if (rc != Z_OK) return set_error("inflate init failed for zip entry " + e.name);
      z_ready = true;
      state = State::Deflate;
    } else {
      return set_error("unsupported compression method " + std::to_string(e.method) +
                       " in zip entry " + e.name);
    }

    entry = std::move(e);
    crc = ::crc32(0L, Z_NULL, 0);
    produced = 0;
    return true;
  }
};

ZipEntrySource::ZipEntrySource(ByteSource& archive)
  : p_(new Impl(archive)) {}

ZipEntrySource::~ZipEntrySource() { delete p_; }

const ZipEntry& ZipEntrySource::entry() const noexcept { return p_->entry; }

bool ZipEntrySource::next() {
  if (p_->open_next()) {
    err_.clear();
    errno_ = 0;
    return true;
  }
  if (p_->state == Impl::State::End) {
    err_.clear();
    errno_ = 0;
    return false;
  }
  (void)fail(p_->err, p_->err_no);
  return false;
}

bool ZipEntrySource::open_entry(std::string_view name) {
  while (next()) {
    if (p_->entry.name == name) return true;
  }
  if (error().empty()) (void)fail("zip entry not found: " + std::string(name));
  return false;
}

ReadStatus ZipEntrySource::read(char* dst, std::size_t max, std::size_t& n) {
  const ReadStatus st = p_->read_entry(dst, max, n);
  if (st == ReadStatus::Error) return fail(p_->err, p_->err_no);
  return st;
}

}
