#include "stream_chunker/byte_source.hpp"
#include <cerrno>
#include <cstring>

namespace sc {

FileByteSource::FileByteSource(std::string path)
  : path_(std::move(path)) {
  f_ = std::fopen(path_.c_str(), "rb");
  if (!f_) {
    const int e = errno;
    fail("cannot open " + path_ + ": " + std::strerror(e), e);
  }
}

FileByteSource::~FileByteSource() {
  if (f_) std::fclose(f_);
}

ReadStatus FileByteSource::read(char* dst, std::size_t max, std::size_t& n) {
  n = 0;
  if (!f_) return ReadStatus::Error; // open failure already recorded
  if (max == 0) return ReadStatus::Ok;

  n = std::fread(dst, 1, max, f_);
  bytes_ += n;
  if (n < max) {
    if (std::ferror(f_)) {
      const int e = errno;
      return fail("read failed on " + path_ + ": " + std::strerror(e), e);
    }
    if (std::feof(f_)) return ReadStatus::Eof;
  }
  return ReadStatus::Ok;
}

}
