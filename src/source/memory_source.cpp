#include "stream_chunker/byte_source.hpp"
#include <algorithm>
#include <cstring>

namespace sc {

MemoryByteSource::MemoryByteSource(std::string data, std::size_t max_read)
  : data_(std::move(data)), max_read_(max_read) {}

void MemoryByteSource::fail_after(std::size_t offset, std::string msg, int sys_errno) {
  fail_armed_ = true;
  fail_at_ = offset;
  fail_msg_ = std::move(msg);
  fail_errno_ = sys_errno;
}

ReadStatus MemoryByteSource::read(char* dst, std::size_t max, std::size_t& n) {
  n = 0;
  ++reads_;
  if (fail_armed_ && off_ >= fail_at_) return fail(fail_msg_, fail_errno_);

  const std::size_t left = data_.size() - off_;
  if (left == 0) return ReadStatus::Eof;

  std::size_t take = std::min(max, left);
  if (max_read_ > 0) take = std::min(take, max_read_);
  if (fail_armed_) take = std::min(take, fail_at_ - off_);

  std::memcpy(dst, data_.data() + off_, take);
  off_ += take;
  n = take;

  if (eof_with_data_ && off_ == data_.size()) return ReadStatus::Eof;
  return ReadStatus::Ok;
}

}
