#pragma once
#include <cerrno>
#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <string>
#include <utility>

namespace sc {

enum class ReadStatus { Ok, Eof, Error };

// Sequential, read-once byte stream. Bytes returned together with Eof
// belong to the stream; Ok with n == 0 means no progress this call.
class ByteSource {
public:
  virtual ~ByteSource() = default;

  virtual ReadStatus read(char* dst, std::size_t max, std::size_t& n) = 0;

  const std::string& error() const noexcept { return err_; }
  int last_error() const noexcept { return errno_; }

protected:
  ReadStatus fail(std::string msg, int sys_errno = 0) {
    err_ = std::move(msg);
    errno_ = sys_errno;
    return ReadStatus::Error;
  }

  std::string err_;
  int errno_{0};
};

// Plain file opened with fopen("rb"). The caller owns the object; the
// chunk driver never closes or seeks it.
class FileByteSource : public ByteSource {
public:
  explicit FileByteSource(std::string path);
  ~FileByteSource() override;

  FileByteSource(const FileByteSource&) = delete;
  FileByteSource& operator=(const FileByteSource&) = delete;

  bool is_open() const noexcept { return f_ != nullptr; }
  const std::string& path() const noexcept { return path_; }
  std::uint64_t bytes_read() const noexcept { return bytes_; }

  ReadStatus read(char* dst, std::size_t max, std::size_t& n) override;

private:
  std::string path_;
  std::FILE* f_{nullptr};
  std::uint64_t bytes_{0};
};

// In-memory stream. max_read caps every read (0 = no cap) to emulate short
// reads; fail_after() arms a read error once the given offset is reached.
class MemoryByteSource : public ByteSource {
public:
  explicit MemoryByteSource(std::string data, std::size_t max_read = 0);

  void fail_after(std::size_t offset, std::string msg, int sys_errno = EIO);
  void set_eof_with_last_read(bool on) noexcept { eof_with_data_ = on; }

  ReadStatus read(char* dst, std::size_t max, std::size_t& n) override;

  std::size_t offset() const noexcept { return off_; }
  std::size_t size() const noexcept { return data_.size(); }
  std::uint64_t reads() const noexcept { return reads_; }

private:
  std::string data_;
  std::size_t off_{0};
  std::size_t max_read_{0};
  bool fail_armed_{false};
  std::size_t fail_at_{0};
  std::string fail_msg_;
  int fail_errno_{0};
  bool eof_with_data_{false};
  std::uint64_t reads_{0};
};

}
