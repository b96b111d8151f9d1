#pragma once
#include <cstddef>
#include <string>
#include <string_view>

namespace sc {

struct JsonCheckConfig {
  bool strict = true; // object-only in strict mode
};

// Validates one record as a complete JSON document (JSON lines input).
class JsonRecordCheck {
public:
  explicit JsonRecordCheck(const JsonCheckConfig& cfg);
  ~JsonRecordCheck();

  JsonRecordCheck(const JsonRecordCheck&) = delete;
  JsonRecordCheck& operator=(const JsonRecordCheck&) = delete;

  bool check(std::string_view record);

  // Members seen across all nesting levels in the last valid record.
  std::size_t last_member_count() const noexcept { return members_; }
  const std::string& error() const { return err_; }

private:
  struct Impl; Impl* p_;
  std::size_t members_{0};
  std::string err_;
};

}
