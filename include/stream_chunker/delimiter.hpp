#pragma once
#include <cstddef>
#include <functional>
#include <string>
#include <string_view>

namespace sc {

constexpr char kDefaultDelimiter = '\n';

// Outcome of one delimiter evaluation over the accumulated bytes.
struct DelimitResult {
  bool             ready = false; // a record boundary was found
  std::string_view record;        // view into the input: bytes before the first boundary, or all of it when !ready
  std::string      remainder;     // bytes after the first boundary, carried forward
  // Input bytes covered by the record, its boundary and the empty segments
  // dropped right after it. The rest of the input from here yields the same
  // records as `remainder`. A policy that leaves it at 0 is continued from
  // `remainder` instead.
  std::size_t      consumed = 0;
};

// Record boundary policy. Must be pure: the same input always yields the
// same result. `record` may point into the argument.
using DelimiterFn = std::function<DelimitResult(std::string_view)>;

// Splits at the first `delim`. The remainder re-joins the following
// segments with `delim`, dropping empty segments and never ending in a
// delimiter that only closed an empty segment.
DelimitResult delimit_by_byte(std::string_view buf, char delim);

// Strategy form of delimit_by_byte for the driver: fills ready, record and
// consumed, and leaves remainder empty.
DelimiterFn byte_delimiter(char delim = kDefaultDelimiter);

// Removes every occurrence of `delim` from `record` in place.
void strip_delimiter(std::string& record, char delim);

}
