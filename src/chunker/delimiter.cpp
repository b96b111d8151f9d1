#include "stream_chunker/delimiter.hpp"
#include <algorithm>

namespace sc {

// Finds the first boundary only; the scan stops after the delimiter run
// that follows it.
static DelimitResult cut_at(std::string_view buf, char delim) {
  DelimitResult r;
  const std::size_t first = buf.find(delim);
  if (first == std::string_view::npos) {
    r.record = buf;
    return r;
  }
  r.ready = true;
  r.record = buf.substr(0, first);
  std::size_t next = first + 1;
  while (next < buf.size() && buf[next] == delim) ++next;
  r.consumed = next;
  return r;
}

DelimitResult delimit_by_byte(std::string_view buf, char delim) {
  DelimitResult r = cut_at(buf, delim);
  if (!r.ready) return r;

  r.remainder.reserve(buf.size() - r.consumed);
  std::size_t start = r.consumed;
  while (start < buf.size()) {
    const std::size_t pos = buf.find(delim, start);
    const bool last = (pos == std::string_view::npos);
    std::string_view seg = last ? buf.substr(start) : buf.substr(start, pos - start);
    if (!seg.empty()) {
      r.remainder.append(seg.data(), seg.size());
      if (!last) r.remainder.push_back(delim);
    }
    if (last) break;
    start = pos + 1;
  }
  return r;
}

DelimiterFn byte_delimiter(char delim) {
  return [delim](std::string_view buf) { return cut_at(buf, delim); };
}

void strip_delimiter(std::string& record, char delim) {
  record.erase(std::remove(record.begin(), record.end(), delim), record.end());
}

}
