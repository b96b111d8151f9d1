#include "stream_chunker/run_json.hpp"
#include <cmath> // std::isfinite
#include <cstdio>
#include <sstream>

namespace sc {

static void esc(std::ostringstream& o, const std::string& s){
  o << '"';
  for (char c : s){
    switch(c){
      case '\\': o << "\\\\"; break;
      case '"':  o << "\\\""; break;
      case '\n': o << "\\n";  break;
      case '\r': o << "\\r";  break;
      case '\t': o << "\\t";  break;
      default:
        if (static_cast<unsigned char>(c) < 0x20) {
          char u[8];
          std::snprintf(u, sizeof(u), "\\u%04x", static_cast<unsigned>(static_cast<unsigned char>(c)));
          o << u;
        } else {
          o << c;
        }
        break;
    }
  }
  o << '"';
}

static inline double safe_num(double v){ return std::isfinite(v) ? v : 0.0; }

std::string RunJsonWriter::to_json(const RunJsonPayload& p) {
  std::ostringstream o;
  o << "{";
  o << "\"records\":" << p.records << ",";
  o << "\"bytes\":" << p.bytes << ",";
  o << "\"wall_time_ms\":" << safe_num(p.wall_time_ms) << ",";
  o << "\"throughput_mb_s\":" << safe_num(p.throughput_mb_s) << ",";
  o << "\"records_per_sec\":" << safe_num(p.records_per_sec) << ",";
  o << "\"chunk_bytes\":" << p.chunk_bytes << ",";
  o << "\"peak_buffer_bytes\":" << p.peak_buffer_bytes << ",";

  o << "\"filename\":";     esc(o, p.filename);     o << ",";
  o << "\"content_type\":"; esc(o, p.content_type); o << ",";
  o << "\"entry\":";        esc(o, p.entry);        o << ",";
  o << "\"file_size\":" << p.file_size << ",";

  o << "\"ok\":" << (p.ok ? "true" : "false") << ",";
  o << "\"error\":"; esc(o, p.error);

  o << "}";
  return o.str();
}

}
