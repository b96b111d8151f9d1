#pragma once
#include <cstddef>
#include <cstdint>
#include <string>

namespace sc {

struct RunJsonPayload {
  // Top-level KPIs
  std::uint64_t records = 0;
  std::uint64_t bytes = 0;
  double wall_time_ms = 0.0;
  double throughput_mb_s = 0.0;
  double records_per_sec = 0.0;

  // Driver settings and footprint
  std::size_t chunk_bytes = 0;
  std::size_t peak_buffer_bytes = 0;

  // Input metadata
  std::string filename;
  std::string content_type;
  std::string entry;          // archive entry name, empty for plain files
  std::uint64_t file_size = 0;

  // Outcome
  bool ok = true;
  std::string error;
};

class RunJsonWriter {
public:
  // Serialize payload to a compact JSON object.
  static std::string to_json(const RunJsonPayload& p);
};

}
