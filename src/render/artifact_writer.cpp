#include "stream_chunker/artifact_writer.hpp"
#include "stream_chunker/path_utils.hpp"
#include <filesystem>
#include <fstream>

namespace sc {

bool write_report_dir(const std::string& report_root,
                      const std::string& slug,
                      const std::string& run_json_str,
                      std::string* err_out) {
  const std::filesystem::path out = std::filesystem::path(report_root) / slug / "run.json";
  if (!ensure_parent_dirs(out)) {
    if (err_out) *err_out = "failed to create " + out.parent_path().string();
    return false;
  }

  std::ofstream rj(out, std::ios::binary | std::ios::trunc);
  if (!rj) {
    if (err_out) *err_out = "failed to open " + out.string();
    return false;
  }
  rj.write(run_json_str.data(),
           static_cast<std::streamsize>(run_json_str.size()));
  rj.flush();
  if (!rj) {
    if (err_out) *err_out = "failed to write " + out.string();
    return false;
  }
  return true;
}

}
