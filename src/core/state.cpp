// core/state.cpp - Last-run marker implementation
#include "state.hpp"
#include "../utils.hpp"
#include <fstream>

namespace ntfsmh {

LastRunMarker LastRunMarker::now() {
  // Same layout as date(1)
  return LastRunMarker{format_local_time("%a %b %e %H:%M:%S %Z %Y")};
}

bool LastRunMarker::save(const fs::path &path) const {
  if (path.has_parent_path() && !ensure_dir_exists(path.parent_path())) {
    return false;
  }

  std::ofstream file(path, std::ios::trunc);
  if (!file.is_open()) {
    return false;
  }

  file << timestamp << "\n";
  file.flush();
  return static_cast<bool>(file);
}

LastRunMarker load_lastrun_marker(const fs::path &path) {
  LastRunMarker marker;

  std::ifstream file(path);
  if (!file.is_open()) {
    return marker;
  }

  std::string line;
  if (std::getline(file, line)) {
    marker.timestamp = trim(line);
  }
  return marker;
}

} // namespace ntfsmh
