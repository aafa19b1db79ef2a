// core/state.hpp - Last-run marker
#pragma once

#include <filesystem>
#include <string>

namespace fs = std::filesystem;

namespace ntfsmh {

struct LastRunMarker {
  std::string timestamp;

  static LastRunMarker now();
  bool save(const fs::path &path) const;
};

// Empty timestamp when the marker does not exist or cannot be read.
LastRunMarker load_lastrun_marker(const fs::path &path);

} // namespace ntfsmh
