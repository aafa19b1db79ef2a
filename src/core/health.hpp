// core/health.hpp - Kernel log health probe
#pragma once

#include "runner.hpp"
#include <string>
#include <vector>

namespace ntfsmh {

struct HealthReport {
  bool log_available = false;
  std::vector<std::string> matches;

  bool errors_found() const { return !matches.empty(); }
};

// Returns the lines among the last tail_lines of log_text that mention
// ntfs, the device base name and an error indicator. Case-insensitive.
std::vector<std::string> scan_kernel_log(const std::string &log_text,
                                         const std::string &device,
                                         int tail_lines);

HealthReport check_kernel_log(CommandRunner &runner, const std::string &device,
                              int tail_lines);

} // namespace ntfsmh
