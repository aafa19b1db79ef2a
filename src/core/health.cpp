// core/health.cpp - Kernel log health probe implementation
#include "health.hpp"
#include "../defs.hpp"
#include "../utils.hpp"
#include "device.hpp"

namespace ntfsmh {

static bool has_error_marker(const std::string &line) {
  for (const auto &marker : KERNEL_ERROR_MARKERS) {
    if (contains_icase(line, marker))
      return true;
  }
  return false;
}

std::vector<std::string> scan_kernel_log(const std::string &log_text,
                                         const std::string &device,
                                         int tail_lines) {
  std::vector<std::string> matches;
  std::string name = device_base_name(device);
  if (name.empty() || tail_lines <= 0)
    return matches;

  std::vector<std::string> lines = split_lines(log_text);
  size_t first = 0;
  if (lines.size() > static_cast<size_t>(tail_lines)) {
    first = lines.size() - static_cast<size_t>(tail_lines);
  }

  for (size_t i = first; i < lines.size(); ++i) {
    const std::string &line = lines[i];
    if (contains_icase(line, "ntfs") && contains_icase(line, name) &&
        has_error_marker(line)) {
      matches.push_back(line);
    }
  }
  return matches;
}

HealthReport check_kernel_log(CommandRunner &runner, const std::string &device,
                              int tail_lines) {
  HealthReport report;
  CommandResult res = runner.run(DMESG_COMMAND, {"-T"});
  if (!res.ok())
    return report;

  report.log_available = true;
  report.matches = scan_kernel_log(res.output, device, tail_lines);
  return report;
}

} // namespace ntfsmh
