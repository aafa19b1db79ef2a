// core/device.cpp - Block device lookup and mount status probes
#include "device.hpp"
#include "../defs.hpp"
#include "../utils.hpp"
#include <algorithm>
#include <filesystem>

namespace fs = std::filesystem;

namespace ntfsmh {

static std::string first_line(const std::string &output) {
  for (const auto &line : split_lines(output)) {
    std::string t = trim(line);
    if (!t.empty())
      return t;
  }
  return "";
}

static bool starts_with(const std::string &s, const std::string &prefix) {
  return s.compare(0, prefix.size(), prefix) == 0;
}

std::string resolve_device(CommandRunner &runner, const std::string &spec) {
  std::vector<std::string> args;

  if (starts_with(spec, "UUID=")) {
    args = {"-U", spec.substr(5)};
  } else if (starts_with(spec, "LABEL=")) {
    args = {"-L", spec.substr(6)};
  } else if (starts_with(spec, "PARTUUID=") || starts_with(spec, "PARTLABEL=")) {
    args = {"-o", "device", "-t", spec};
  } else {
    return spec;
  }

  CommandResult res = runner.run(BLKID_COMMAND, args);
  std::string device = first_line(res.output);
  if (!res.ok() || device.empty()) {
    LOG_DEBUG("blkid could not resolve " + spec);
    return spec;
  }
  return device;
}

bool is_block_device(CommandRunner &runner, const std::string &device) {
  return runner.run(TEST_COMMAND, {"-b", device}).ok();
}

std::string detect_fs_type(CommandRunner &runner, const std::string &device) {
  CommandResult res =
      runner.run(BLKID_COMMAND, {"-s", "TYPE", "-o", "value", device});
  if (!res.ok())
    return "";
  return first_line(res.output);
}

bool is_ntfs_type(const std::string &fs_type) {
  return std::find(NTFS_TYPES.begin(), NTFS_TYPES.end(), fs_type) !=
         NTFS_TYPES.end();
}

bool is_mounted(CommandRunner &runner, const std::string &mount_point) {
  return runner.run(MOUNTPOINT_COMMAND, {"-q", mount_point}).ok();
}

std::string device_base_name(const std::string &device) {
  return fs::path(device).filename().string();
}

} // namespace ntfsmh
