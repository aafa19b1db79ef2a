// core/device.hpp - Block device lookup and mount status probes
#pragma once

#include "runner.hpp"
#include <string>

namespace ntfsmh {

// Resolves UUID=, LABEL=, PARTUUID= and PARTLABEL= references through
// blkid. Returns the spec unchanged when it is a plain path or the
// lookup fails.
std::string resolve_device(CommandRunner &runner, const std::string &spec);

bool is_block_device(CommandRunner &runner, const std::string &device);

// Filesystem type as reported by blkid, empty when unknown.
std::string detect_fs_type(CommandRunner &runner, const std::string &device);

bool is_ntfs_type(const std::string &fs_type);

bool is_mounted(CommandRunner &runner, const std::string &mount_point);

// "/dev/sdb1" -> "sdb1"
std::string device_base_name(const std::string &device);

} // namespace ntfsmh
