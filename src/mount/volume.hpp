// mount/volume.hpp - Unmount and remount of fstab volumes
#pragma once

#include "../core/events.hpp"
#include "../core/fstab.hpp"
#include "../core/runner.hpp"
#include <string>

namespace ntfsmh {

// Unmounts mount_point if mounted. Falls back to a lazy unmount and
// returns false when the regular unmount fails.
bool safe_unmount(CommandRunner &runner, EventSink &sink,
                  const std::string &mount_point, int settle_seconds);

// Mounts entry via its fstab options, then retries once with an explicit
// type against the resolved device.
bool remount_entry(CommandRunner &runner, EventSink &sink,
                   const FstabEntry &entry, const std::string &device);

bool mount_all(CommandRunner &runner, EventSink &sink);

} // namespace ntfsmh
