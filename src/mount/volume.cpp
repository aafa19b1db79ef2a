// mount/volume.cpp - Unmount and remount of fstab volumes
#include "volume.hpp"
#include "../core/device.hpp"
#include "../defs.hpp"
#include "../utils.hpp"

namespace ntfsmh {

bool safe_unmount(CommandRunner &runner, EventSink &sink,
                  const std::string &mount_point, int settle_seconds) {
  if (!is_mounted(runner, mount_point)) {
    return true;
  }

  sink.info("Unmounting " + mount_point + "...");
  CommandResult res = runner.run(UMOUNT_COMMAND, {mount_point});
  if (res.ok()) {
    sink.info("Unmounted " + mount_point);
    return true;
  }

  sink.warn("Cannot unmount " + mount_point +
            " normally, trying lazy unmount...");
  sink.output(res.output);

  CommandResult lazy = runner.run(UMOUNT_COMMAND, {"-l", mount_point});
  if (!lazy.ok()) {
    sink.warn("Lazy unmount of " + mount_point + " failed (exit " +
              std::to_string(lazy.exit_code) + ")");
  }
  // Detached unmounts finish in the background
  sleep_seconds(settle_seconds);
  return false;
}

bool remount_entry(CommandRunner &runner, EventSink &sink,
                   const FstabEntry &entry, const std::string &device) {
  sink.info("  Mounting " + entry.mount_point + "...");
  CommandResult res = runner.run(MOUNT_COMMAND, {entry.mount_point});
  sink.output(res.output);
  if (res.ok()) {
    sink.info("  Mount succeeded");
    return true;
  }

  sink.warn("  Mount failed (exit " + std::to_string(res.exit_code) + ")");

  sink.info("  Trying mount with type " + entry.fs_type + "...");
  CommandResult typed = runner.run(
      MOUNT_COMMAND, {"-t", entry.fs_type, device, entry.mount_point});
  sink.output(typed.output);
  if (typed.ok()) {
    sink.info("  Mount with type " + entry.fs_type + " succeeded");
    return true;
  }

  sink.error("  All mount attempts for " + entry.mount_point + " failed");
  return false;
}

bool mount_all(CommandRunner &runner, EventSink &sink) {
  sink.info("Running 'mount -a' to mount all configured filesystems...");
  CommandResult res = runner.run(MOUNT_COMMAND, {"-a"});
  sink.output(res.output);
  if (!res.ok()) {
    sink.warn("'mount -a' exited with " + std::to_string(res.exit_code));
    return false;
  }
  return true;
}

} // namespace ntfsmh
