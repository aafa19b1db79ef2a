// Constants and definitions
#pragma once

#include <string>
#include <vector>

namespace ntfsmh {

// Set by the build to the install sysconfdir
#ifndef NTFSMH_SYSCONFDIR
#define NTFSMH_SYSCONFDIR "/etc"
#endif

// Files
constexpr const char *DEFAULT_CONFIG_FILE =
    NTFSMH_SYSCONFDIR "/ntfs-mount-helper.conf";
constexpr const char *DEFAULT_FSTAB_FILE = "/etc/fstab";
constexpr const char *DEFAULT_LOG_FILE = "/var/log/ntfs-mount-helper.log";
constexpr const char *DEFAULT_LASTRUN_FILE =
    "/var/run/ntfs-mount-helper.lastrun";

// External tools
constexpr const char *BLKID_COMMAND = "blkid";
constexpr const char *MOUNT_COMMAND = "mount";
constexpr const char *UMOUNT_COMMAND = "umount";
constexpr const char *MOUNTPOINT_COMMAND = "mountpoint";
constexpr const char *TEST_COMMAND = "test";
constexpr const char *DMESG_COMMAND = "dmesg";
constexpr const char *DEFAULT_REPAIR_COMMAND = "ntfsfix";

// Filesystem types accepted as NTFS
const std::vector<std::string> NTFS_TYPES = {"ntfs", "ntfs-3g", "ntfs3"};

// Kernel log indicators that mark a volume as unhealthy
const std::vector<std::string> KERNEL_ERROR_MARKERS = {"error", "fail",
                                                       "dirty", "corrupt"};

// Defaults
constexpr int DEFAULT_DMESG_LINES = 50;
constexpr int DEFAULT_STARTUP_DELAY = 5;
constexpr int DEFAULT_UMOUNT_SETTLE = 2;
constexpr int DEFAULT_REPAIR_SETTLE = 2;

} // namespace ntfsmh
