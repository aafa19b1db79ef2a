// conf/config.hpp - Configuration management
#pragma once

#include "../defs.hpp"
#include <filesystem>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace ntfsmh {

struct Config {
  fs::path fstab = DEFAULT_FSTAB_FILE;
  fs::path log_file = DEFAULT_LOG_FILE;
  fs::path lastrun_file = DEFAULT_LASTRUN_FILE;
  std::string repair_command = DEFAULT_REPAIR_COMMAND;
  std::vector<std::string> repair_args = {"-d"};
  int dmesg_lines = DEFAULT_DMESG_LINES;
  int startup_delay = DEFAULT_STARTUP_DELAY;
  int umount_settle = DEFAULT_UMOUNT_SETTLE;
  int repair_settle = DEFAULT_REPAIR_SETTLE;
  bool verbose = false;

  static Config load_default();
  static Config from_file(const fs::path &path);
  bool save_to_file(const fs::path &path) const;

  void merge_with_cli(const fs::path &fstab_override,
                      const fs::path &log_override, bool verbose_override,
                      bool no_delay);
};

} // namespace ntfsmh
