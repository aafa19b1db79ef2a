// conf/config.cpp - Configuration implementation
#include "config.hpp"
#include "../defs.hpp"
#include "../utils.hpp"
#include <fstream>
#include <stdexcept>

namespace ntfsmh {

static int parse_int(const std::string &key, const std::string &value,
                     int fallback) {
  try {
    size_t used = 0;
    int parsed = std::stoi(value, &used);
    if (used != value.size() || parsed < 0) {
      throw std::invalid_argument(value);
    }
    return parsed;
  } catch (const std::exception &) {
    LOG_WARN("Invalid value for " + key + ": \"" + value + "\", using " +
             std::to_string(fallback));
    return fallback;
  }
}

Config Config::load_default() {
  Config config;
  // Try to load from default location if exists
  fs::path default_path(DEFAULT_CONFIG_FILE);
  if (fs::exists(default_path)) {
    try {
      return from_file(default_path);
    } catch (const std::exception &e) {
      LOG_WARN("Failed to load default config, using defaults: " +
               std::string(e.what()));
    }
  }
  return config;
}

Config Config::from_file(const fs::path &path) {
  Config config;

  std::ifstream file(path);
  if (!file.is_open()) {
    throw std::runtime_error("Cannot open config file " + path.string());
  }

  std::string line;
  while (std::getline(file, line)) {
    line = trim(line);
    if (line.empty() || line[0] == '#')
      continue;

    auto eq_pos = line.find('=');
    if (eq_pos == std::string::npos) {
      LOG_WARN("Ignoring malformed config line: " + line);
      continue;
    }

    std::string key = line.substr(0, eq_pos);
    std::string value = line.substr(eq_pos + 1);

    key.erase(0, key.find_first_not_of(" \t"));
    key.erase(key.find_last_not_of(" \t") + 1);
    value.erase(0, value.find_first_not_of(" \t\""));
    value.erase(value.find_last_not_of(" \t\"") + 1);

    if (key == "fstab")
      config.fstab = value;
    else if (key == "log_file")
      config.log_file = value;
    else if (key == "lastrun_file")
      config.lastrun_file = value;
    else if (key == "repair_command")
      config.repair_command = value;
    else if (key == "repair_args")
      config.repair_args = split_words(value);
    else if (key == "dmesg_lines")
      config.dmesg_lines = parse_int(key, value, DEFAULT_DMESG_LINES);
    else if (key == "startup_delay")
      config.startup_delay = parse_int(key, value, DEFAULT_STARTUP_DELAY);
    else if (key == "umount_settle")
      config.umount_settle = parse_int(key, value, DEFAULT_UMOUNT_SETTLE);
    else if (key == "repair_settle")
      config.repair_settle = parse_int(key, value, DEFAULT_REPAIR_SETTLE);
    else if (key == "verbose")
      config.verbose = (value == "true");
    else
      LOG_WARN("Unknown config key: " + key);
  }

  if (config.repair_command.empty()) {
    LOG_WARN("Empty repair_command, using " +
             std::string(DEFAULT_REPAIR_COMMAND));
    config.repair_command = DEFAULT_REPAIR_COMMAND;
  }

  return config;
}

bool Config::save_to_file(const fs::path &path) const {
  std::ofstream file(path);
  if (!file.is_open()) {
    return false;
  }

  file << "# NTFS Mount Helper Configuration\n";
  file << "fstab = \"" << fstab.string() << "\"\n";
  file << "log_file = \"" << log_file.string() << "\"\n";
  file << "lastrun_file = \"" << lastrun_file.string() << "\"\n";
  file << "repair_command = \"" << repair_command << "\"\n";

  file << "repair_args = \"";
  for (size_t i = 0; i < repair_args.size(); ++i) {
    file << repair_args[i];
    if (i < repair_args.size() - 1)
      file << " ";
  }
  file << "\"\n";

  file << "dmesg_lines = " << dmesg_lines << "\n";
  file << "# Delays in seconds\n";
  file << "startup_delay = " << startup_delay << "\n";
  file << "umount_settle = " << umount_settle << "\n";
  file << "repair_settle = " << repair_settle << "\n";
  file << "verbose = " << (verbose ? "true" : "false") << "\n";

  return static_cast<bool>(file);
}

void Config::merge_with_cli(const fs::path &fstab_override,
                            const fs::path &log_override,
                            bool verbose_override, bool no_delay) {
  if (!fstab_override.empty()) {
    fstab = fstab_override;
  }
  if (!log_override.empty()) {
    log_file = log_override;
  }
  if (verbose_override) {
    verbose = true;
  }
  if (no_delay) {
    startup_delay = 0;
    umount_settle = 0;
    repair_settle = 0;
  }
}

} // namespace ntfsmh
