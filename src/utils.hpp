// utils.hpp - Utility functions
#pragma once

#include <filesystem>
#include <fstream>
#include <memory>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace ntfsmh {

// Logging
class Logger {
public:
  static Logger &getInstance();
  void init(bool verbose, const fs::path &log_path);
  void log(const std::string &level, const std::string &message);

private:
  Logger() = default;
  bool verbose_ = false;
  std::unique_ptr<std::ofstream> log_file_;
};

#define LOG_INFO(msg) Logger::getInstance().log("INFO", msg)
#define LOG_WARN(msg) Logger::getInstance().log("WARN", msg)
#define LOG_ERROR(msg) Logger::getInstance().log("ERROR", msg)
#define LOG_DEBUG(msg) Logger::getInstance().log("DEBUG", msg)

// File system utilities
bool ensure_dir_exists(const fs::path &path);

// String utilities
std::string trim(const std::string &s);
std::string to_lower(std::string s);
bool contains_icase(const std::string &haystack, const std::string &needle);
std::vector<std::string> split_lines(const std::string &text);
std::vector<std::string> split_words(const std::string &text);
std::string shell_quote(const std::string &arg);

// Time
std::string format_local_time(const char *fmt);
void sleep_seconds(int seconds);

} // namespace ntfsmh
