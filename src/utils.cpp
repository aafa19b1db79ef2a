// utils.cpp - Utility functions implementation
#include "utils.hpp"
#include <cctype>
#include <chrono>
#include <ctime>
#include <iostream>
#include <sstream>
#include <thread>

namespace ntfsmh {

// Logger implementation
Logger &Logger::getInstance() {
  static Logger instance;
  return instance;
}

void Logger::init(bool verbose, const fs::path &log_path) {
  verbose_ = verbose;
  log_file_.reset();

  if (!log_path.empty()) {
    std::error_code ec;
    if (log_path.has_parent_path()) {
      fs::create_directories(log_path.parent_path(), ec);
    }
    log_file_ = std::make_unique<std::ofstream>(log_path, std::ios::app);
    if (!log_file_->is_open()) {
      std::cerr << "Cannot open log file " << log_path.string()
                << ", logging to stdout only\n";
      log_file_.reset();
    }
  }
}

void Logger::log(const std::string &level, const std::string &message) {
  // Skip DEBUG messages if not in verbose mode
  if (level == "DEBUG" && !verbose_) {
    return;
  }

  std::string log_line = "[" + format_local_time("%Y-%m-%d %H:%M:%S") +
                         "] [" + level + "] " + message + "\n";

  if (log_file_ && log_file_->is_open()) {
    *log_file_ << log_line;
    log_file_->flush();
  }

  std::cout << log_line;
  std::cout.flush();
}

// File system utilities
bool ensure_dir_exists(const fs::path &path) {
  try {
    if (!fs::exists(path)) {
      fs::create_directories(path);
    }
    return true;
  } catch (const std::exception &e) {
    LOG_ERROR("Failed to create directory " + path.string() + ": " + e.what());
    return false;
  }
}

// String utilities
std::string trim(const std::string &s) {
  size_t start = s.find_first_not_of(" \t\r\n");
  if (start == std::string::npos)
    return "";
  size_t end = s.find_last_not_of(" \t\r\n");
  return s.substr(start, end - start + 1);
}

std::string to_lower(std::string s) {
  for (char &c : s) {
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  }
  return s;
}

bool contains_icase(const std::string &haystack, const std::string &needle) {
  if (needle.empty())
    return true;
  return to_lower(haystack).find(to_lower(needle)) != std::string::npos;
}

std::vector<std::string> split_lines(const std::string &text) {
  std::vector<std::string> lines;
  std::stringstream ss(text);
  std::string line;
  while (std::getline(ss, line)) {
    if (!line.empty() && line.back() == '\r')
      line.pop_back();
    lines.push_back(line);
  }
  return lines;
}

std::vector<std::string> split_words(const std::string &text) {
  std::vector<std::string> words;
  std::stringstream ss(text);
  std::string word;
  while (ss >> word) {
    words.push_back(word);
  }
  return words;
}

std::string shell_quote(const std::string &arg) {
  std::string quoted = "'";
  for (char c : arg) {
    if (c == '\'') {
      quoted += "'\\''";
    } else {
      quoted += c;
    }
  }
  quoted += "'";
  return quoted;
}

// Time
std::string format_local_time(const char *fmt) {
  auto now = std::time(nullptr);
  std::tm tm_buf{};
  localtime_r(&now, &tm_buf);
  char time_buf[128];
  std::strftime(time_buf, sizeof(time_buf), fmt, &tm_buf);
  return std::string(time_buf);
}

void sleep_seconds(int seconds) {
  if (seconds <= 0)
    return;
  std::this_thread::sleep_for(std::chrono::seconds(seconds));
}

} // namespace ntfsmh
