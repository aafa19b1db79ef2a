// core/events.cpp - Remediation event recording implementation
#include "events.hpp"
#include "../utils.hpp"

namespace ntfsmh {

const char *event_level_name(EventLevel level) {
  switch (level) {
  case EventLevel::Debug:
    return "DEBUG";
  case EventLevel::Info:
    return "INFO";
  case EventLevel::Warn:
    return "WARN";
  case EventLevel::Error:
    return "ERROR";
  }
  return "INFO";
}

void EventSink::output(const std::string &text) {
  for (const auto &line : split_lines(text)) {
    if (!trim(line).empty()) {
      info("    | " + line);
    }
  }
}

void LoggerSink::record(const Event &event) {
  Logger::getInstance().log(event_level_name(event.level), event.message);
}

} // namespace ntfsmh
