// core/events.hpp - Remediation event recording
#pragma once

#include <string>
#include <vector>

namespace ntfsmh {

enum class EventLevel { Debug, Info, Warn, Error };

struct Event {
  EventLevel level;
  std::string message;
};

const char *event_level_name(EventLevel level);

class EventSink {
public:
  virtual ~EventSink() = default;
  virtual void record(const Event &event) = 0;

  void debug(const std::string &msg) { record({EventLevel::Debug, msg}); }
  void info(const std::string &msg) { record({EventLevel::Info, msg}); }
  void warn(const std::string &msg) { record({EventLevel::Warn, msg}); }
  void error(const std::string &msg) { record({EventLevel::Error, msg}); }

  // Appends raw tool output, one event per non-empty line.
  void output(const std::string &text);
};

// Forwards events to the process-wide Logger.
class LoggerSink : public EventSink {
public:
  void record(const Event &event) override;
};

} // namespace ntfsmh
