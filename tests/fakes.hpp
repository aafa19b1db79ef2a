#pragma once
#include "core/events.hpp"
#include "core/runner.hpp"
#include <algorithm>
#include <deque>
#include <map>
#include <string>
#include <vector>

// Scripted command runner. Responses are keyed by the command line as
// format_command() renders it; queued responses are consumed in order and
// the last one repeats. Unknown commands fail with fallback_exit.
class FakeRunner : public ntfsmh::CommandRunner {
public:
  void on(const std::string& cmd, int exit_code, const std::string& output = "") {
    responses_[cmd].push_back(ntfsmh::CommandResult{output, exit_code});
  }

  ntfsmh::CommandResult run(const std::string& name, const std::vector<std::string>& args) override {
    std::string cmd = ntfsmh::format_command(name, args);
    calls.push_back(cmd);
    auto it = responses_.find(cmd);
    if (it == responses_.end() || it->second.empty()) return ntfsmh::CommandResult{"", fallback_exit};
    ntfsmh::CommandResult res = it->second.front();
    if (it->second.size() > 1) it->second.pop_front();
    return res;
  }

  int count(const std::string& cmd) const { return static_cast<int>(std::count(calls.begin(), calls.end(), cmd)); }
  bool called(const std::string& cmd) const { return count(cmd) > 0; }
  bool called_prefix(const std::string& prefix) const {
    for (auto& c : calls) if (c.compare(0, prefix.size(), prefix) == 0) return true;
    return false;
  }

  std::vector<std::string> calls;
  int fallback_exit = 1;

private:
  std::map<std::string, std::deque<ntfsmh::CommandResult>> responses_;
};

class RecordingSink : public ntfsmh::EventSink {
public:
  void record(const ntfsmh::Event& event) override { events.push_back(event); }

  // Index of the first event at or after `from` whose message contains text, -1 if none
  int find(const std::string& text, int from = 0) const {
    for (size_t i = static_cast<size_t>(from); i < events.size(); ++i)
      if (events[i].message.find(text) != std::string::npos) return static_cast<int>(i);
    return -1;
  }
  bool contains(const std::string& text) const { return find(text) >= 0; }

  std::vector<ntfsmh::Event> events;
};

// Scripts a healthy, resolvable NTFS device.
inline void script_ntfs_device(FakeRunner& r, const std::string& device, const std::string& type = "ntfs") {
  r.on("test -b " + device, 0);
  r.on("blkid -s TYPE -o value " + device, 0, type + "\n");
}
