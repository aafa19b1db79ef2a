// core/runner.hpp - External command execution
#pragma once

#include <string>
#include <vector>

namespace ntfsmh {

struct CommandResult {
  std::string output; // stdout and stderr, interleaved
  int exit_code = -1;

  bool ok() const { return exit_code == 0; }
};

class CommandRunner {
public:
  virtual ~CommandRunner() = default;
  virtual CommandResult run(const std::string &name,
                            const std::vector<std::string> &args) = 0;
};

// Runs commands through the shell with every argument quoted.
class ProcessRunner : public CommandRunner {
public:
  CommandResult run(const std::string &name,
                    const std::vector<std::string> &args) override;
};

std::string format_command(const std::string &name,
                           const std::vector<std::string> &args);

} // namespace ntfsmh
