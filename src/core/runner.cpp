// core/runner.cpp - External command execution implementation
#include "runner.hpp"
#include "../utils.hpp"
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <sys/wait.h>

namespace ntfsmh {

std::string format_command(const std::string &name,
                           const std::vector<std::string> &args) {
  std::string cmd = name;
  for (const auto &arg : args) {
    cmd += " " + arg;
  }
  return cmd;
}

CommandResult ProcessRunner::run(const std::string &name,
                                 const std::vector<std::string> &args) {
  CommandResult result;

  std::string cmd = shell_quote(name);
  for (const auto &arg : args) {
    cmd += " " + shell_quote(arg);
  }
  cmd += " 2>&1";

  LOG_DEBUG("exec: " + format_command(name, args));

  FILE *pipe = popen(cmd.c_str(), "r");
  if (!pipe) {
    LOG_ERROR("Failed to execute " + name + ": " + strerror(errno));
    return result;
  }

  char buffer[256];
  while (fgets(buffer, sizeof(buffer), pipe) != nullptr) {
    result.output += buffer;
  }

  int ret = pclose(pipe);
  if (ret == -1) {
    LOG_ERROR("Failed to collect status of " + name + ": " + strerror(errno));
    return result;
  }

  if (WIFEXITED(ret)) {
    // 127 is the shell's "command not found"
    result.exit_code = WEXITSTATUS(ret);
    if (result.exit_code == 127) {
      LOG_WARN(name + " not found in PATH");
    }
  } else if (WIFSIGNALED(ret)) {
    LOG_WARN(name + " terminated by signal " +
             std::to_string(WTERMSIG(ret)));
    result.exit_code = 128 + WTERMSIG(ret);
  }

  return result;
}

} // namespace ntfsmh
