#pragma once

#include <chrono>
#include <string>
#include <vector>

namespace netmon_agent::net {

struct CommandResult {
  int exit_code{-1};
  bool timed_out{false};
  std::string output{};
};

// Runs argv[0] from PATH with stdout and stderr captured. The child is killed
// when the timeout expires. Never throws for a failing command; a failure to
// spawn is reported as exit_code 127.
CommandResult run_command(const std::vector<std::string>& argv, std::chrono::milliseconds timeout);

}  // namespace netmon_agent::net
