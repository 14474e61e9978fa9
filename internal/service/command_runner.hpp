#pragma once

#include <chrono>
#include <string>
#include <vector>

namespace artifact::service {

struct CommandResult {
  int         exit_code = -1;
  bool        timed_out = false;
  std::string output;  // stdout and stderr interleaved, truncated

  bool ok() const {
    return !timed_out && exit_code == 0;
  }
};

/*
  Runs argv[0] (PATH lookup) as a child process and waits at most `timeout`.
  On expiry the child is killed and reaped. Exit code 127 means exec failed.
*/
CommandResult RunCommand(const std::vector<std::string>& argv, std::chrono::milliseconds timeout);

} // namespace artifact::service
