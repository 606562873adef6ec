#pragma once

#include "rsopt/core/result.h"

#include <chrono>
#include <string>
#include <string_view>

namespace rsopt::core {

struct ProcessOutput {
  int exit_code{0};
  std::string output;  // stdout and stderr, merged
};

// shell_quote wraps a value in single quotes for /bin/sh, escaping embedded quotes.
[[nodiscard]] std::string shell_quote(std::string_view value);

// run_capture runs a shell command line and captures its merged output.
// A positive timeout prefixes the command with coreutils `timeout`; a timed-out command
// reports exit code 124. Returns an error only when the process could not be started.
[[nodiscard]] Result<ProcessOutput, std::string> run_capture(
    const std::string& command_line, std::chrono::seconds timeout = std::chrono::seconds{0});

}  // namespace rsopt::core
