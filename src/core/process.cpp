#include "rsopt/core/process.h"

#include <sys/wait.h>

#include <array>
#include <cstdio>

namespace rsopt::core {

std::string shell_quote(std::string_view value) {
  std::string quoted = "'";
  for (const char ch : value) {
    if (ch == '\'') {
      quoted += "'\\''";
    } else {
      quoted.push_back(ch);
    }
  }
  quoted.push_back('\'');
  return quoted;
}

Result<ProcessOutput, std::string> run_capture(const std::string& command_line,
                                               std::chrono::seconds timeout) {
  std::string full_command = command_line;
  if (timeout.count() > 0) {
    full_command = "timeout " + std::to_string(timeout.count()) + " " + command_line;
  }
  full_command += " 2>&1";

  FILE* pipe = popen(full_command.c_str(), "r");
  if (pipe == nullptr) {
    return Result<ProcessOutput, std::string>::err("Failed to start command: " + command_line);
  }

  ProcessOutput out;
  std::array<char, 4096> buf{};
  while (true) {
    const std::size_t n = std::fread(buf.data(), 1, buf.size(), pipe);
    if (n == 0) {
      break;
    }
    out.output.append(buf.data(), n);
  }

  const int status = pclose(pipe);
  if (status == -1) {
    return Result<ProcessOutput, std::string>::err("Failed to wait for command: " +
                                                   command_line);
  }
  out.exit_code = WIFEXITED(status) ? WEXITSTATUS(status) : -1;

  return Result<ProcessOutput, std::string>::ok(std::move(out));
}

}  // namespace rsopt::core
