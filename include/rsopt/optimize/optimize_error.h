#pragma once

#include <string>

namespace rsopt::optimize {

// Fatal error categories surfaced to the caller. Degraded extraction and prediction failures
// are not errors: the run completes with fewer (or zero) insertions instead.
enum class OptimizeErrorKind {
  kInput,   // unreadable source, empty resume, job description below the minimum length
  kOutput,  // rebuilt document could not be written
};

struct OptimizeError {
  OptimizeErrorKind kind{OptimizeErrorKind::kInput};
  std::string message;
};

inline std::string to_string(const OptimizeErrorKind kind) {
  return kind == OptimizeErrorKind::kInput ? "input_error" : "output_error";
}

}  // namespace rsopt::optimize
