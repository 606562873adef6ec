#pragma once

#include "rsopt/core/ids.h"

#include <optional>
#include <string>
#include <string_view>

namespace rsopt::domain {

// OptimizationStatus is the lifecycle of a stored resume.
//   pending -> uploaded -> processing -> completed | failed
//   completed | failed -> processing   (re-optimization with a new job description)
enum class OptimizationStatus {
  kPending,
  kUploaded,
  kProcessing,
  kCompleted,
  kFailed,
};

[[nodiscard]] std::string to_string(OptimizationStatus status);
[[nodiscard]] std::optional<OptimizationStatus> parse_optimization_status(std::string_view name);
[[nodiscard]] bool can_transition(OptimizationStatus from, OptimizationStatus to);

// ResumeRecord is owned by the persistence layer. The optimization engine never reads or
// writes it; the application service maps engine outcomes onto it.
struct ResumeRecord {
  core::ResumeId resume_id;
  core::UserId user_id;
  std::string original_path;
  std::optional<std::string> original_filename;
  std::optional<std::string> optimized_path;
  std::optional<std::string> pdf_path;
  std::optional<std::string> job_description;
  OptimizationStatus status{OptimizationStatus::kPending};
  int keywords_added{0};
  std::optional<std::string> last_error;
  std::string created_at;
  std::string updated_at;

  bool operator==(const ResumeRecord&) const = default;
};

// to_json renders the record for API/CLI output (keys sorted, optional fields as null).
[[nodiscard]] std::string to_json(const ResumeRecord& record);

}  // namespace rsopt::domain
