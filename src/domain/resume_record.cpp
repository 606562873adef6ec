#include "rsopt/domain/resume_record.h"

#include <nlohmann/json.hpp>

namespace rsopt::domain {

std::string to_string(const OptimizationStatus status) {
  switch (status) {
    case OptimizationStatus::kPending:
      return "pending";
    case OptimizationStatus::kUploaded:
      return "uploaded";
    case OptimizationStatus::kProcessing:
      return "processing";
    case OptimizationStatus::kCompleted:
      return "completed";
    case OptimizationStatus::kFailed:
      return "failed";
  }
  return "pending";
}

std::optional<OptimizationStatus> parse_optimization_status(const std::string_view name) {
  if (name == "pending") {
    return OptimizationStatus::kPending;
  }
  if (name == "uploaded") {
    return OptimizationStatus::kUploaded;
  }
  if (name == "processing") {
    return OptimizationStatus::kProcessing;
  }
  if (name == "completed") {
    return OptimizationStatus::kCompleted;
  }
  if (name == "failed") {
    return OptimizationStatus::kFailed;
  }
  return std::nullopt;
}

bool can_transition(const OptimizationStatus from, const OptimizationStatus to) {
  using S = OptimizationStatus;
  switch (from) {
    case S::kPending:
      return to == S::kUploaded;
    case S::kUploaded:
      return to == S::kProcessing;
    case S::kProcessing:
      return to == S::kCompleted || to == S::kFailed;
    case S::kCompleted:
    case S::kFailed:
      return to == S::kProcessing;
  }
  return false;
}

namespace {

template <typename T>
nlohmann::json optional_to_json(const std::optional<T>& value) {
  if (value.has_value()) {
    return nlohmann::json(value.value());
  }
  return nlohmann::json(nullptr);
}

}  // namespace

std::string to_json(const ResumeRecord& record) {
  nlohmann::json j;
  j["created_at"] = record.created_at;
  j["id"] = record.resume_id.value;
  j["job_description"] = optional_to_json(record.job_description);
  j["keywords_added"] = record.keywords_added;
  j["last_error"] = optional_to_json(record.last_error);
  j["optimization_status"] = to_string(record.status);
  j["optimized_path"] = optional_to_json(record.optimized_path);
  j["original_filename"] = optional_to_json(record.original_filename);
  j["original_path"] = record.original_path;
  j["pdf_path"] = optional_to_json(record.pdf_path);
  j["updated_at"] = record.updated_at;
  j["user_id"] = record.user_id.value;
  return j.dump();
}

}  // namespace rsopt::domain
