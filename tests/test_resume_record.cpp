#include "rsopt/domain/resume_record.h"

#include <catch2/catch_test_macros.hpp>

#include <nlohmann/json.hpp>

using namespace rsopt;
using domain::OptimizationStatus;

TEST_CASE("Status transitions follow the lifecycle", "[domain][resume_record]") {
  CHECK(domain::can_transition(OptimizationStatus::kPending, OptimizationStatus::kUploaded));
  CHECK(domain::can_transition(OptimizationStatus::kUploaded, OptimizationStatus::kProcessing));
  CHECK(domain::can_transition(OptimizationStatus::kProcessing, OptimizationStatus::kCompleted));
  CHECK(domain::can_transition(OptimizationStatus::kProcessing, OptimizationStatus::kFailed));
  CHECK(domain::can_transition(OptimizationStatus::kCompleted, OptimizationStatus::kProcessing));
  CHECK(domain::can_transition(OptimizationStatus::kFailed, OptimizationStatus::kProcessing));

  CHECK_FALSE(domain::can_transition(OptimizationStatus::kPending, OptimizationStatus::kProcessing));
  CHECK_FALSE(domain::can_transition(OptimizationStatus::kUploaded, OptimizationStatus::kCompleted));
  CHECK_FALSE(
      domain::can_transition(OptimizationStatus::kProcessing, OptimizationStatus::kProcessing));
  CHECK_FALSE(domain::can_transition(OptimizationStatus::kCompleted, OptimizationStatus::kFailed));
}

TEST_CASE("Status names parse back", "[domain][resume_record]") {
  for (const auto status :
       {OptimizationStatus::kPending, OptimizationStatus::kUploaded,
        OptimizationStatus::kProcessing, OptimizationStatus::kCompleted,
        OptimizationStatus::kFailed}) {
    const auto parsed = domain::parse_optimization_status(domain::to_string(status));
    REQUIRE(parsed.has_value());
    CHECK(parsed.value() == status);
  }
  CHECK_FALSE(domain::parse_optimization_status("done").has_value());
  CHECK_FALSE(domain::parse_optimization_status("Completed").has_value());
}

TEST_CASE("ResumeRecord JSON form", "[domain][resume_record]") {
  domain::ResumeRecord record;
  record.resume_id = core::ResumeId{"resume-7"};
  record.user_id = core::UserId{"alice"};
  record.original_path = "data/uploads/resume-7.docx";
  record.original_filename = "cv.docx";
  record.status = OptimizationStatus::kCompleted;
  record.keywords_added = 4;
  record.created_at = "2026-01-01T00:00:00Z";
  record.updated_at = "2026-01-01T00:05:00Z";

  const auto j = nlohmann::json::parse(domain::to_json(record));
  CHECK(j["id"] == "resume-7");
  CHECK(j["user_id"] == "alice");
  CHECK(j["optimization_status"] == "completed");
  CHECK(j["keywords_added"] == 4);
  CHECK(j["original_filename"] == "cv.docx");
  CHECK(j["optimized_path"].is_null());
  CHECK(j["pdf_path"].is_null());
  CHECK(j["last_error"].is_null());
  CHECK(j.size() == 12);
  CHECK(domain::to_json(record).starts_with(R"({"created_at":)"));
}
