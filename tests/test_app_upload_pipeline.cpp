#include "rsopt/app/app_service.h"
#include "rsopt/core/clock.h"
#include "rsopt/core/id_generator.h"
#include "rsopt/core/services.h"
#include "rsopt/prediction/mask_predictor.h"
#include "rsopt/storage/audit_log.h"
#include "rsopt/storage/resume_record_store.h"

#include <catch2/catch_test_macros.hpp>

#include <nlohmann/json.hpp>

#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>

using namespace rsopt;

namespace {

struct UploadFixture {
  storage::InMemoryResumeRecordStore records;
  storage::InMemoryAuditLog audit_log;
  prediction::NullMaskPredictor predictor;
  core::Services services{records, audit_log, predictor};
  core::DeterministicIdGenerator id_gen;
  core::FixedClock clock{"2026-01-01T00:00:00Z"};
  app::StoragePaths paths{"test_upload_data/uploads", "test_upload_data/optimized"};

  UploadFixture() {
    std::filesystem::create_directories("test_upload_data");
    std::ofstream("test_upload_data/cv.txt") << "SKILLS\nPython\n";
    std::ofstream("test_upload_data/cv.pdf") << "%PDF-1.4\n";
  }
  ~UploadFixture() { std::filesystem::remove_all("test_upload_data"); }

  UploadFixture(const UploadFixture&) = delete;
  UploadFixture& operator=(const UploadFixture&) = delete;
};

}  // namespace

TEST_CASE("Upload pipeline stores and registers the file", "[app][upload]") {
  UploadFixture fx;

  app::UploadRequest req;
  req.source_path = "test_upload_data/cv.txt";
  req.user_id = "alice";

  const auto response =
      app::run_upload_pipeline(req, fx.paths, fx.services, fx.id_gen, fx.clock);

  CHECK(response.trace_id == "trace-0");
  const auto& record = response.record;
  CHECK(record.resume_id.value == "resume-1");
  CHECK(record.user_id.value == "alice");
  CHECK(record.status == domain::OptimizationStatus::kUploaded);
  CHECK(record.original_filename == "cv.txt");
  CHECK(record.created_at == "2026-01-01T00:00:00Z");
  CHECK(std::filesystem::path(record.original_path).filename() == "resume-1.txt");
  CHECK(std::filesystem::exists(record.original_path));

  const auto stored = fx.records.get(record.resume_id);
  REQUIRE(stored.has_value());
  CHECK(stored.value() == record);

  const auto events = fx.audit_log.query(response.trace_id);
  REQUIRE(events.size() == 1);
  CHECK(events[0].event_type == "UploadRegistered");
  CHECK(events[0].refs == std::vector<std::string>{"resume-1"});
  const auto payload = nlohmann::json::parse(events[0].payload);
  CHECK(payload["user_id"] == "alice");
  CHECK(payload["original_filename"] == "cv.txt");
}

TEST_CASE("Upload pipeline uses the caller's trace id", "[app][upload]") {
  UploadFixture fx;

  app::UploadRequest req;
  req.source_path = "test_upload_data/cv.txt";
  req.user_id = "alice";
  req.trace_id = "trace-client";

  const auto response =
      app::run_upload_pipeline(req, fx.paths, fx.services, fx.id_gen, fx.clock);
  CHECK(response.trace_id == "trace-client");
  CHECK(response.record.resume_id.value == "resume-0");
  CHECK(fx.audit_log.query("trace-client").size() == 1);
}

TEST_CASE("Upload pipeline rejects bad requests", "[app][upload]") {
  UploadFixture fx;
  app::UploadRequest req;
  req.source_path = "test_upload_data/cv.txt";
  req.user_id = "alice";

  SECTION("missing user") {
    req.user_id = "";
    CHECK_THROWS_AS(app::run_upload_pipeline(req, fx.paths, fx.services, fx.id_gen, fx.clock),
                    std::invalid_argument);
  }

  SECTION("missing file") {
    req.source_path = "test_upload_data/absent.txt";
    CHECK_THROWS_AS(app::run_upload_pipeline(req, fx.paths, fx.services, fx.id_gen, fx.clock),
                    std::invalid_argument);
  }

  SECTION("unsupported extension") {
    req.source_path = "test_upload_data/cv.pdf";
    CHECK_THROWS_AS(app::run_upload_pipeline(req, fx.paths, fx.services, fx.id_gen, fx.clock),
                    std::invalid_argument);
  }

  CHECK(fx.audit_log.query("").empty());
  CHECK(fx.records.list_by_user(core::UserId{"alice"}).empty());
}
