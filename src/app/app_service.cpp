#include "rsopt/app/app_service.h"

#include "rsopt/io/document_io.h"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <stdexcept>

namespace rsopt::app {

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

void persist(core::Services& services, const domain::ResumeRecord& record) {
  auto result = services.resume_records.upsert(record);
  if (!result.has_value()) {
    throw std::runtime_error("Failed to store resume record " + record.resume_id.value + ": " +
                             result.error());
  }
}

void emit(core::Services& services, core::IIdGenerator& id_gen, core::IClock& clock,
          const std::string& trace_id, const char* event_type, const json& payload,
          std::vector<std::string> refs) {
  services.audit_log.append({id_gen.next("evt"), trace_id, event_type, payload.dump(),
                             clock.now_iso8601(), std::move(refs)});
}

json optional_json(const std::optional<std::string>& value) {
  return value.has_value() ? json(value.value()) : json(nullptr);
}

}  // namespace

UploadResponse run_upload_pipeline(const UploadRequest& req, const StoragePaths& paths,
                                   core::Services& services, core::IIdGenerator& id_gen,
                                   core::IClock& clock) {
  if (req.user_id.empty()) {
    throw std::invalid_argument("User id is required");
  }
  std::error_code ec;
  if (!fs::is_regular_file(req.source_path, ec)) {
    throw std::invalid_argument("File not found: " + req.source_path);
  }
  const std::string ext = io::file_extension(req.source_path);
  if (!io::is_supported_extension(ext)) {
    throw std::invalid_argument("Unsupported file type '" + ext + "' (expected .docx or .txt)");
  }

  const std::string trace_id =
      req.trace_id.has_value() ? req.trace_id.value() : core::new_trace_id(id_gen).value;
  const core::ResumeId resume_id = core::new_resume_id(id_gen);

  fs::create_directories(paths.uploads_dir, ec);
  if (ec) {
    throw std::runtime_error("Failed to create upload directory " + paths.uploads_dir + ": " +
                             ec.message());
  }
  const std::string stored_path = (fs::path(paths.uploads_dir) / (resume_id.value + ext)).string();
  fs::copy_file(req.source_path, stored_path, fs::copy_options::overwrite_existing, ec);
  if (ec) {
    throw std::runtime_error("Failed to store upload at " + stored_path + ": " + ec.message());
  }

  const std::string now = clock.now_iso8601();
  domain::ResumeRecord record;
  record.resume_id = resume_id;
  record.user_id = core::UserId{req.user_id};
  record.original_path = stored_path;
  record.original_filename = fs::path(req.source_path).filename().string();
  record.status = domain::OptimizationStatus::kUploaded;
  record.created_at = now;
  record.updated_at = now;
  persist(services, record);

  emit(services, id_gen, clock, trace_id, storage::audit_events::kUploadRegistered,
       {{"original_filename", record.original_filename.value()},
        {"resume_id", resume_id.value},
        {"stored_path", stored_path},
        {"user_id", req.user_id}},
       {resume_id.value});

  return UploadResponse{.trace_id = trace_id, .record = record};
}

OptimizeReport run_optimize_pipeline(const OptimizeRequest& req,
                                     const optimize::OptimizationEngine& engine,
                                     const render::IPdfRenderer* renderer,
                                     const StoragePaths& paths, core::Services& services,
                                     core::IIdGenerator& id_gen, core::IClock& clock) {
  auto found = services.resume_records.get(core::ResumeId{req.resume_id});
  if (!found.has_value()) {
    throw std::invalid_argument("Resume not found: " + req.resume_id);
  }
  domain::ResumeRecord record = found.value();
  if (record.user_id.value != req.user_id) {
    throw std::invalid_argument("Resume " + req.resume_id + " does not belong to user " +
                                req.user_id);
  }
  if (!domain::can_transition(record.status, domain::OptimizationStatus::kProcessing)) {
    throw std::invalid_argument("Resume " + req.resume_id + " cannot be optimized while " +
                                domain::to_string(record.status));
  }

  OptimizeReport report;
  report.trace_id =
      req.trace_id.has_value() ? req.trace_id.value() : core::new_trace_id(id_gen).value;
  const std::string& trace_id = report.trace_id;
  const std::vector<std::string> refs{record.resume_id.value};

  record.status = domain::OptimizationStatus::kProcessing;
  record.job_description = req.job_description;
  record.last_error.reset();
  record.updated_at = clock.now_iso8601();
  persist(services, record);

  emit(services, id_gen, clock, trace_id, storage::audit_events::kOptimizeStarted,
       {{"job_description_length", req.job_description.size()},
        {"resume_id", record.resume_id.value},
        {"user_id", record.user_id.value}},
       refs);

  auto fail = [&](const std::string& message) {
    record.status = domain::OptimizationStatus::kFailed;
    record.last_error = message;
    record.updated_at = clock.now_iso8601();
    persist(services, record);
    emit(services, id_gen, clock, trace_id, storage::audit_events::kOptimizeFailed,
         {{"error", message}, {"resume_id", record.resume_id.value}}, refs);
    report.success = false;
    report.error = message;
    return report;
  };

  const auto source = io::create_document_source(record.original_path);
  if (!source) {
    return fail("input_error: Unsupported document format: " + record.original_path);
  }
  auto read = source->read(record.original_path);
  if (!read.has_value()) {
    return fail("input_error: " + read.error().message);
  }

  auto optimized = engine.optimize(read.value(), req.job_description);
  if (!optimized.has_value()) {
    return fail(optimize::to_string(optimized.error().kind) + ": " + optimized.error().message);
  }
  const optimize::OptimizationOutcome& outcome = optimized.value();

  report.missing_keywords = domain::keyword_texts(outcome.missing_keywords);
  emit(services, id_gen, clock, trace_id, storage::audit_events::kKeywordsAnalyzed,
       {{"missing_count", report.missing_keywords.size()},
        {"missing_keywords", report.missing_keywords}},
       refs);

  const std::string ext = io::file_extension(record.original_path);
  const std::string output_path =
      (fs::path(paths.optimized_dir) / (record.resume_id.value + ext)).string();
  const auto sink = io::create_document_sink(output_path, record.original_path);
  if (!sink) {
    return fail("output_error: Unsupported output format: " + output_path);
  }
  auto written = sink->write(outcome.document, output_path);
  if (!written.has_value()) {
    return fail("output_error: " + written.error().message);
  }

  report.success = true;
  report.keywords_added = static_cast<int>(outcome.keywords_added);
  report.output_path = written.value();
  report.change_log = outcome.change_log;

  if (req.render_pdf && renderer != nullptr) {
    const std::string pdf_path =
        (fs::path(paths.optimized_dir) / (record.resume_id.value + ".pdf")).string();
    auto rendered = renderer->render(outcome.document, output_path, pdf_path);
    if (rendered.has_value()) {
      report.pdf_path = rendered.value().pdf_path;
      emit(services, id_gen, clock, trace_id, storage::audit_events::kPdfRendered,
           {{"pdf_path", rendered.value().pdf_path}, {"renderer", rendered.value().renderer}},
           refs);
    } else {
      report.pdf_error = rendered.error().message;
      emit(services, id_gen, clock, trace_id, storage::audit_events::kPdfRenderFailed,
           {{"error", rendered.error().message}}, refs);
    }
  }

  record.status = domain::OptimizationStatus::kCompleted;
  record.keywords_added = report.keywords_added;
  record.optimized_path = report.output_path;
  record.pdf_path = report.pdf_path;
  record.updated_at = clock.now_iso8601();
  persist(services, record);

  emit(services, id_gen, clock, trace_id, storage::audit_events::kOptimizeCompleted,
       {{"keywords_added", report.keywords_added},
        {"output_path", output_path},
        {"pdf_path", optional_json(report.pdf_path)}},
       refs);

  return report;
}

std::optional<domain::ResumeRecord> fetch_resume_status(const core::ResumeId& resume_id,
                                                        const std::optional<core::UserId>& user_id,
                                                        core::Services& services) {
  auto record = services.resume_records.get(resume_id);
  if (record.has_value() && user_id.has_value() && record->user_id != user_id.value()) {
    return std::nullopt;
  }
  return record;
}

std::vector<storage::AuditEvent> fetch_audit_trace(const std::string& trace_id,
                                                   core::Services& services) {
  return services.audit_log.query(trace_id);
}

std::string to_json(const OptimizeReport& report) {
  json changes = json::array();
  for (const auto& change : report.change_log) {
    changes.push_back({{"duplicates_removed", change.duplicates_removed},
                       {"inserted_keywords", change.inserted_keywords},
                       {"paragraph_index", change.paragraph_index},
                       {"prediction_errors", change.prediction_errors},
                       {"section", domain::to_string(change.section)},
                       {"used_prediction", change.used_prediction}});
  }

  json j;
  j["change_log"] = changes;
  j["error"] = optional_json(report.error);
  j["keywords_added"] = report.keywords_added;
  j["missing_keywords"] = report.missing_keywords;
  j["output_path"] = optional_json(report.output_path);
  j["pdf_error"] = optional_json(report.pdf_error);
  j["pdf_path"] = optional_json(report.pdf_path);
  j["success"] = report.success;
  j["trace_id"] = report.trace_id;
  return j.dump(2);
}

}  // namespace rsopt::app
