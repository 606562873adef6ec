#pragma once

#include "rsopt/core/clock.h"
#include "rsopt/core/id_generator.h"
#include "rsopt/core/ids.h"
#include "rsopt/core/services.h"
#include "rsopt/domain/resume_record.h"
#include "rsopt/optimize/document_rebuilder.h"
#include "rsopt/optimize/optimization_engine.h"
#include "rsopt/render/pdf_renderer.h"
#include "rsopt/storage/audit_event.h"

#include <optional>
#include <string>
#include <vector>

namespace rsopt::app {

// Where uploaded originals and optimized outputs are stored.
struct StoragePaths {
  std::string uploads_dir{"data/uploads"};      // NOLINT(readability-identifier-naming)
  std::string optimized_dir{"data/optimized"};  // NOLINT(readability-identifier-naming)
};

// ────────────────────────────────────────────────────────────────
// Upload Pipeline
// ────────────────────────────────────────────────────────────────

struct UploadRequest {
  std::string source_path;              // NOLINT(readability-identifier-naming)
  std::string user_id;                  // NOLINT(readability-identifier-naming)
  std::optional<std::string> trace_id;  // NOLINT(readability-identifier-naming)
};

struct UploadResponse {
  std::string trace_id;         // NOLINT(readability-identifier-naming)
  domain::ResumeRecord record;  // NOLINT(readability-identifier-naming)
};

// Copy a resume into uploads_dir as "<resume_id><ext>" and register it as uploaded.
// Accepts .docx and .txt files.
// Emits audit event: UploadRegistered
// Throws std::invalid_argument for a missing user id, a missing file or an unsupported
// extension; std::runtime_error when the copy or the record cannot be stored.
[[nodiscard]] UploadResponse run_upload_pipeline(const UploadRequest& req,
                                                 const StoragePaths& paths,
                                                 core::Services& services,
                                                 core::IIdGenerator& id_gen, core::IClock& clock);

// ────────────────────────────────────────────────────────────────
// Optimize Pipeline
// ────────────────────────────────────────────────────────────────

struct OptimizeRequest {
  std::string resume_id;                // NOLINT(readability-identifier-naming)
  std::string user_id;                  // NOLINT(readability-identifier-naming)
  std::string job_description;          // NOLINT(readability-identifier-naming)
  bool render_pdf{true};                // NOLINT(readability-identifier-naming)
  std::optional<std::string> trace_id;  // NOLINT(readability-identifier-naming)
};

struct OptimizeReport {
  bool success{false};                                 // NOLINT(readability-identifier-naming)
  int keywords_added{0};                               // NOLINT(readability-identifier-naming)
  std::optional<std::string> output_path;              // NOLINT(readability-identifier-naming)
  std::optional<std::string> pdf_path;                 // NOLINT(readability-identifier-naming)
  std::optional<std::string> pdf_error;                // NOLINT(readability-identifier-naming)
  std::optional<std::string> error;                    // NOLINT(readability-identifier-naming)
  std::string trace_id;                                // NOLINT(readability-identifier-naming)
  std::vector<std::string> missing_keywords;           // NOLINT(readability-identifier-naming)
  std::vector<optimize::ParagraphChange> change_log;   // NOLINT(readability-identifier-naming)
};

// Optimize a stored resume against a job description.
//
// The record moves to processing, the document is read, rebuilt and written to
// optimized_dir as "<resume_id><ext>", and the record ends as completed (with
// keywords_added and optimized_path) or failed (with last_error). Engine input/output errors
// and unreadable documents are reported in OptimizeReport::error, never thrown.
// When render_pdf is set and renderer is non-null, "<resume_id>.pdf" is rendered next to the
// output; a render failure is recorded in pdf_error and does not fail the run.
// Emits audit events: OptimizeStarted, KeywordsAnalyzed, OptimizeCompleted | OptimizeFailed,
// PdfRendered | PdfRenderFailed
// Throws std::invalid_argument when the resume does not exist, belongs to another user, or
// is not in a state that can start processing.
[[nodiscard]] OptimizeReport run_optimize_pipeline(const OptimizeRequest& req,
                                                   const optimize::OptimizationEngine& engine,
                                                   const render::IPdfRenderer* renderer,
                                                   const StoragePaths& paths,
                                                   core::Services& services,
                                                   core::IIdGenerator& id_gen,
                                                   core::IClock& clock);

// ────────────────────────────────────────────────────────────────
// Status and Audit Trace
// ────────────────────────────────────────────────────────────────

// Fetch a resume record. When user_id is given the record must belong to that user.
[[nodiscard]] std::optional<domain::ResumeRecord> fetch_resume_status(
    const core::ResumeId& resume_id, const std::optional<core::UserId>& user_id,
    core::Services& services);

// Fetch all audit events for a given trace_id
[[nodiscard]] std::vector<storage::AuditEvent> fetch_audit_trace(const std::string& trace_id,
                                                                 core::Services& services);

// JSON form of an OptimizeReport for CLI output (keys sorted).
[[nodiscard]] std::string to_json(const OptimizeReport& report);

}  // namespace rsopt::app
