#pragma once

#include <string>
#include <vector>

namespace rsopt::storage {

// AuditEvent is one step of a pipeline run. Events sharing a trace_id form the run's trail;
// payload is a JSON object, refs are the ids of the entities the step touched.
struct AuditEvent {
  std::string event_id;
  std::string trace_id;
  std::string event_type;
  std::string payload;
  std::string created_at;
  std::vector<std::string> refs;

  bool operator==(const AuditEvent&) const = default;
};

// Event types emitted by the application pipelines.
namespace audit_events {
inline constexpr const char* kUploadRegistered = "UploadRegistered";
inline constexpr const char* kOptimizeStarted = "OptimizeStarted";
inline constexpr const char* kKeywordsAnalyzed = "KeywordsAnalyzed";
inline constexpr const char* kOptimizeCompleted = "OptimizeCompleted";
inline constexpr const char* kOptimizeFailed = "OptimizeFailed";
inline constexpr const char* kPdfRendered = "PdfRendered";
inline constexpr const char* kPdfRenderFailed = "PdfRenderFailed";
}  // namespace audit_events

}  // namespace rsopt::storage
