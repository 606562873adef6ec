#include "audit.h"

#include "common.h"
#include "rsopt/app/app_service.h"
#include "rsopt/core/services.h"
#include "rsopt/prediction/mask_predictor.h"
#include "rsopt/storage/sqlite/sqlite_audit_log.h"
#include "rsopt/storage/sqlite/sqlite_resume_record_store.h"

#include <nlohmann/json.hpp>

#include "shared/arg_parser.h"
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

struct AuditConfig {
  rsopt::cli::CommonConfig common;
};

nlohmann::json event_to_json(const rsopt::storage::AuditEvent& event) {
  nlohmann::json out;
  out["event_id"] = event.event_id;
  out["trace_id"] = event.trace_id;
  out["event_type"] = event.event_type;
  out["created_at"] = event.created_at;
  out["refs"] = event.refs;
  // Payloads are JSON documents; keep them structured when they parse.
  auto payload = nlohmann::json::parse(event.payload, nullptr, false);
  out["payload"] = payload.is_discarded() ? nlohmann::json(event.payload) : payload;
  return out;
}

}  // namespace

int cmd_audit(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  std::vector<rsopt::apps::Option<AuditConfig>> options;
  rsopt::cli::add_common_options(options);

  const auto parsed = rsopt::apps::parse_options(argc, argv, options, 2);
  if (!rsopt::cli::report_parse_errors(parsed)) {
    return 1;
  }
  if (parsed.positionals.size() > 1) {
    std::cerr << "Usage: rsopt_cli audit [<trace-id>]\n" << rsopt::apps::format_options(options);
    return 1;
  }

  try {
    auto db = rsopt::cli::open_database(parsed.config.common.db_path);
    rsopt::storage::sqlite::SqliteResumeRecordStore records(db);
    rsopt::storage::sqlite::SqliteAuditLog audit_log(db);
    rsopt::prediction::NullMaskPredictor predictor;
    rsopt::core::Services services{records, audit_log, predictor};

    if (parsed.positionals.empty()) {
      nlohmann::json out = services.audit_log.list_trace_ids();
      std::cout << out.dump(2) << "\n";
      return 0;
    }

    const auto& trace_id = parsed.positionals.front();
    const auto events = rsopt::app::fetch_audit_trace(trace_id, services);
    if (events.empty()) {
      std::cerr << "Error: No audit events for trace: " << trace_id << "\n";
      return 1;
    }

    nlohmann::json out = nlohmann::json::array();
    for (const auto& event : events) {
      out.push_back(event_to_json(event));
    }
    std::cout << out.dump(2) << "\n";
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << "\n";
    return 1;
  }

  return 0;
}
