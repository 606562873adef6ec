#include "upload.h"

#include "common.h"
#include "rsopt/app/app_service.h"
#include "rsopt/core/clock.h"
#include "rsopt/core/id_generator.h"
#include "rsopt/core/services.h"
#include "rsopt/prediction/mask_predictor.h"
#include "rsopt/storage/sqlite/sqlite_audit_log.h"
#include "rsopt/storage/sqlite/sqlite_resume_record_store.h"

#include <nlohmann/json.hpp>

#include "shared/arg_parser.h"
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

struct UploadConfig {
  rsopt::cli::CommonConfig common;
  std::optional<std::string> user_id;
};

}  // namespace

int cmd_upload(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  std::vector<rsopt::apps::Option<UploadConfig>> options = {
      {"--user", true, "Owner of the uploaded resume",
       [](UploadConfig& c, const std::string& v) {
         c.user_id = v;
         return !v.empty();
       }},
  };
  rsopt::cli::add_common_options(options);

  const auto parsed = rsopt::apps::parse_options(argc, argv, options, 2);
  if (!rsopt::cli::report_parse_errors(parsed)) {
    return 1;
  }
  if (parsed.positionals.size() != 1 || !parsed.config.user_id.has_value()) {
    std::cerr << "Usage: rsopt_cli upload <file.docx|file.txt> --user <user-id>\n"
              << rsopt::apps::format_options(options);
    return 1;
  }
  const auto& config = parsed.config;

  try {
    auto db = rsopt::cli::open_database(config.common.db_path);
    rsopt::storage::sqlite::SqliteResumeRecordStore records(db);
    rsopt::storage::sqlite::SqliteAuditLog audit_log(db);
    rsopt::prediction::NullMaskPredictor predictor;
    rsopt::core::Services services{records, audit_log, predictor};

    rsopt::core::SystemIdGenerator id_gen;
    rsopt::core::SystemClock clock;

    const rsopt::app::UploadRequest req{parsed.positionals.front(), config.user_id.value(),
                                        std::nullopt};
    const auto response =
        rsopt::app::run_upload_pipeline(req, config.common.paths, services, id_gen, clock);

    nlohmann::json out;
    out["trace_id"] = response.trace_id;
    out["record"] = nlohmann::json::parse(rsopt::domain::to_json(response.record));
    std::cout << out.dump(2) << "\n";
    rsopt::cli::report_audit_failures(audit_log);
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << "\n";
    return 1;
  }

  return 0;
}
