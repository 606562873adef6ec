#include "status.h"

#include "common.h"
#include "rsopt/app/app_service.h"
#include "rsopt/core/ids.h"
#include "rsopt/core/services.h"
#include "rsopt/prediction/mask_predictor.h"
#include "rsopt/storage/sqlite/sqlite_audit_log.h"
#include "rsopt/storage/sqlite/sqlite_resume_record_store.h"

#include "shared/arg_parser.h"
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

struct StatusConfig {
  rsopt::cli::CommonConfig common;
  std::optional<std::string> user_id;
};

}  // namespace

int cmd_status(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  std::vector<rsopt::apps::Option<StatusConfig>> options = {
      {"--user", true, "Require the record to belong to this user",
       [](StatusConfig& c, const std::string& v) {
         c.user_id = v;
         return !v.empty();
       }},
  };
  rsopt::cli::add_common_options(options);

  const auto parsed = rsopt::apps::parse_options(argc, argv, options, 2);
  if (!rsopt::cli::report_parse_errors(parsed)) {
    return 1;
  }
  if (parsed.positionals.size() != 1) {
    std::cerr << "Usage: rsopt_cli status <resume-id> [--user <user-id>]\n"
              << rsopt::apps::format_options(options);
    return 1;
  }

  try {
    auto db = rsopt::cli::open_database(parsed.config.common.db_path);
    rsopt::storage::sqlite::SqliteResumeRecordStore records(db);
    rsopt::storage::sqlite::SqliteAuditLog audit_log(db);
    rsopt::prediction::NullMaskPredictor predictor;
    rsopt::core::Services services{records, audit_log, predictor};

    std::optional<rsopt::core::UserId> user_id;
    if (parsed.config.user_id.has_value()) {
      user_id = rsopt::core::UserId{parsed.config.user_id.value()};
    }

    const rsopt::core::ResumeId resume_id{parsed.positionals.front()};
    const auto record = rsopt::app::fetch_resume_status(resume_id, user_id, services);
    if (!record.has_value()) {
      std::cerr << "Error: Resume not found: " << resume_id.value << "\n";
      return 1;
    }
    std::cout << rsopt::domain::to_json(record.value()) << "\n";
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << "\n";
    return 1;
  }

  return 0;
}
