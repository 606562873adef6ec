#include "optimize.h"

#include "common.h"
#include "rsopt/app/app_service.h"
#include "rsopt/core/clock.h"
#include "rsopt/core/id_generator.h"
#include "rsopt/core/services.h"
#include "rsopt/optimize/optimization_engine.h"
#include "rsopt/prediction/caching_mask_predictor.h"
#include "rsopt/prediction/command_mask_predictor.h"
#include "rsopt/prediction/mask_predictor.h"
#include "rsopt/render/pdf_renderer.h"
#include "rsopt/storage/sqlite/sqlite_audit_log.h"
#include "rsopt/storage/sqlite/sqlite_resume_record_store.h"

#include "shared/arg_parser.h"
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

struct OptimizeConfig {
  rsopt::cli::CommonConfig common;
  std::optional<std::string> user_id;
  std::optional<std::string> jd_text;
  std::optional<std::string> jd_file;
  bool render_pdf{true};
  std::optional<std::string> predictor_cmd;
  std::string soffice_cmd{"soffice"};
};

}  // namespace

int cmd_optimize(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  std::vector<rsopt::apps::Option<OptimizeConfig>> options = {
      {"--user", true, "Owner of the resume",
       [](OptimizeConfig& c, const std::string& v) {
         c.user_id = v;
         return !v.empty();
       }},
      {"--jd", true, "Job description text",
       [](OptimizeConfig& c, const std::string& v) {
         c.jd_text = v;
         return true;
       }},
      {"--jd-file", true, "File containing the job description",
       [](OptimizeConfig& c, const std::string& v) {
         c.jd_file = v;
         return !v.empty();
       }},
      {"--no-pdf", false, "Skip PDF rendering",
       [](OptimizeConfig& c, const std::string&) {
         c.render_pdf = false;
         return true;
       }},
      {"--predictor-cmd", true, "Masked-language-model command for phrasing",
       [](OptimizeConfig& c, const std::string& v) {
         c.predictor_cmd = v;
         return !v.empty();
       }},
      {"--soffice-cmd", true, "LibreOffice executable (empty to disable)",
       [](OptimizeConfig& c, const std::string& v) {
         c.soffice_cmd = v;
         return true;
       }},
  };
  rsopt::cli::add_common_options(options);

  const auto parsed = rsopt::apps::parse_options(argc, argv, options, 2);
  if (!rsopt::cli::report_parse_errors(parsed)) {
    return 1;
  }
  const auto& config = parsed.config;
  if (parsed.positionals.size() != 1 || !config.user_id.has_value()) {
    std::cerr << "Usage: rsopt_cli optimize <resume-id> --user <user-id> "
                 "(--jd <text> | --jd-file <path>)\n"
              << rsopt::apps::format_options(options);
    return 1;
  }

  try {
    const auto job_description =
        rsopt::cli::resolve_job_description(config.jd_text, config.jd_file);
    const auto optimizer_config = rsopt::cli::load_optimizer_config(config.common.config_path);

    auto db = rsopt::cli::open_database(config.common.db_path);
    rsopt::storage::sqlite::SqliteResumeRecordStore records(db);
    rsopt::storage::sqlite::SqliteAuditLog audit_log(db);

    // Predictor: external command behind an LRU cache, or none.
    std::unique_ptr<rsopt::prediction::IMaskPredictor> command_predictor;
    std::unique_ptr<rsopt::prediction::IMaskPredictor> predictor;
    if (config.predictor_cmd.has_value()) {
      command_predictor = std::make_unique<rsopt::prediction::CommandMaskPredictor>(
          rsopt::prediction::CommandMaskPredictorOptions{config.predictor_cmd.value()});
      predictor = std::make_unique<rsopt::prediction::CachingMaskPredictor>(*command_predictor);
    } else {
      predictor = std::make_unique<rsopt::prediction::NullMaskPredictor>();
    }

    rsopt::core::Services services{records, audit_log, *predictor};
    const rsopt::optimize::OptimizationEngine engine(optimizer_config, &services.mask_predictor);
    const auto renderer = rsopt::render::make_default_render_chain(config.soffice_cmd);

    rsopt::core::SystemIdGenerator id_gen;
    rsopt::core::SystemClock clock;

    const rsopt::app::OptimizeRequest req{parsed.positionals.front(), config.user_id.value(),
                                          job_description, config.render_pdf, std::nullopt};
    const auto report = rsopt::app::run_optimize_pipeline(
        req, engine, renderer.get(), config.common.paths, services, id_gen, clock);

    std::cout << rsopt::app::to_json(report) << "\n";
    rsopt::cli::report_warnings(report);
    rsopt::cli::report_audit_failures(audit_log);
    if (!report.success) {
      std::cerr << "Error: " << report.error.value_or("optimization failed") << "\n";
      return 1;
    }
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << "\n";
    return 1;
  }

  return 0;
}
