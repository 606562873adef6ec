#include "gap.h"

#include "common.h"
#include "rsopt/core/normalization.h"
#include "rsopt/domain/keyword.h"
#include "rsopt/optimize/optimization_engine.h"

#include <nlohmann/json.hpp>

#include "shared/arg_parser.h"
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

struct GapConfig {
  rsopt::cli::CommonConfig common;
  std::optional<std::string> jd_text;
  std::optional<std::string> jd_file;
};

}  // namespace

int cmd_gap(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  std::vector<rsopt::apps::Option<GapConfig>> options = {
      {"--jd", true, "Job description text",
       [](GapConfig& c, const std::string& v) {
         c.jd_text = v;
         return true;
       }},
      {"--jd-file", true, "File containing the job description",
       [](GapConfig& c, const std::string& v) {
         c.jd_file = v;
         return !v.empty();
       }},
  };
  rsopt::cli::add_common_options(options);

  const auto parsed = rsopt::apps::parse_options(argc, argv, options, 2);
  if (!rsopt::cli::report_parse_errors(parsed)) {
    return 1;
  }
  if (parsed.positionals.size() != 1) {
    std::cerr << "Usage: rsopt_cli gap <resume-file> (--jd <text> | --jd-file <path>)\n"
              << rsopt::apps::format_options(options);
    return 1;
  }

  try {
    const auto job_description =
        rsopt::cli::resolve_job_description(parsed.config.jd_text, parsed.config.jd_file);
    const auto resume_text = rsopt::cli::read_document_text(parsed.positionals.front());

    const rsopt::optimize::OptimizationEngine engine(
        rsopt::cli::load_optimizer_config(parsed.config.common.config_path));
    if (rsopt::core::normalize_text(job_description).size() <
        engine.config().min_job_description_length) {
      throw std::invalid_argument("Job description is too short");
    }
    const auto missing = engine.missing_keywords(resume_text, job_description);

    nlohmann::json out;
    out["missing_keywords"] = rsopt::domain::keyword_texts(missing);
    out["count"] = missing.size();
    std::cout << out.dump(2) << "\n";
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << "\n";
    return 1;
  }

  return 0;
}
