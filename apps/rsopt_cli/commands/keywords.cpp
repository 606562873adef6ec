#include "keywords.h"

#include "common.h"
#include "rsopt/domain/keyword.h"
#include "rsopt/optimize/keyword_extractor.h"

#include <nlohmann/json.hpp>

#include "shared/arg_parser.h"
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

struct KeywordsConfig {
  rsopt::cli::CommonConfig common;
  std::optional<std::size_t> top_k;
};

}  // namespace

int cmd_keywords(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  std::vector<rsopt::apps::Option<KeywordsConfig>> options = {
      {"--top", true, "Number of keywords to print",
       [](KeywordsConfig& c, const std::string& v) {
         c.top_k = rsopt::cli::parse_count(v);
         return c.top_k.has_value();
       }},
  };
  rsopt::cli::add_common_options(options);

  const auto parsed = rsopt::apps::parse_options(argc, argv, options, 2);
  if (!rsopt::cli::report_parse_errors(parsed)) {
    return 1;
  }
  if (parsed.positionals.size() != 1) {
    std::cerr << "Usage: rsopt_cli keywords <file> [--top <k>]\n"
              << rsopt::apps::format_options(options);
    return 1;
  }

  try {
    const auto optimizer_config = rsopt::cli::load_optimizer_config(parsed.config.common.config_path);
    const std::string text = rsopt::cli::read_document_text(parsed.positionals.front());

    const rsopt::optimize::KeywordExtractor extractor;
    const auto keywords =
        extractor.extract(text, parsed.config.top_k.value_or(optimizer_config.jd_top_k));

    nlohmann::json out = nlohmann::json::array();
    for (const auto& kw : keywords) {
      out.push_back({{"keyword", kw.text},
                     {"count", kw.count},
                     {"technical", rsopt::domain::is_technical_keyword(kw.text)}});
    }
    std::cout << out.dump(2) << "\n";
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << "\n";
    return 1;
  }

  return 0;
}
