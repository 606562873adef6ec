#pragma once

#include "rsopt/domain/section_type.h"

#include <cstddef>
#include <map>
#include <string>
#include <vector>

namespace rsopt::optimize {

// SectionProfile is the table row that drives classification, phrasing and budgets for one
// section. Heuristics live here as data so they can be tested and extended without touching
// control flow.
struct SectionProfile {
  std::vector<std::string> header_keywords;  // lowercase; matched at the start of short lines
  std::vector<std::string> content_cues;     // lowercase; verbs/nouns typical of the content
  std::vector<std::string> templates;        // "{kw}" is replaced by the keyword
  std::size_t budget{0};                     // max insertions per section occurrence

  bool operator==(const SectionProfile&) const = default;
};

struct OptimizerConfig {
  std::size_t global_keyword_ceiling{15};
  double density_limit{0.03};
  std::size_t min_job_description_length{50};
  std::size_t jd_top_k{50};
  std::size_t resume_top_k{30};
  std::size_t max_missing_keywords{40};
  std::size_t prediction_top_k{5};
  bool enable_prediction{true};
  // Caps the section budget for content paragraphs before the first header (name, contact
  // line). 0 leaves them untouched.
  std::size_t pre_header_budget{0};
  std::map<domain::SectionType, SectionProfile> profiles;

  // Profile for a section; sections missing from the map get an empty profile (budget 0).
  [[nodiscard]] const SectionProfile& profile(domain::SectionType section) const;

  bool operator==(const OptimizerConfig&) const = default;
};

// Profiles for every SectionType with the default header keywords, cues, templates and
// budgets (skills 8, experience 5, projects 4, summary 3, other 2, the rest 0).
[[nodiscard]] std::map<domain::SectionType, SectionProfile> default_section_profiles();

[[nodiscard]] OptimizerConfig default_optimizer_config();

// Keys in the JSON form are sorted alphabetically; output is deterministic.
[[nodiscard]] std::string to_json(const OptimizerConfig& config);

// config_from_json overlays the JSON document onto default_optimizer_config().
// Absent keys keep their defaults; unknown keys are ignored.
// Throws std::runtime_error on malformed JSON, wrong value types or unknown section names.
[[nodiscard]] OptimizerConfig config_from_json(const std::string& json_str);

}  // namespace rsopt::optimize
