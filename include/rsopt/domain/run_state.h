#pragma once

#include "rsopt/domain/section_type.h"

#include <cstddef>
#include <set>
#include <string>
#include <string_view>

namespace rsopt::domain {

// OptimizationRunState is the bookkeeping of a single optimization run.
// It is created fresh for every document and never shared between runs, so two resumes
// optimized in parallel cannot observe each other's processed keywords.
struct OptimizationRunState {
  std::set<std::string> processed_keywords;  // lowercase keys
  std::size_t keywords_added_count{0};
  std::size_t section_keywords_used{0};
  SectionType current_section{SectionType::kOther};

  [[nodiscard]] bool is_processed(std::string_view keyword) const;

  // Records a successful insertion: marks the keyword and bumps both counters.
  void record_insertion(std::string_view keyword);

  // Header paragraphs switch the section and reset its insertion count.
  void enter_section(SectionType section);
};

}  // namespace rsopt::domain
