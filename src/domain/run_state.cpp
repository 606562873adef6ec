#include "rsopt/domain/run_state.h"

#include "rsopt/core/normalization.h"

namespace rsopt::domain {

bool OptimizationRunState::is_processed(const std::string_view keyword) const {
  return processed_keywords.contains(core::normalize_ascii_lower(keyword));
}

void OptimizationRunState::record_insertion(const std::string_view keyword) {
  processed_keywords.insert(core::normalize_ascii_lower(keyword));
  ++keywords_added_count;
  ++section_keywords_used;
}

void OptimizationRunState::enter_section(const SectionType section) {
  current_section = section;
  section_keywords_used = 0;
}

}  // namespace rsopt::domain
