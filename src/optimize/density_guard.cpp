#include "rsopt/optimize/density_guard.h"

#include "rsopt/core/normalization.h"

namespace rsopt::optimize {

double DensityGuard::keyword_density(const std::string_view text_block,
                                     const std::string_view keyword) {
  const std::size_t words = core::count_words(text_block);
  if (words == 0) {
    return 0.0;
  }
  return static_cast<double>(core::count_phrase_ci(text_block, keyword)) /
         static_cast<double>(words);
}

bool DensityGuard::allows_insertion(const std::string_view text_block,
                                    const std::string_view keyword, const double limit) {
  const std::size_t words = core::count_words(text_block);
  if (words < kMinMeasurableWords) {
    return true;
  }

  const std::size_t occurrences = core::count_phrase_ci(text_block, keyword);
  const std::size_t keyword_words = core::count_words(keyword);
  const double ratio = static_cast<double>(occurrences + 1) /
                       static_cast<double>(words + keyword_words);
  return ratio < limit;
}

}  // namespace rsopt::optimize
