#pragma once

#include <cstddef>
#include <string_view>

namespace rsopt::optimize {

// DensityGuard bounds how often a keyword may appear in the block being edited.
// Call it before every insertion attempt: the block grows as keywords are added.
class DensityGuard {
 public:
  // Blocks shorter than this are too small to measure and always allow insertion.
  static constexpr std::size_t kMinMeasurableWords = 10;

  // keyword_density = case-insensitive, word-bounded occurrences / words (0 for empty text).
  [[nodiscard]] static double keyword_density(std::string_view text_block,
                                              std::string_view keyword);

  // allows_insertion is true when the block has fewer than kMinMeasurableWords words, or when
  // one more occurrence keeps (occurrences + 1) / (words + keyword words) under limit.
  [[nodiscard]] static bool allows_insertion(std::string_view text_block,
                                             std::string_view keyword, double limit);
};

}  // namespace rsopt::optimize
