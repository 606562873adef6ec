#pragma once

#include "rsopt/domain/keyword.h"

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace rsopt::optimize {

// is_stop_word: English stop words plus resume filler ("experience", "responsible", "team"...).
// Expects any case; comparison is case-insensitive.
[[nodiscard]] bool is_stop_word(std::string_view word);

// is_url_fragment detects bare links ("https://...", "www.example", "site.com").
[[nodiscard]] bool is_url_fragment(std::string_view token);

// is_valid_keyword is the extraction validity predicate: length >= 2, not purely numeric,
// not a URL fragment, and every word identifier-like ([A-Za-z0-9.] then [A-Za-z0-9+#./-]*).
[[nodiscard]] bool is_valid_keyword(std::string_view keyword);

// KeywordExtractor ranks 1-, 2- and 3-grams by raw occurrence count.
//
// Text is first split into phrase segments at punctuation boundaries so n-grams never span a
// comma or a sentence end. N-grams containing a stop word are dropped. Ties keep first
// occurrence order (position-major, shorter n-gram first). The display form of each keyword
// is its first-seen spelling; comparison uses the lowercase key.
//
// Stateless and const: one instance can serve concurrent runs.
class KeywordExtractor {
 public:
  static constexpr std::size_t kMaxNgram = 3;
  static constexpr std::size_t kMinTextLength = 10;

  // Returns at most top_k keywords, highest frequency first.
  // Input with fewer than kMinTextLength non-whitespace characters yields an empty list.
  [[nodiscard]] std::vector<domain::Keyword> extract(std::string_view text,
                                                     std::size_t top_k) const;
};

}  // namespace rsopt::optimize
