#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace rsopt::domain {

// Keyword is a 1-3 word term extracted from a text.
// text keeps the first-seen surface form for display; key is the lowercase comparison form.
struct Keyword {
  std::string text;
  std::string key;
  std::size_t count{0};
  std::size_t first_position{0};

  bool operator==(const Keyword&) const = default;
};

// is_known_technology reports membership in the curated technology/role vocabulary.
// Multi-word keywords match when any of their words is known.
[[nodiscard]] bool is_known_technology(std::string_view keyword);

// is_acronym: 2-5 ASCII letters, all uppercase (e.g. "AWS", "REST").
[[nodiscard]] bool is_acronym(std::string_view keyword);

// is_technical_keyword is the relevance predicate used by gap analysis:
// curated vocabulary, OR contains a digit (versions such as "C++20", "Python 3"),
// OR an uppercase acronym, OR longer than 3 characters as the fallback.
[[nodiscard]] bool is_technical_keyword(std::string_view keyword);

[[nodiscard]] std::vector<std::string> keyword_texts(const std::vector<Keyword>& keywords);

}  // namespace rsopt::domain
