#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace rsopt::core {

// Deterministic ASCII-only text utilities shared by every optimization stage.
// All functions are pure and locale-independent: A-Z / a-z / 0-9 are classified by explicit
// range checks (no std::isalpha / std::tolower), so output is byte-stable across platforms.

inline bool is_ascii_alpha(const char ch) {
  return (ch >= 'a' && ch <= 'z') || (ch >= 'A' && ch <= 'Z');
}

inline bool is_ascii_digit(const char ch) { return ch >= '0' && ch <= '9'; }

inline bool is_ascii_alnum(const char ch) { return is_ascii_alpha(ch) || is_ascii_digit(ch); }

inline bool is_ascii_space(const char ch) {
  return ch == ' ' || ch == '\t' || ch == '\n' || ch == '\r' || ch == '\f' || ch == '\v';
}

// normalize_ascii_lower converts ASCII uppercase (A-Z) to lowercase (a-z).
// Non-ASCII bytes are preserved unchanged.
inline std::string normalize_ascii_lower(const std::string_view input) {
  std::string result;
  result.reserve(input.size());

  for (const char ch : input) {
    if (ch >= 'A' && ch <= 'Z') {
      constexpr char kCaseOffset = 'a' - 'A';
      result.push_back(static_cast<char>(ch + kCaseOffset));
    } else {
      result.push_back(ch);
    }
  }

  return result;
}

// trim removes leading and trailing ASCII whitespace.
inline std::string trim(const std::string_view input) {
  std::size_t start = 0;
  while (start < input.size() && is_ascii_space(input[start])) {
    ++start;
  }

  std::size_t end = input.size();
  while (end > start && is_ascii_space(input[end - 1])) {
    --end;
  }

  return std::string{input.substr(start, end - start)};
}

// collapse_whitespace replaces every whitespace run with a single space and trims the ends.
// Unlike normalize_text it keeps all other characters.
inline std::string collapse_whitespace(const std::string_view input) {
  std::string result;
  result.reserve(input.size());

  bool pending_space = false;
  for (const char ch : input) {
    if (is_ascii_space(ch)) {
      pending_space = !result.empty();
      continue;
    }
    if (pending_space) {
      result.push_back(' ');
      pending_space = false;
    }
    result.push_back(ch);
  }

  return result;
}

// normalize_text is the canonical text normalizer:
// - deletes characters outside the whitelist (ASCII alphanumerics, whitespace, + # . -)
// - collapses whitespace runs to a single space
// - strips leading/trailing whitespace
// Idempotent: normalize_text(normalize_text(x)) == normalize_text(x).
inline std::string normalize_text(const std::string_view input) {
  std::string filtered;
  filtered.reserve(input.size());

  for (const char ch : input) {
    if (is_ascii_alnum(ch) || is_ascii_space(ch) || ch == '+' || ch == '#' || ch == '.' ||
        ch == '-') {
      filtered.push_back(ch);
    }
  }

  return collapse_whitespace(filtered);
}

// split_words splits on ASCII whitespace. Punctuation stays attached to its word.
inline std::vector<std::string> split_words(const std::string_view input) {
  std::vector<std::string> words;
  std::string current;

  for (const char ch : input) {
    if (is_ascii_space(ch)) {
      if (!current.empty()) {
        words.push_back(std::move(current));
        current.clear();
      }
    } else {
      current.push_back(ch);
    }
  }
  if (!current.empty()) {
    words.push_back(std::move(current));
  }

  return words;
}

// count_words counts whitespace-separated tokens that contain at least one alphanumeric
// character, so list delimiters such as "|" or "-" are not counted as words.
inline std::size_t count_words(const std::string_view input) {
  std::size_t count = 0;
  bool in_token = false;
  bool token_has_alnum = false;

  for (const char ch : input) {
    if (is_ascii_space(ch)) {
      if (in_token && token_has_alnum) {
        ++count;
      }
      in_token = false;
      token_has_alnum = false;
    } else {
      in_token = true;
      token_has_alnum = token_has_alnum || is_ascii_alnum(ch);
    }
  }
  if (in_token && token_has_alnum) {
    ++count;
  }

  return count;
}

// count_phrase_ci counts case-insensitive occurrences of phrase in text that sit on word
// boundaries (the neighbouring characters are not alphanumeric). Empty phrase counts as 0.
inline std::size_t count_phrase_ci(const std::string_view text, const std::string_view phrase) {
  if (phrase.empty() || phrase.size() > text.size()) {
    return 0;
  }

  const std::string haystack = normalize_ascii_lower(text);
  const std::string needle = normalize_ascii_lower(phrase);

  std::size_t count = 0;
  std::size_t pos = haystack.find(needle);
  while (pos != std::string::npos) {
    const std::size_t end = pos + needle.size();
    const bool left_ok = pos == 0 || !is_ascii_alnum(haystack[pos - 1]) ||
                         !is_ascii_alnum(needle.front());
    const bool right_ok = end == haystack.size() || !is_ascii_alnum(haystack[end]) ||
                          !is_ascii_alnum(needle.back());
    if (left_ok && right_ok) {
      ++count;
    }
    pos = haystack.find(needle, pos + 1);
  }

  return count;
}

// contains_phrase_ci reports whether phrase occurs in text on word boundaries, ignoring case.
inline bool contains_phrase_ci(const std::string_view text, const std::string_view phrase) {
  return count_phrase_ci(text, phrase) > 0;
}

// comparison_key lowercases and drops everything except ASCII alphanumerics.
// Two sentences with equal keys are considered near-identical.
inline std::string comparison_key(const std::string_view input) {
  std::string key;
  key.reserve(input.size());
  for (const char ch : input) {
    if (is_ascii_digit(ch) || (ch >= 'a' && ch <= 'z')) {
      key.push_back(ch);
    } else if (ch >= 'A' && ch <= 'Z') {
      constexpr char kCaseOffset = 'a' - 'A';
      key.push_back(static_cast<char>(ch + kCaseOffset));
    }
  }
  return key;
}

}  // namespace rsopt::core
