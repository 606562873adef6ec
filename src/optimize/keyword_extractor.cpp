#include "rsopt/optimize/keyword_extractor.h"

#include "rsopt/core/normalization.h"

#include <algorithm>
#include <map>
#include <set>
#include <string>

namespace rsopt::optimize {

namespace {

const std::set<std::string>& stop_words() {
  static const std::set<std::string> kStopWords = {
      // English
      "a", "about", "above", "across", "after", "again", "against", "all", "almost", "also",
      "although", "always", "am", "among", "an", "and", "another", "any", "are", "around",
      "as", "at", "be", "became", "because", "been", "before", "being", "below", "between",
      "both", "but", "by", "can", "cannot", "could", "did", "do", "does", "doing", "done",
      "down", "during", "each", "either", "else", "enough", "etc", "even", "ever", "every",
      "few", "for", "from", "further", "get", "give", "had", "has", "have", "having", "he",
      "her", "here", "hers", "herself", "him", "himself", "his", "how", "however", "i", "if",
      "in", "into", "is", "it", "its", "itself", "just", "least", "less", "many", "may", "me",
      "might", "mine", "more", "most", "much", "must", "my", "myself", "neither", "no", "nor",
      "not", "now", "of", "off", "often", "on", "once", "one", "only", "or", "other", "others",
      "otherwise", "our", "ours", "ourselves", "out", "over", "own", "per", "perhaps", "please",
      "rather", "same", "several", "she", "should", "since", "so", "some", "such", "than",
      "that", "the", "their", "theirs", "them", "themselves", "then", "there", "these", "they",
      "this", "those", "though", "through", "throughout", "thus", "to", "together", "too",
      "toward", "towards", "under", "until", "up", "upon", "us", "very", "via", "was", "we",
      "well", "were", "what", "whatever", "when", "where", "whether", "which", "while", "who",
      "whole", "whom", "whose", "why", "will", "with", "within", "without", "would", "yet",
      "you", "your", "yours", "yourself", "yourselves",
      // Resume and job posting filler
      "ability", "able", "candidate", "candidates", "company", "currently", "desired",
      "duties", "excellent", "experience", "experienced", "familiar", "familiarity", "good",
      "great", "ideal", "including", "join", "knowledge", "like", "looking", "new", "plus",
      "position", "preferred", "proven", "required", "requirements", "responsibilities",
      "responsible", "role", "seeking", "skills", "strong", "team", "teams", "understanding",
      "use", "used", "using", "various", "work", "worked", "working", "year", "years",
  };
  return kStopWords;
}

bool is_segment_boundary(const std::string_view text, const std::size_t i) {
  const char ch = text[i];
  switch (ch) {
    case ',':
    case ';':
    case ':':
    case '!':
    case '?':
    case '(':
    case ')':
    case '[':
    case ']':
    case '{':
    case '}':
    case '|':
    case '"':
    case '*':
    case '\n':
    case '\r':
      return true;
    default:
      break;
  }
  // Bullets and other non-ASCII bytes.
  if (static_cast<unsigned char>(ch) >= 0x80) {
    return true;
  }
  const bool at_end = i + 1 == text.size();
  const bool next_space = !at_end && core::is_ascii_space(text[i + 1]);
  const bool prev_space = i == 0 || core::is_ascii_space(text[i - 1]);
  // Sentence-ending period; "Node.js" and "3.5" stay intact.
  if (ch == '.' && (at_end || next_space)) {
    return true;
  }
  // Separating slash ("Docker / Kubernetes"); "CI/CD" stays intact.
  if (ch == '/' && (prev_space || next_space || at_end)) {
    return true;
  }
  return false;
}

std::vector<std::string> split_segments(const std::string_view text) {
  std::vector<std::string> segments;
  std::string current;
  for (std::size_t i = 0; i < text.size(); ++i) {
    if (is_segment_boundary(text, i)) {
      if (!current.empty()) {
        segments.push_back(std::move(current));
        current.clear();
      }
    } else {
      current.push_back(text[i]);
    }
  }
  if (!current.empty()) {
    segments.push_back(std::move(current));
  }
  return segments;
}

// clean_token strips decorative punctuation while keeping technical spellings such as
// "C++", "C#" and ".NET".
std::string clean_token(const std::string_view raw) {
  std::size_t start = 0;
  while (start < raw.size()) {
    const char ch = raw[start];
    const bool dotted_name =
        ch == '.' && start + 1 < raw.size() && core::is_ascii_alpha(raw[start + 1]);
    if (core::is_ascii_alnum(ch) || dotted_name) {
      break;
    }
    ++start;
  }
  std::size_t end = raw.size();
  while (end > start) {
    const char ch = raw[end - 1];
    if (core::is_ascii_alnum(ch) || ch == '+' || ch == '#') {
      break;
    }
    --end;
  }
  return std::string{raw.substr(start, end - start)};
}

bool is_identifier_like(const std::string_view word) {
  if (word.empty()) {
    return false;
  }
  if (!core::is_ascii_alnum(word.front()) && word.front() != '.') {
    return false;
  }
  for (const char ch : word) {
    const bool allowed = core::is_ascii_alnum(ch) || ch == '+' || ch == '#' || ch == '.' ||
                         ch == '/' || ch == '-';
    if (!allowed) {
      return false;
    }
  }
  return true;
}

bool has_letter(const std::string_view text) {
  return std::any_of(text.begin(), text.end(), [](char ch) { return core::is_ascii_alpha(ch); });
}

struct Candidate {
  std::string text;
  std::size_t count{0};
  std::size_t first_position{0};
};

}  // namespace

bool is_stop_word(const std::string_view word) {
  return stop_words().contains(core::normalize_ascii_lower(word));
}

bool is_url_fragment(const std::string_view token) {
  const std::string lowered = core::normalize_ascii_lower(token);
  if (lowered.find("://") != std::string::npos || lowered.starts_with("http") ||
      lowered.starts_with("www.")) {
    return true;
  }
  static const std::vector<std::string> kDomainSuffixes = {".com", ".org", ".io", ".edu",
                                                           ".gov", ".co"};
  for (const auto& suffix : kDomainSuffixes) {
    const std::size_t pos = lowered.find(suffix);
    if (pos != std::string::npos && pos > 0) {
      const std::size_t after = pos + suffix.size();
      if (after == lowered.size() || lowered[after] == '/') {
        return true;
      }
    }
  }
  return false;
}

bool is_valid_keyword(const std::string_view keyword) {
  if (keyword.size() < 2 || !has_letter(keyword) || is_url_fragment(keyword)) {
    return false;
  }
  const auto words = core::split_words(keyword);
  if (words.empty()) {
    return false;
  }
  return std::all_of(words.begin(), words.end(),
                     [](const std::string& w) { return is_identifier_like(w); });
}

std::vector<domain::Keyword> KeywordExtractor::extract(const std::string_view text,
                                                       const std::size_t top_k) const {
  const std::string collapsed = core::collapse_whitespace(text);
  std::size_t visible_chars = 0;
  for (const char ch : collapsed) {
    if (ch != ' ') {
      ++visible_chars;
    }
  }
  if (visible_chars < kMinTextLength || top_k == 0) {
    return {};
  }

  // Segments are split from the original text so newlines still act as boundaries.
  std::map<std::string, Candidate> candidates;
  std::size_t token_index = 0;

  for (const auto& segment : split_segments(text)) {
    // Runs of consecutive usable tokens; an unusable token breaks the run.
    std::vector<std::vector<std::string>> runs(1);
    for (const auto& raw : core::split_words(segment)) {
      std::string token = clean_token(raw);
      if (token.empty() || !has_letter(token) || !is_identifier_like(token) ||
          is_url_fragment(token)) {
        if (!runs.back().empty()) {
          runs.emplace_back();
        }
        continue;
      }
      runs.back().push_back(std::move(token));
    }

    for (const auto& run : runs) {
      for (std::size_t start = 0; start < run.size(); ++start) {
        const std::size_t position = token_index + start;
        std::string surface;
        for (std::size_t n = 1; n <= kMaxNgram && start + n <= run.size(); ++n) {
          const std::string& word = run[start + n - 1];
          if (is_stop_word(word)) {
            break;  // every longer n-gram from this start contains it too
          }
          if (n > 1) {
            surface.push_back(' ');
          }
          surface += word;
          if (!is_valid_keyword(surface)) {
            continue;
          }

          const std::string key = core::normalize_ascii_lower(surface);
          auto [it, inserted] = candidates.try_emplace(key);
          if (inserted) {
            it->second.text = surface;
            it->second.first_position = position * kMaxNgram + (n - 1);
          }
          ++it->second.count;
        }
      }
      token_index += run.size();
    }
  }

  std::vector<domain::Keyword> keywords;
  keywords.reserve(candidates.size());
  for (auto& [key, candidate] : candidates) {
    keywords.push_back(
        domain::Keyword{std::move(candidate.text), key, candidate.count, candidate.first_position});
  }

  // First-occurrence order, then a stable sort by count keeps that order among ties.
  std::sort(keywords.begin(), keywords.end(),
            [](const domain::Keyword& a, const domain::Keyword& b) {
              return a.first_position < b.first_position;
            });
  std::stable_sort(keywords.begin(), keywords.end(),
                   [](const domain::Keyword& a, const domain::Keyword& b) {
                     return a.count > b.count;
                   });

  if (keywords.size() > top_k) {
    keywords.resize(top_k);
  }
  return keywords;
}

}  // namespace rsopt::optimize
