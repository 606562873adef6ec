#include "rsopt/optimize/section_classifier.h"

#include "rsopt/core/normalization.h"

#include <array>
#include <string>

namespace rsopt::optimize {

using domain::SectionType;

namespace {

// Lowercased, trimmed, trailing colons stripped.
std::string header_form(const std::string_view text) {
  std::string form = core::normalize_ascii_lower(core::collapse_whitespace(text));
  while (!form.empty() && (form.back() == ':' || form.back() == ' ')) {
    form.pop_back();
  }
  return form;
}

bool starts_with_word(const std::string_view text, const std::string_view prefix) {
  if (prefix.empty() || !text.starts_with(prefix)) {
    return false;
  }
  return text.size() == prefix.size() || !core::is_ascii_alnum(text[prefix.size()]);
}

}  // namespace

SectionClassifier::SectionClassifier(const std::map<SectionType, SectionProfile>& profiles)
    : profiles_(profiles) {}

std::optional<SectionType> SectionClassifier::header_section(const std::string_view text) const {
  if (core::count_words(text) == 0 || core::count_words(text) > kMaxHeaderWords) {
    return std::nullopt;
  }

  const std::string form = header_form(text);
  for (const auto& [section, profile] : profiles_) {
    for (const auto& keyword : profile.header_keywords) {
      if (starts_with_word(form, keyword)) {
        return section;
      }
    }
  }
  return std::nullopt;
}

SectionType SectionClassifier::classify(const std::string_view text) const {
  if (const auto header = header_section(text); header.has_value()) {
    return header.value();
  }

  for (const auto& [section, profile] : profiles_) {
    for (const auto& keyword : profile.header_keywords) {
      if (core::contains_phrase_ci(text, keyword)) {
        return section;
      }
    }
  }

  static constexpr std::array<SectionType, 3> kCueOrder = {
      SectionType::kProjects, SectionType::kExperience, SectionType::kEducation};
  for (const SectionType section : kCueOrder) {
    const auto it = profiles_.find(section);
    if (it == profiles_.end()) {
      continue;
    }
    for (const auto& cue : it->second.content_cues) {
      if (core::contains_phrase_ci(text, cue)) {
        return section;
      }
    }
  }

  return SectionType::kOther;
}

}  // namespace rsopt::optimize
