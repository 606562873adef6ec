#pragma once

#include "rsopt/domain/section_type.h"
#include "rsopt/optimize/optimizer_config.h"

#include <cstddef>
#include <map>
#include <optional>
#include <string_view>

namespace rsopt::optimize {

// SectionClassifier maps paragraph text to a SectionType using the SectionProfile table.
// It is a pure function of its input; the running "current section" belongs to the
// DocumentRebuilder.
class SectionClassifier {
 public:
  static constexpr std::size_t kMaxHeaderWords = 5;

  explicit SectionClassifier(const std::map<domain::SectionType, SectionProfile>& profiles);

  // header_section returns the section when text is a header: at most kMaxHeaderWords words
  // and its lowercase form equals, or starts at a word boundary with, a header keyword.
  // A trailing ':' is ignored.
  [[nodiscard]] std::optional<domain::SectionType> header_section(std::string_view text) const;

  [[nodiscard]] bool is_header(std::string_view text) const {
    return header_section(text).has_value();
  }

  // classify: header match, then header-keyword containment anywhere in the text, then
  // content cues (projects, experience, education order), else kOther.
  [[nodiscard]] domain::SectionType classify(std::string_view text) const;

 private:
  const std::map<domain::SectionType, SectionProfile>& profiles_;
};

}  // namespace rsopt::optimize
