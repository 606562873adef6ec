#pragma once

#include <array>
#include <optional>
#include <string>
#include <string_view>

namespace rsopt::domain {

// SectionType is recomputed per run from paragraph text; it is never persisted.
enum class SectionType {
  kSummary,
  kSkills,
  kExperience,
  kProjects,
  kEducation,
  kAwards,
  kCertifications,
  kOther,
};

inline constexpr std::array<SectionType, 8> kAllSectionTypes = {
    SectionType::kSummary,   SectionType::kSkills, SectionType::kExperience,
    SectionType::kProjects,  SectionType::kEducation, SectionType::kAwards,
    SectionType::kCertifications, SectionType::kOther,
};

[[nodiscard]] std::string to_string(SectionType section);

// Accepts the lowercase names produced by to_string.
[[nodiscard]] std::optional<SectionType> parse_section_type(std::string_view name);

}  // namespace rsopt::domain
