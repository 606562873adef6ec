#include "rsopt/domain/section_type.h"

namespace rsopt::domain {

std::string to_string(const SectionType section) {
  switch (section) {
    case SectionType::kSummary:
      return "summary";
    case SectionType::kSkills:
      return "skills";
    case SectionType::kExperience:
      return "experience";
    case SectionType::kProjects:
      return "projects";
    case SectionType::kEducation:
      return "education";
    case SectionType::kAwards:
      return "awards";
    case SectionType::kCertifications:
      return "certifications";
    case SectionType::kOther:
      return "other";
  }
  return "other";
}

std::optional<SectionType> parse_section_type(const std::string_view name) {
  for (const SectionType section : kAllSectionTypes) {
    if (to_string(section) == name) {
      return section;
    }
  }
  return std::nullopt;
}

}  // namespace rsopt::domain
