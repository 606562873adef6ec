#include "rsopt/optimize/optimizer_config.h"

#include <nlohmann/json.hpp>

#include <stdexcept>

namespace rsopt::optimize {

using domain::SectionType;

const SectionProfile& OptimizerConfig::profile(const SectionType section) const {
  static const SectionProfile kEmptyProfile{};
  const auto it = profiles.find(section);
  return it != profiles.end() ? it->second : kEmptyProfile;
}

std::map<SectionType, SectionProfile> default_section_profiles() {
  std::map<SectionType, SectionProfile> profiles;

  profiles[SectionType::kSummary] = SectionProfile{
      {"summary", "professional summary", "career summary", "overview", "profile",
       "professional profile", "objective", "career objective", "about me"},
      {},
      {"Skilled in {kw}.", "Experienced with {kw} in professional settings.",
       "Brings practical experience applying {kw} to solve business problems."},
      3};

  profiles[SectionType::kSkills] = SectionProfile{
      {"skills", "technical skills", "core skills", "key skills", "skill set", "competencies",
       "core competencies", "technologies", "tech stack", "technical proficiencies",
       "expertise", "tools"},
      {},
      {"Proficient in {kw}.", "Hands-on proficiency with {kw}.",
       "Applied working knowledge of {kw} across multiple projects."},
      8};

  profiles[SectionType::kExperience] = SectionProfile{
      {"experience", "work experience", "professional experience", "relevant experience",
       "employment", "employment history", "work history", "career history"},
      {"managed", "led", "supervised", "coordinated", "oversaw", "mentored"},
      {"Utilized {kw} for development.", "Leveraged {kw} to deliver production features.",
       "Applied {kw} to improve the delivery and maintainability of team systems."},
      5};

  profiles[SectionType::kProjects] = SectionProfile{
      {"projects", "personal projects", "key projects", "selected projects",
       "academic projects", "portfolio"},
      {"developed", "built", "implemented", "designed", "created", "prototyped"},
      {"Built with {kw}.", "Implemented key components using {kw}.",
       "Integrated {kw} into the project architecture to extend its capabilities."},
      4};

  profiles[SectionType::kEducation] = SectionProfile{
      {"education", "academic background", "academics", "qualifications"},
      {"degree", "university", "college", "bachelor", "master", "diploma", "gpa"},
      {"Coursework included {kw}."},
      0};

  profiles[SectionType::kAwards] = SectionProfile{
      {"awards", "honors", "honours", "achievements", "accomplishments"}, {}, {}, 0};

  profiles[SectionType::kCertifications] = SectionProfile{
      {"certifications", "certificates", "licenses", "credentials"}, {}, {}, 0};

  profiles[SectionType::kOther] = SectionProfile{{}, {}, {"Familiar with {kw}."}, 2};

  return profiles;
}

OptimizerConfig default_optimizer_config() {
  OptimizerConfig config;
  config.profiles = default_section_profiles();
  return config;
}

std::string to_json(const OptimizerConfig& config) {
  using json = nlohmann::json;

  json sections = json::object();
  for (const auto& [section, profile] : config.profiles) {
    sections[domain::to_string(section)] = {
        {"budget", profile.budget},
        {"content_cues", profile.content_cues},
        {"header_keywords", profile.header_keywords},
        {"templates", profile.templates},
    };
  }

  json j;
  j["density_limit"] = config.density_limit;
  j["enable_prediction"] = config.enable_prediction;
  j["global_keyword_ceiling"] = config.global_keyword_ceiling;
  j["jd_top_k"] = config.jd_top_k;
  j["max_missing_keywords"] = config.max_missing_keywords;
  j["min_job_description_length"] = config.min_job_description_length;
  j["pre_header_budget"] = config.pre_header_budget;
  j["prediction_top_k"] = config.prediction_top_k;
  j["resume_top_k"] = config.resume_top_k;
  j["sections"] = sections;
  return j.dump();
}

OptimizerConfig config_from_json(const std::string& json_str) {
  using json = nlohmann::json;

  json j;
  try {
    j = json::parse(json_str);
  } catch (const json::parse_error& e) {
    throw std::runtime_error(std::string("Invalid optimizer config JSON: ") + e.what());
  }
  if (!j.is_object()) {
    throw std::runtime_error("Optimizer config must be a JSON object");
  }

  OptimizerConfig config = default_optimizer_config();
  try {
    config.global_keyword_ceiling =
        j.value("global_keyword_ceiling", config.global_keyword_ceiling);
    config.density_limit = j.value("density_limit", config.density_limit);
    config.min_job_description_length =
        j.value("min_job_description_length", config.min_job_description_length);
    config.jd_top_k = j.value("jd_top_k", config.jd_top_k);
    config.resume_top_k = j.value("resume_top_k", config.resume_top_k);
    config.max_missing_keywords = j.value("max_missing_keywords", config.max_missing_keywords);
    config.prediction_top_k = j.value("prediction_top_k", config.prediction_top_k);
    config.enable_prediction = j.value("enable_prediction", config.enable_prediction);
    config.pre_header_budget = j.value("pre_header_budget", config.pre_header_budget);

    if (j.contains("sections")) {
      for (const auto& [name, section_json] : j.at("sections").items()) {
        const auto section = domain::parse_section_type(name);
        if (!section.has_value()) {
          throw std::runtime_error("Unknown section in optimizer config: " + name);
        }
        SectionProfile& profile = config.profiles[section.value()];
        profile.budget = section_json.value("budget", profile.budget);
        profile.header_keywords = section_json.value("header_keywords", profile.header_keywords);
        profile.content_cues = section_json.value("content_cues", profile.content_cues);
        profile.templates = section_json.value("templates", profile.templates);
      }
    }
  } catch (const json::type_error& e) {
    throw std::runtime_error(std::string("Invalid optimizer config value: ") + e.what());
  }

  if (config.density_limit <= 0.0) {
    throw std::runtime_error("density_limit must be positive");
  }

  return config;
}

}  // namespace rsopt::optimize
