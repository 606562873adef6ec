#include "rsopt/optimize/optimizer_config.h"

#include <catch2/catch_test_macros.hpp>

#include <stdexcept>

using namespace rsopt;
using domain::SectionType;

TEST_CASE("Default optimizer configuration", "[optimize][config]") {
  const auto config = optimize::default_optimizer_config();

  CHECK(config.global_keyword_ceiling == 15);
  CHECK(config.density_limit == 0.03);
  CHECK(config.min_job_description_length == 50);
  CHECK(config.pre_header_budget == 0);
  CHECK(config.profile(SectionType::kSkills).budget == 8);
  CHECK(config.profile(SectionType::kExperience).budget == 5);
  CHECK(config.profile(SectionType::kProjects).budget == 4);
  CHECK(config.profile(SectionType::kSummary).budget == 3);
  CHECK(config.profile(SectionType::kOther).budget == 2);
  CHECK(config.profile(SectionType::kEducation).budget == 0);

  for (const auto section : domain::kAllSectionTypes) {
    CHECK(config.profiles.contains(section));
  }
}

TEST_CASE("Missing profiles read as empty", "[optimize][config]") {
  optimize::OptimizerConfig config;
  CHECK(config.profile(SectionType::kSkills).budget == 0);
  CHECK(config.profile(SectionType::kSkills).templates.empty());
}

TEST_CASE("config_from_json overlays the defaults", "[optimize][config]") {
  const auto config = optimize::config_from_json(R"({
    "global_keyword_ceiling": 5,
    "enable_prediction": false,
    "pre_header_budget": 1,
    "unknown_setting": 1,
    "sections": {"skills": {"budget": 2, "templates": ["Uses {kw}."]}}
  })");

  CHECK(config.global_keyword_ceiling == 5);
  CHECK_FALSE(config.enable_prediction);
  CHECK(config.pre_header_budget == 1);
  CHECK(config.density_limit == 0.03);
  CHECK(config.profile(SectionType::kSkills).budget == 2);
  CHECK(config.profile(SectionType::kSkills).templates == std::vector<std::string>{"Uses {kw}."});
  CHECK(config.profile(SectionType::kSkills).header_keywords ==
        optimize::default_optimizer_config().profile(SectionType::kSkills).header_keywords);
  CHECK(config.profile(SectionType::kExperience).budget == 5);
}

TEST_CASE("to_json output loads back to the same configuration", "[optimize][config]") {
  auto config = optimize::default_optimizer_config();
  config.density_limit = 0.05;
  config.profiles[SectionType::kAwards].budget = 1;

  CHECK(optimize::config_from_json(optimize::to_json(config)) == config);
}

TEST_CASE("config_from_json rejects bad documents", "[optimize][config]") {
  CHECK_THROWS_AS(optimize::config_from_json("{not json"), std::runtime_error);
  CHECK_THROWS_AS(optimize::config_from_json("[1, 2]"), std::runtime_error);
  CHECK_THROWS_AS(optimize::config_from_json(R"({"global_keyword_ceiling": "many"})"),
                  std::runtime_error);
  CHECK_THROWS_AS(optimize::config_from_json(R"({"sections": {"hobbies": {"budget": 1}}})"),
                  std::runtime_error);
  CHECK_THROWS_AS(optimize::config_from_json(R"({"density_limit": 0})"), std::runtime_error);
}
