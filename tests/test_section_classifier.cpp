#include "rsopt/optimize/optimizer_config.h"
#include "rsopt/optimize/section_classifier.h"

#include <catch2/catch_test_macros.hpp>

using namespace rsopt;
using domain::SectionType;

namespace {

struct ClassifierFixture {
  optimize::OptimizerConfig config = optimize::default_optimizer_config();
  optimize::SectionClassifier classifier{config.profiles};
};

}  // namespace

TEST_CASE("SectionClassifier recognises headers", "[optimize][classifier]") {
  ClassifierFixture f;

  CHECK(f.classifier.header_section("SKILLS") == SectionType::kSkills);
  CHECK(f.classifier.header_section("Technical Skills:") == SectionType::kSkills);
  CHECK(f.classifier.header_section("Professional Experience") == SectionType::kExperience);
  CHECK(f.classifier.header_section("  Education  ") == SectionType::kEducation);
  CHECK(f.classifier.header_section("Projects") == SectionType::kProjects);
  CHECK(f.classifier.header_section("Summary") == SectionType::kSummary);
  CHECK(f.classifier.header_section("Certifications") == SectionType::kCertifications);
  CHECK(f.classifier.header_section("Honors & Awards") == SectionType::kAwards);
}

TEST_CASE("SectionClassifier rejects non-headers", "[optimize][classifier]") {
  ClassifierFixture f;

  SECTION("too many words") {
    CHECK_FALSE(f.classifier.is_header("Skills-based hiring is a trend that keeps growing"));
  }

  SECTION("keyword prefix without a word boundary") {
    CHECK_FALSE(f.classifier.is_header("Experienced engineer"));
  }

  SECTION("empty") {
    CHECK_FALSE(f.classifier.is_header(""));
    CHECK_FALSE(f.classifier.is_header("   "));
  }
}

TEST_CASE("SectionClassifier falls back to content cues", "[optimize][classifier]") {
  ClassifierFixture f;

  CHECK(f.classifier.classify("Developed a REST service in Go") == SectionType::kProjects);
  CHECK(f.classifier.classify("Managed a group of five engineers") == SectionType::kExperience);
  CHECK(f.classifier.classify("Bachelor of Science, State University") ==
        SectionType::kEducation);
  CHECK(f.classifier.classify("Enjoys hiking and photography") == SectionType::kOther);
}

TEST_CASE("SectionClassifier uses header keywords found inside text", "[optimize][classifier]") {
  ClassifierFixture f;
  CHECK(f.classifier.classify("A short overview of my career so far in six lines") ==
        SectionType::kSummary);
}

TEST_CASE("SectionClassifier follows a custom profile table", "[optimize][classifier]") {
  auto config = optimize::default_optimizer_config();
  config.profiles[SectionType::kSkills].header_keywords.push_back("toolbox");
  const optimize::SectionClassifier classifier(config.profiles);

  CHECK(classifier.header_section("Toolbox") == SectionType::kSkills);
}
