#include "rsopt/domain/run_state.h"
#include "rsopt/optimize/contextual_enhancer.h"
#include "rsopt/optimize/optimizer_config.h"
#include "rsopt/prediction/mask_predictor.h"

#include <catch2/catch_test_macros.hpp>

#include <string>
#include <string_view>

using namespace rsopt;
using domain::SectionType;

namespace {

std::string long_paragraph(std::size_t n) {
  std::string out = "Delivered";
  for (std::size_t i = 1; i < n; ++i) {
    out += " work";
  }
  return out + ".";
}

class TimingOutPredictor final : public prediction::IMaskPredictor {
 public:
  [[nodiscard]] prediction::Prediction predict(std::string_view /* context */,
                                               std::size_t /* top_k */) const override {
    return prediction::Prediction::err(
        {prediction::PredictionErrorKind::kTimeout, "no answer after 5000 ms"});
  }
};

}  // namespace

TEST_CASE("ContextualEnhancer appends a templated sentence", "[optimize][enhancer]") {
  const auto config = optimize::default_optimizer_config();
  const optimize::ContextualEnhancer enhancer(config, nullptr);
  domain::OptimizationRunState state;

  const auto result =
      enhancer.enhance("Built internal tools for the sales team", "Docker",
                       SectionType::kExperience, state);

  REQUIRE(result.inserted);
  CHECK_FALSE(result.used_prediction);
  CHECK(result.text == "Built internal tools for the sales team. Utilized Docker for development.");
  CHECK(state.keywords_added_count == 1);
  CHECK(state.section_keywords_used == 1);
  CHECK(state.is_processed("DOCKER"));
}

TEST_CASE("ContextualEnhancer picks the template by paragraph length", "[optimize][enhancer]") {
  CHECK(optimize::ContextualEnhancer::template_index(3, 0) == 0);
  CHECK(optimize::ContextualEnhancer::template_index(3, 19) == 0);
  CHECK(optimize::ContextualEnhancer::template_index(3, 20) == 1);
  CHECK(optimize::ContextualEnhancer::template_index(3, 95) == 2);
  CHECK(optimize::ContextualEnhancer::template_index(1, 95) == 0);

  const auto config = optimize::default_optimizer_config();
  const optimize::ContextualEnhancer enhancer(config, nullptr);
  domain::OptimizationRunState state;

  const std::string paragraph = long_paragraph(45);
  const auto result = enhancer.enhance(paragraph, "Kafka", SectionType::kProjects, state);
  REQUIRE(result.inserted);
  CHECK(result.text == paragraph +
                           " Integrated Kafka into the project architecture to extend its "
                           "capabilities.");
}

TEST_CASE("ContextualEnhancer refuses unsuitable insertions", "[optimize][enhancer]") {
  const auto config = optimize::default_optimizer_config();
  const optimize::ContextualEnhancer enhancer(config, nullptr);
  domain::OptimizationRunState state;

  SECTION("keyword already present") {
    const auto result =
        enhancer.enhance("Shipped services on docker", "Docker", SectionType::kExperience, state);
    CHECK_FALSE(result.inserted);
    CHECK(result.text == "Shipped services on docker");
  }

  SECTION("empty paragraph") {
    CHECK_FALSE(enhancer.enhance("   ", "Docker", SectionType::kExperience, state).inserted);
  }

  SECTION("density limit") {
    CHECK_FALSE(
        enhancer.enhance(long_paragraph(20), "Docker", SectionType::kExperience, state).inserted);
  }

  CHECK(state.keywords_added_count == 0);
  CHECK(state.processed_keywords.empty());
}

TEST_CASE("ContextualEnhancer falls back to generic templates", "[optimize][enhancer]") {
  const auto config = optimize::default_optimizer_config();
  const optimize::ContextualEnhancer enhancer(config, nullptr);
  domain::OptimizationRunState state;

  const auto result = enhancer.enhance("Dean's list", "Docker", SectionType::kAwards, state);
  REQUIRE(result.inserted);
  CHECK(result.text == "Dean's list. Familiar with Docker.");
}

TEST_CASE("ContextualEnhancer uses predicted lead words", "[optimize][enhancer]") {
  const auto config = optimize::default_optimizer_config();
  domain::OptimizationRunState state;

  SECTION("usable prediction") {
    const prediction::DeterministicStubMaskPredictor predictor({"leveraging"});
    const optimize::ContextualEnhancer enhancer(config, &predictor);
    const auto result =
        enhancer.enhance("Built billing services", "Kafka", SectionType::kExperience, state);
    REQUIRE(result.inserted);
    CHECK(result.used_prediction);
    CHECK(result.text == "Built billing services. Leveraging Kafka.");
  }

  SECTION("unusable candidates fall back to templates") {
    const prediction::DeterministicStubMaskPredictor predictor({"a", "the", "kafka", "built"});
    const optimize::ContextualEnhancer enhancer(config, &predictor);
    const auto result =
        enhancer.enhance("Built billing services", "Kafka", SectionType::kExperience, state);
    REQUIRE(result.inserted);
    CHECK_FALSE(result.used_prediction);
    CHECK(result.text == "Built billing services. Utilized Kafka for development.");
  }

  SECTION("prediction disabled in config") {
    auto no_prediction = config;
    no_prediction.enable_prediction = false;
    const prediction::DeterministicStubMaskPredictor predictor({"leveraging"});
    const optimize::ContextualEnhancer enhancer(no_prediction, &predictor);
    const auto result =
        enhancer.enhance("Built billing services", "Kafka", SectionType::kExperience, state);
    CHECK_FALSE(result.used_prediction);
  }

  SECTION("unavailable predictor") {
    const prediction::NullMaskPredictor predictor;
    const optimize::ContextualEnhancer enhancer(config, &predictor);
    const auto result =
        enhancer.enhance("Built billing services", "Kafka", SectionType::kExperience, state);
    REQUIRE(result.inserted);
    CHECK_FALSE(result.used_prediction);
    CHECK_FALSE(result.prediction_error.has_value());
  }

  SECTION("failing predictor is reported and templates take over") {
    const TimingOutPredictor predictor;
    const optimize::ContextualEnhancer enhancer(config, &predictor);
    const auto result =
        enhancer.enhance("Built billing services", "Kafka", SectionType::kExperience, state);
    REQUIRE(result.inserted);
    CHECK_FALSE(result.used_prediction);
    CHECK(result.text == "Built billing services. Utilized Kafka for development.");
    REQUIRE(result.prediction_error.has_value());
    CHECK(result.prediction_error.value() ==
          "mask prediction failed (timeout): no answer after 5000 ms");
  }
}

TEST_CASE("ContextualEnhancer detects list delimiters", "[optimize][enhancer]") {
  using optimize::ContextualEnhancer;

  CHECK(ContextualEnhancer::list_delimiter("Python | Java") == " | ");
  CHECK(ContextualEnhancer::list_delimiter("Python, Java") == ", ");
  CHECK(ContextualEnhancer::list_delimiter("Python; Java") == "; ");
  CHECK(ContextualEnhancer::list_delimiter("Python \xE2\x80\xA2 Java") == " \xE2\x80\xA2 ");
  CHECK(ContextualEnhancer::list_delimiter("Python Java Go") == ", ");
  CHECK_FALSE(ContextualEnhancer::list_delimiter(
                  "I enjoy building reliable systems for customers every day.")
                  .has_value());
}

TEST_CASE("ContextualEnhancer appends to skill lists", "[optimize][enhancer]") {
  const auto config = optimize::default_optimizer_config();
  const optimize::ContextualEnhancer enhancer(config, nullptr);
  domain::OptimizationRunState state;

  CHECK(enhancer.append_to_list("Python | Java | Git", "Docker", state).text ==
        "Python | Java | Git | Docker");
  CHECK(enhancer.append_to_list("Python, Java.", "Rust", state).text == "Python, Java, Rust");
  CHECK(enhancer.append_to_list("Python | Java |", "Helm", state).text ==
        "Python | Java | Helm");
  CHECK(state.keywords_added_count == 3);

  const auto prose = enhancer.append_to_list(
      "I enjoy building reliable systems for customers every day.", "Kafka", state);
  CHECK_FALSE(prose.inserted);
  CHECK(state.keywords_added_count == 3);
}
