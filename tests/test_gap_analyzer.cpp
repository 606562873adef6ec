#include "rsopt/optimize/gap_analyzer.h"
#include "rsopt/optimize/keyword_extractor.h"

#include <catch2/catch_test_macros.hpp>

#include <algorithm>
#include <set>
#include <string>

using namespace rsopt;

namespace {

constexpr const char* kJobDescription =
    "We need Docker and Kubernetes. Docker experience with Python and Kubernetes is key.";

bool has_key(const std::vector<domain::Keyword>& keywords, const std::string& key) {
  return std::any_of(keywords.begin(), keywords.end(),
                     [&](const domain::Keyword& k) { return k.key == key; });
}

}  // namespace

TEST_CASE("GapAnalyzer lists job keywords the resume lacks, most frequent first",
          "[optimize][gap]") {
  const optimize::KeywordExtractor extractor;
  const optimize::GapAnalyzer analyzer(extractor);

  const auto missing =
      analyzer.missing_keywords("Python developer with Git", kJobDescription, {}, 40);

  REQUIRE(missing.size() >= 2);
  CHECK(missing[0].key == "docker");
  CHECK(missing[1].key == "kubernetes");
  CHECK_FALSE(has_key(missing, "python"));
  CHECK_FALSE(has_key(missing, "key"));
}

TEST_CASE("GapAnalyzer honours already processed keywords and the limit", "[optimize][gap]") {
  const optimize::KeywordExtractor extractor;
  const optimize::GapAnalyzer analyzer(extractor);

  SECTION("processed keywords are excluded") {
    const std::set<std::string> processed = {"docker"};
    const auto missing =
        analyzer.missing_keywords("Python developer", kJobDescription, processed, 40);
    CHECK_FALSE(has_key(missing, "docker"));
    CHECK(has_key(missing, "kubernetes"));
  }

  SECTION("max_keywords truncates") {
    const auto missing = analyzer.missing_keywords("Python developer", kJobDescription, {}, 1);
    REQUIRE(missing.size() == 1);
    CHECK(missing[0].key == "docker");
  }

  SECTION("zero limit") {
    CHECK(analyzer.missing_keywords("Python developer", kJobDescription, {}, 0).empty());
  }
}

TEST_CASE("GapAnalyzer skips two-letter keys", "[optimize][gap]") {
  const optimize::KeywordExtractor extractor;
  const optimize::GapAnalyzer analyzer(extractor);

  const auto missing = analyzer.missing_keywords(
      "Java developer", "Go services. Go tooling. Go and gRPC. Go everywhere in Go.", {}, 40);
  CHECK_FALSE(has_key(missing, "go"));
  CHECK(has_key(missing, "grpc"));
}

TEST_CASE("GapAnalyzer treats verbatim resume mentions as covered", "[optimize][gap]") {
  const optimize::KeywordExtractor extractor;
  // Resume keyword set limited to one entry: Terraform falls outside it.
  const optimize::GapAnalyzer analyzer(extractor, optimize::GapAnalyzerOptions{50, 1});

  const auto missing = analyzer.missing_keywords(
      "Rust Rust Rust services and Terraform", "Terraform modules for Ansible. Terraform and Ansible.",
      {}, 40);
  CHECK_FALSE(has_key(missing, "terraform"));
  CHECK(has_key(missing, "ansible"));
}

TEST_CASE("GapAnalyzer::remaining filters processed keys in order", "[optimize][gap]") {
  const std::vector<domain::Keyword> candidates = {
      {"Docker", "docker", 2, 0}, {"Kafka", "kafka", 1, 3}, {"Helm", "helm", 1, 6}};
  const auto rest = optimize::GapAnalyzer::remaining(candidates, {"kafka"});

  REQUIRE(rest.size() == 2);
  CHECK(rest[0].key == "docker");
  CHECK(rest[1].key == "helm");
}
