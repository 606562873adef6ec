#include "rsopt/optimize/keyword_extractor.h"

#include <catch2/catch_test_macros.hpp>

#include <algorithm>
#include <string>
#include <vector>

using namespace rsopt;

namespace {

bool has_key(const std::vector<domain::Keyword>& keywords, const std::string& key) {
  return std::any_of(keywords.begin(), keywords.end(),
                     [&](const domain::Keyword& k) { return k.key == key; });
}

}  // namespace

TEST_CASE("KeywordExtractor ranks by frequency and keeps first spelling", "[optimize][keywords]") {
  const optimize::KeywordExtractor extractor;
  const auto keywords = extractor.extract("Python python PYTHON developer", 10);

  REQUIRE_FALSE(keywords.empty());
  CHECK(keywords.front().key == "python");
  CHECK(keywords.front().text == "Python");
  CHECK(keywords.front().count == 3);
}

TEST_CASE("KeywordExtractor returns nothing for very short input", "[optimize][keywords]") {
  const optimize::KeywordExtractor extractor;
  CHECK(extractor.extract("C++ Go", 10).empty());
  CHECK(extractor.extract("   ", 10).empty());
  CHECK(extractor.extract("Kubernetes operators", 0).empty());
}

TEST_CASE("KeywordExtractor drops stop words and filler", "[optimize][keywords]") {
  const optimize::KeywordExtractor extractor;
  const auto keywords = extractor.extract("experience with the team and Docker containers", 20);

  CHECK(has_key(keywords, "docker"));
  CHECK(has_key(keywords, "docker containers"));
  CHECK_FALSE(has_key(keywords, "experience"));
  CHECK_FALSE(has_key(keywords, "team"));
  CHECK_FALSE(has_key(keywords, "the"));
}

TEST_CASE("KeywordExtractor does not form n-grams across punctuation", "[optimize][keywords]") {
  const optimize::KeywordExtractor extractor;
  const auto keywords = extractor.extract("Docker, Kubernetes; Terraform pipelines", 20);

  CHECK(has_key(keywords, "docker"));
  CHECK(has_key(keywords, "terraform pipelines"));
  CHECK_FALSE(has_key(keywords, "docker kubernetes"));
  CHECK_FALSE(has_key(keywords, "kubernetes terraform"));
}

TEST_CASE("KeywordExtractor keeps technical spellings", "[optimize][keywords]") {
  const optimize::KeywordExtractor extractor;
  const auto keywords = extractor.extract("Strong C++ and C# plus Node.js and CI/CD", 20);

  CHECK(has_key(keywords, "c++"));
  CHECK(has_key(keywords, "c#"));
  CHECK(has_key(keywords, "node.js"));
  CHECK(has_key(keywords, "ci/cd"));
}

TEST_CASE("KeywordExtractor skips URLs", "[optimize][keywords]") {
  const optimize::KeywordExtractor extractor;
  const auto keywords = extractor.extract("Visit https://example.com for details about Rust", 20);

  CHECK(has_key(keywords, "rust"));
  for (const auto& kw : keywords) {
    CHECK(kw.key.find("http") == std::string::npos);
    CHECK(kw.key.find("example") == std::string::npos);
  }
}

TEST_CASE("KeywordExtractor breaks ties by first occurrence", "[optimize][keywords]") {
  const optimize::KeywordExtractor extractor;
  const auto keywords = extractor.extract("Kafka Spark Airflow", 10);

  REQUIRE(keywords.size() == 6);
  CHECK(keywords[0].key == "kafka");
  CHECK(keywords[1].key == "kafka spark");
  CHECK(keywords[2].key == "kafka spark airflow");
  CHECK(keywords[3].key == "spark");
  CHECK(keywords[5].key == "airflow");

  const auto top2 = extractor.extract("Kafka Spark Airflow", 2);
  REQUIRE(top2.size() == 2);
  CHECK(top2[1].key == "kafka spark");
}

TEST_CASE("is_valid_keyword rejects numbers, URLs and short tokens", "[optimize][keywords]") {
  CHECK(optimize::is_valid_keyword("C++"));
  CHECK(optimize::is_valid_keyword("machine learning"));
  CHECK_FALSE(optimize::is_valid_keyword("42"));
  CHECK_FALSE(optimize::is_valid_keyword("a"));
  CHECK_FALSE(optimize::is_valid_keyword("www.example.com"));
  CHECK_FALSE(optimize::is_valid_keyword("foo@bar"));
}

TEST_CASE("is_technical_keyword", "[domain][keywords]") {
  CHECK(domain::is_technical_keyword("Kubernetes"));
  CHECK(domain::is_technical_keyword("Python 3"));
  CHECK(domain::is_technical_keyword("AWS"));
  CHECK(domain::is_technical_keyword("stakeholder"));
  CHECK_FALSE(domain::is_technical_keyword("key"));
  CHECK(domain::is_acronym("REST"));
  CHECK_FALSE(domain::is_acronym("Rest"));
}
