#include "rsopt/core/normalization.h"

#include <catch2/catch_test_macros.hpp>

#include <string>
#include <vector>

using namespace rsopt;

TEST_CASE("normalize_text strips disallowed characters and collapses whitespace",
          "[core][normalization]") {
  CHECK(core::normalize_text("  Hello,   World!  C++ ") == "Hello World C++");
  CHECK(core::normalize_text("C#\t.NET\n\nnode-js") == "C# .NET node-js");
  CHECK(core::normalize_text("") == "");
  CHECK(core::normalize_text("!!! ???") == "");
}

TEST_CASE("normalize_text is idempotent", "[core][normalization]") {
  const std::vector<std::string> samples = {
      "Senior Engineer (Python/Go) -- remote!",
      "  \xE2\x80\xA2 Built   CI/CD pipelines; cut deploy time 40%  ",
      "C++20, C#, .NET & Node.js",
      "",
  };
  for (const auto& sample : samples) {
    const std::string once = core::normalize_text(sample);
    CHECK(core::normalize_text(once) == once);
  }
}

TEST_CASE("count_words ignores delimiter-only tokens", "[core][normalization]") {
  CHECK(core::count_words("Python | Java | Git") == 3);
  CHECK(core::count_words("  one two  ") == 2);
  CHECK(core::count_words("") == 0);
}

TEST_CASE("count_phrase_ci matches on word boundaries", "[core][normalization]") {
  CHECK(core::count_phrase_ci("Java and JavaScript, java.", "java") == 2);
  CHECK(core::count_phrase_ci("Used C++ and c++ daily", "C++") == 2);
  CHECK(core::count_phrase_ci("anything", "") == 0);
  CHECK(core::contains_phrase_ci("Deployed with Kubernetes", "kubernetes"));
  CHECK_FALSE(core::contains_phrase_ci("Golang services", "go"));
}

TEST_CASE("comparison_key keeps lowercase alphanumerics only", "[core][normalization]") {
  CHECK(core::comparison_key("Built with Go!") == "builtwithgo");
  CHECK(core::comparison_key("Built  with go") == core::comparison_key("built with Go."));
}
