#include "shared/arg_parser.h"

#include <catch2/catch_test_macros.hpp>

#include <string>
#include <utility>
#include <vector>

using namespace rsopt;

namespace {

struct TestConfig {
  std::string user;
  int top{20};
  bool no_pdf{false};
};

std::vector<apps::Option<TestConfig>> test_options() {
  return {
      {"--user", true, "Owner", [](TestConfig& c, const std::string& v) {
         c.user = v;
         return !v.empty();
       }},
      {"--top", true, "Result count", [](TestConfig& c, const std::string& v) {
         if (v.empty() || v.find_first_not_of("0123456789") != std::string::npos) {
           return false;
         }
         c.top = std::stoi(v);
         return true;
       }},
      {"--no-pdf", false, "Skip PDF", [](TestConfig& c, const std::string&) {
         c.no_pdf = true;
         return true;
       }},
  };
}

// argv as the parser sees it; the vector owns the strings.
struct Argv {
  explicit Argv(std::vector<std::string> args) : storage(std::move(args)) {
    for (auto& arg : storage) {
      pointers.push_back(arg.data());
    }
  }
  int argc() const { return static_cast<int>(pointers.size()); }
  char** argv() { return pointers.data(); }

  std::vector<std::string> storage;
  std::vector<char*> pointers;
};

}  // namespace

TEST_CASE("parse_options fills the config", "[cli][args]") {
  Argv args({"rsopt_cli", "optimize", "resume-1", "--user", "alice", "--no-pdf", "--top", "5"});
  const auto parsed = apps::parse_options(args.argc(), args.argv(), test_options(), 2);

  REQUIRE(parsed.ok());
  CHECK(parsed.config.user == "alice");
  CHECK(parsed.config.top == 5);
  CHECK(parsed.config.no_pdf);
  CHECK(parsed.positionals == std::vector<std::string>{"resume-1"});
}

TEST_CASE("parse_options collects errors", "[cli][args]") {
  SECTION("unknown option") {
    Argv args({"rsopt_cli", "--verbose"});
    const auto parsed = apps::parse_options(args.argc(), args.argv(), test_options());
    REQUIRE(parsed.errors.size() == 1);
    CHECK(parsed.errors[0] == "Unknown option: --verbose");
  }

  SECTION("missing value") {
    Argv args({"rsopt_cli", "--user"});
    const auto parsed = apps::parse_options(args.argc(), args.argv(), test_options());
    REQUIRE(parsed.errors.size() == 1);
    CHECK(parsed.errors[0] == "Option --user requires a value");
  }

  SECTION("rejected value") {
    Argv args({"rsopt_cli", "--top", "many"});
    const auto parsed = apps::parse_options(args.argc(), args.argv(), test_options());
    REQUIRE_FALSE(parsed.ok());
    CHECK(parsed.errors[0] == "Invalid value for --top: many");
    CHECK(parsed.config.top == 20);
  }

  SECTION("a lone dash is positional") {
    Argv args({"rsopt_cli", "-"});
    const auto parsed = apps::parse_options(args.argc(), args.argv(), test_options());
    CHECK(parsed.ok());
    CHECK(parsed.positionals == std::vector<std::string>{"-"});
  }
}

TEST_CASE("format_options lists every flag", "[cli][args]") {
  const std::string usage = apps::format_options(test_options());
  CHECK(usage.find("--user <value>") != std::string::npos);
  CHECK(usage.find("--no-pdf") != std::string::npos);
  CHECK(usage.find("Result count") != std::string::npos);
}
