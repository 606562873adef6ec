#include "rsopt/core/id_generator.h"
#include "rsopt/core/ids.h"

#include <catch2/catch_test_macros.hpp>

#include <set>
#include <string>

using namespace rsopt;

TEST_CASE("ID generators produce prefixed values", "[ids]") {
  SECTION("SystemIdGenerator produces unique IDs") {
    core::SystemIdGenerator gen;
    std::set<std::string> seen;
    for (int i = 0; i < 100; ++i) {
      const auto id = core::new_resume_id(gen);
      CHECK(id.value.starts_with("resume-"));
      seen.insert(id.value);
    }
    CHECK(seen.size() == 100);
  }

  SECTION("DeterministicIdGenerator counts from zero") {
    core::DeterministicIdGenerator gen;
    CHECK(core::new_resume_id(gen).value == "resume-0");
    CHECK(core::new_trace_id(gen).value == "trace-1");
    CHECK(gen.next("evt") == "evt-2");
  }

  SECTION("two deterministic generators agree") {
    core::DeterministicIdGenerator a;
    core::DeterministicIdGenerator b;
    CHECK(core::new_trace_id(a) == core::new_trace_id(b));
  }
}

TEST_CASE("Typed IDs compare by value", "[ids]") {
  CHECK(core::ResumeId{"resume-1"} == core::ResumeId{"resume-1"});
  CHECK(core::ResumeId{"resume-1"} < core::ResumeId{"resume-2"});
  CHECK(core::UserId{"alice"} != core::UserId{"bob"});
}
