#include "rsopt/storage/audit_log.h"
#include "rsopt/storage/sqlite/sqlite_audit_log.h"
#include "rsopt/storage/sqlite/sqlite_db.h"

#include <catch2/catch_test_macros.hpp>

#include <string>
#include <vector>

using namespace rsopt;

namespace {

std::shared_ptr<storage::sqlite::SqliteDb> open_memory_db() {
  auto db_result = storage::sqlite::SqliteDb::open(":memory:");
  REQUIRE(db_result.has_value());
  auto db = db_result.value();
  REQUIRE(db->ensure_schema_v1().has_value());
  return db;
}

}  // namespace

TEST_CASE("SqliteAuditLog append and query", "[sqlite][audit]") {
  auto db = open_memory_db();
  storage::sqlite::SqliteAuditLog audit_log(db);

  const std::string trace_id = "trace-001";
  audit_log.append({"evt-001", trace_id, "OptimizeStarted", R"({"resume_id":"resume-1"})",
                    "2026-01-01T00:00:00Z", {"resume-1"}});
  audit_log.append({"evt-002", trace_id, "KeywordsAnalyzed", R"({"missing_count":2})",
                    "2026-01-01T00:00:01Z", {}});
  audit_log.append({"evt-003", trace_id, "OptimizeCompleted", R"({"keywords_added":2})",
                    "2026-01-01T00:00:02Z", {"resume-1", "pdf-1"}});

  const auto events = audit_log.query(trace_id);
  REQUIRE(events.size() == 3);

  CHECK(events[0].event_id == "evt-001");
  CHECK(events[1].event_id == "evt-002");
  CHECK(events[2].event_id == "evt-003");

  CHECK(events[0].event_type == "OptimizeStarted");
  CHECK(events[1].payload == R"({"missing_count":2})");
  CHECK(events[1].refs.empty());
  REQUIRE(events[2].refs.size() == 2);
  CHECK(events[2].refs[1] == "pdf-1");
}

TEST_CASE("SqliteAuditLog multiple traces", "[sqlite][audit]") {
  auto db = open_memory_db();
  storage::sqlite::SqliteAuditLog audit_log(db);

  audit_log.append({"evt-1a", "trace-A", "Event1", "{}", "2026-01-01T00:00:00Z", {}});
  audit_log.append({"evt-1b", "trace-B", "Event1", "{}", "2026-01-01T00:00:00Z", {}});
  audit_log.append({"evt-2a", "trace-A", "Event2", "{}", "2026-01-01T00:00:01Z", {}});

  const auto events_a = audit_log.query("trace-A");
  REQUIRE(events_a.size() == 2);
  CHECK(events_a[0].event_id == "evt-1a");
  CHECK(events_a[1].event_id == "evt-2a");

  const auto events_b = audit_log.query("trace-B");
  REQUIRE(events_b.size() == 1);
  CHECK(events_b[0].event_id == "evt-1b");

  CHECK(audit_log.query("").size() == 3);
  CHECK(audit_log.query("trace-C").empty());

  const auto traces = audit_log.list_trace_ids();
  REQUIRE(traces.size() == 2);
  CHECK(traces[0] == "trace-A");
  CHECK(traces[1] == "trace-B");
}

TEST_CASE("SqliteAuditLog continues a trace after reopening the log", "[sqlite][audit]") {
  auto db = open_memory_db();
  {
    storage::sqlite::SqliteAuditLog first(db);
    first.append({"evt-1", "trace-A", "UploadRegistered", "{}", "2026-01-01T00:00:00Z", {}});
  }
  storage::sqlite::SqliteAuditLog second(db);
  second.append({"evt-2", "trace-A", "OptimizeStarted", "{}", "2026-01-01T00:00:01Z", {}});

  const auto events = second.query("trace-A");
  REQUIRE(events.size() == 2);
  CHECK(events[0].event_id == "evt-1");
  CHECK(events[1].event_id == "evt-2");
}

TEST_CASE("InMemoryAuditLog matches the SQLite ordering", "[audit]") {
  storage::InMemoryAuditLog audit_log;
  audit_log.append({"evt-1", "trace-B", "Event1", "{}", "2026-01-01T00:00:00Z", {}});
  audit_log.append({"evt-2", "trace-A", "Event1", "{}", "2026-01-01T00:00:00Z", {}});
  audit_log.append({"evt-3", "trace-B", "Event2", "{}", "2026-01-01T00:00:01Z", {}});

  const auto events = audit_log.query("trace-B");
  REQUIRE(events.size() == 2);
  CHECK(events[1].event_id == "evt-3");
  CHECK(audit_log.query("").size() == 3);
  CHECK(audit_log.list_trace_ids() == std::vector<std::string>{"trace-A", "trace-B"});
}

TEST_CASE("SqliteAuditLog keeps failed appends instead of throwing", "[sqlite][audit]") {
  auto db = open_memory_db();
  storage::sqlite::SqliteAuditLog audit_log(db);

  audit_log.append({"evt-1", "trace-A", "OptimizeStarted", "{}", "2026-01-01T00:00:00Z", {}});
  CHECK(audit_log.failed_appends() == 0);
  CHECK_FALSE(audit_log.last_error().has_value());

  REQUIRE(db->exec("DROP TABLE audit_events").has_value());
  audit_log.append({"evt-2", "trace-A", "OptimizeCompleted", "{}", "2026-01-01T00:00:01Z", {}});

  CHECK(audit_log.failed_appends() == 1);
  REQUIRE(audit_log.last_error().has_value());
  CHECK(audit_log.last_error()->find("OptimizeCompleted") != std::string::npos);
}
