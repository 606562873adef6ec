#include "rsopt/storage/sqlite/sqlite_audit_log.h"

#include <nlohmann/json.hpp>

#include <sqlite3.h>

namespace rsopt::storage::sqlite {

SqliteAuditLog::SqliteAuditLog(std::shared_ptr<SqliteDb> db) : db_(std::move(db)) {}

void SqliteAuditLog::append(const AuditEvent& event) {
  const int idx = next_index(event.trace_id);
  const nlohmann::json refs_json = event.refs;
  const std::string refs = refs_json.dump();

  const char* sql = R"(
    INSERT INTO audit_events
      (event_id, trace_id, event_type, payload, created_at, entity_ids_json, idx)
    VALUES (?, ?, ?, ?, ?, ?, ?)
  )";

  PreparedStatement stmt(db_->connection(), sql);
  if (!stmt.is_valid()) {
    record_failure(event, stmt.error());
    return;
  }

  sqlite3_bind_text(stmt.get(), 1, event.event_id.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt.get(), 2, event.trace_id.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt.get(), 3, event.event_type.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt.get(), 4, event.payload.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt.get(), 5, event.created_at.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt.get(), 6, refs.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_int(stmt.get(), 7, idx);

  if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
    record_failure(event, db_->last_error());
  }
}

void SqliteAuditLog::record_failure(const AuditEvent& event, const std::string& reason) {
  std::lock_guard<std::mutex> lock(mutex_);
  ++failed_appends_;
  last_error_ = "failed to record audit event " + event.event_type + ": " + reason;
}

std::size_t SqliteAuditLog::failed_appends() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return failed_appends_;
}

std::optional<std::string> SqliteAuditLog::last_error() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return last_error_;
}

std::vector<AuditEvent> SqliteAuditLog::query(const std::string& trace_id) const {
  const std::string sql =
      std::string("SELECT event_id, trace_id, event_type, payload, created_at, entity_ids_json"
                  "  FROM audit_events") +
      (trace_id.empty() ? " ORDER BY rowid" : " WHERE trace_id = ? ORDER BY idx");

  PreparedStatement stmt(db_->connection(), sql);
  if (!stmt.is_valid()) {
    return {};
  }
  if (!trace_id.empty()) {
    sqlite3_bind_text(stmt.get(), 1, trace_id.c_str(), -1, SQLITE_TRANSIENT);
  }

  std::vector<AuditEvent> result;
  while (sqlite3_step(stmt.get()) == SQLITE_ROW) {
    AuditEvent event;
    event.event_id = reinterpret_cast<const char*>(sqlite3_column_text(stmt.get(), 0));
    event.trace_id = reinterpret_cast<const char*>(sqlite3_column_text(stmt.get(), 1));
    event.event_type = reinterpret_cast<const char*>(sqlite3_column_text(stmt.get(), 2));
    event.payload = reinterpret_cast<const char*>(sqlite3_column_text(stmt.get(), 3));
    event.created_at = reinterpret_cast<const char*>(sqlite3_column_text(stmt.get(), 4));

    const std::string refs_str =
        reinterpret_cast<const char*>(sqlite3_column_text(stmt.get(), 5));
    const nlohmann::json refs_json = nlohmann::json::parse(refs_str, nullptr, false);
    if (refs_json.is_array()) {
      event.refs = refs_json.get<std::vector<std::string>>();
    }

    result.push_back(std::move(event));
  }
  return result;
}

std::vector<std::string> SqliteAuditLog::list_trace_ids() const {
  PreparedStatement stmt(db_->connection(),
                         "SELECT DISTINCT trace_id FROM audit_events ORDER BY trace_id");
  if (!stmt.is_valid()) {
    return {};
  }

  std::vector<std::string> ids;
  while (sqlite3_step(stmt.get()) == SQLITE_ROW) {
    ids.emplace_back(reinterpret_cast<const char*>(sqlite3_column_text(stmt.get(), 0)));
  }
  return ids;
}

int SqliteAuditLog::next_index(const std::string& trace_id) {
  std::lock_guard<std::mutex> lock(mutex_);

  auto it = trace_indices_.find(trace_id);
  if (it != trace_indices_.end()) {
    return it->second++;
  }

  // First append for this trace in this process: continue after what the database holds.
  int max_idx = -1;
  PreparedStatement stmt(db_->connection(),
                         "SELECT MAX(idx) FROM audit_events WHERE trace_id = ?");
  if (stmt.is_valid()) {
    sqlite3_bind_text(stmt.get(), 1, trace_id.c_str(), -1, SQLITE_TRANSIENT);
    if (sqlite3_step(stmt.get()) == SQLITE_ROW &&
        sqlite3_column_type(stmt.get(), 0) != SQLITE_NULL) {
      max_idx = sqlite3_column_int(stmt.get(), 0);
    }
  }
  const int idx = max_idx + 1;
  trace_indices_[trace_id] = idx + 1;
  return idx;
}

}  // namespace rsopt::storage::sqlite
