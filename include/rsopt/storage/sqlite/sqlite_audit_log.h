#pragma once

#include "rsopt/storage/audit_log.h"
#include "rsopt/storage/sqlite/sqlite_db.h"

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace rsopt::storage::sqlite {

// SqliteAuditLog implements IAuditLog on the audit_events table.
// Append-only; events of a trace are ordered by a per-trace idx column.
class SqliteAuditLog final : public IAuditLog {
 public:
  explicit SqliteAuditLog(std::shared_ptr<SqliteDb> db);

  // Failures are counted and kept in last_error(); the audit trail never aborts a pipeline.
  void append(const AuditEvent& event) override;
  [[nodiscard]] std::vector<AuditEvent> query(const std::string& trace_id) const override;
  [[nodiscard]] std::vector<std::string> list_trace_ids() const override;

  [[nodiscard]] std::size_t failed_appends() const;
  [[nodiscard]] std::optional<std::string> last_error() const;

 private:
  [[nodiscard]] int next_index(const std::string& trace_id);
  void record_failure(const AuditEvent& event, const std::string& reason);

  std::shared_ptr<SqliteDb> db_;

  mutable std::mutex mutex_;
  std::map<std::string, int> trace_indices_;
  std::size_t failed_appends_{0};
  std::optional<std::string> last_error_;
};

}  // namespace rsopt::storage::sqlite
