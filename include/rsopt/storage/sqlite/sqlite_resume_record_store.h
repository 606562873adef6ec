#pragma once

#include "rsopt/storage/resume_record_store.h"
#include "rsopt/storage/sqlite/sqlite_db.h"

#include <memory>

namespace rsopt::storage::sqlite {

// SqliteResumeRecordStore keeps ResumeRecords in the resume_records table.
// Requires schema v1 (SqliteDb::ensure_schema_v1).
class SqliteResumeRecordStore final : public IResumeRecordStore {
 public:
  explicit SqliteResumeRecordStore(std::shared_ptr<SqliteDb> db);

  [[nodiscard]] core::Result<bool, std::string> upsert(
      const domain::ResumeRecord& record) override;
  [[nodiscard]] std::optional<domain::ResumeRecord> get(const core::ResumeId& id) const override;
  [[nodiscard]] std::vector<domain::ResumeRecord> list_by_user(
      const core::UserId& user) const override;

 private:
  std::shared_ptr<SqliteDb> db_;
};

}  // namespace rsopt::storage::sqlite
