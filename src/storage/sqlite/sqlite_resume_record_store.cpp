#include "rsopt/storage/sqlite/sqlite_resume_record_store.h"

#include <sqlite3.h>

namespace rsopt::storage::sqlite {

namespace {

constexpr const char* kSelectColumns =
    "SELECT resume_id, user_id, original_path, original_filename, optimized_path, pdf_path,"
    "       job_description, status, keywords_added, last_error, created_at, updated_at"
    "  FROM resume_records";

void bind_optional(sqlite3_stmt* stmt, const int index, const std::optional<std::string>& value) {
  if (value.has_value()) {
    sqlite3_bind_text(stmt, index, value->c_str(), -1, SQLITE_TRANSIENT);
  } else {
    sqlite3_bind_null(stmt, index);
  }
}

std::string column_text(sqlite3_stmt* stmt, const int col) {
  const auto* raw = sqlite3_column_text(stmt, col);
  return raw != nullptr ? reinterpret_cast<const char*>(raw) : std::string{};
}

std::optional<std::string> column_optional(sqlite3_stmt* stmt, const int col) {
  if (sqlite3_column_type(stmt, col) == SQLITE_NULL) {
    return std::nullopt;
  }
  return column_text(stmt, col);
}

domain::ResumeRecord read_row(sqlite3_stmt* stmt) {
  domain::ResumeRecord record;
  record.resume_id = core::ResumeId{column_text(stmt, 0)};
  record.user_id = core::UserId{column_text(stmt, 1)};
  record.original_path = column_text(stmt, 2);
  record.original_filename = column_optional(stmt, 3);
  record.optimized_path = column_optional(stmt, 4);
  record.pdf_path = column_optional(stmt, 5);
  record.job_description = column_optional(stmt, 6);
  record.status =
      domain::parse_optimization_status(column_text(stmt, 7)).value_or(
          domain::OptimizationStatus::kPending);
  record.keywords_added = sqlite3_column_int(stmt, 8);
  record.last_error = column_optional(stmt, 9);
  record.created_at = column_text(stmt, 10);
  record.updated_at = column_text(stmt, 11);
  return record;
}

}  // namespace

SqliteResumeRecordStore::SqliteResumeRecordStore(std::shared_ptr<SqliteDb> db)
    : db_(std::move(db)) {}

core::Result<bool, std::string> SqliteResumeRecordStore::upsert(
    const domain::ResumeRecord& record) {
  const char* sql = R"(
    INSERT INTO resume_records
      (resume_id, user_id, original_path, original_filename, optimized_path, pdf_path,
       job_description, status, keywords_added, last_error, created_at, updated_at)
    VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)
    ON CONFLICT(resume_id) DO UPDATE SET
      user_id = excluded.user_id,
      original_path = excluded.original_path,
      original_filename = excluded.original_filename,
      optimized_path = excluded.optimized_path,
      pdf_path = excluded.pdf_path,
      job_description = excluded.job_description,
      status = excluded.status,
      keywords_added = excluded.keywords_added,
      last_error = excluded.last_error,
      created_at = excluded.created_at,
      updated_at = excluded.updated_at
  )";

  PreparedStatement stmt(db_->connection(), sql);
  if (!stmt.is_valid()) {
    return core::Result<bool, std::string>::err("Failed to prepare resume upsert: " +
                                                stmt.error());
  }

  const std::string status = domain::to_string(record.status);
  sqlite3_bind_text(stmt.get(), 1, record.resume_id.value.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt.get(), 2, record.user_id.value.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt.get(), 3, record.original_path.c_str(), -1, SQLITE_TRANSIENT);
  bind_optional(stmt.get(), 4, record.original_filename);
  bind_optional(stmt.get(), 5, record.optimized_path);
  bind_optional(stmt.get(), 6, record.pdf_path);
  bind_optional(stmt.get(), 7, record.job_description);
  sqlite3_bind_text(stmt.get(), 8, status.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_int(stmt.get(), 9, record.keywords_added);
  bind_optional(stmt.get(), 10, record.last_error);
  sqlite3_bind_text(stmt.get(), 11, record.created_at.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt.get(), 12, record.updated_at.c_str(), -1, SQLITE_TRANSIENT);

  if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
    return core::Result<bool, std::string>::err("Failed to upsert resume record: " +
                                                db_->last_error());
  }
  return core::Result<bool, std::string>::ok(true);
}

std::optional<domain::ResumeRecord> SqliteResumeRecordStore::get(const core::ResumeId& id) const {
  PreparedStatement stmt(db_->connection(), std::string(kSelectColumns) + " WHERE resume_id = ?");
  if (!stmt.is_valid()) {
    return std::nullopt;
  }

  sqlite3_bind_text(stmt.get(), 1, id.value.c_str(), -1, SQLITE_TRANSIENT);
  if (sqlite3_step(stmt.get()) != SQLITE_ROW) {
    return std::nullopt;
  }
  return read_row(stmt.get());
}

std::vector<domain::ResumeRecord> SqliteResumeRecordStore::list_by_user(
    const core::UserId& user) const {
  PreparedStatement stmt(db_->connection(),
                         std::string(kSelectColumns) + " WHERE user_id = ? ORDER BY resume_id");
  if (!stmt.is_valid()) {
    return {};
  }

  sqlite3_bind_text(stmt.get(), 1, user.value.c_str(), -1, SQLITE_TRANSIENT);
  std::vector<domain::ResumeRecord> result;
  while (sqlite3_step(stmt.get()) == SQLITE_ROW) {
    result.push_back(read_row(stmt.get()));
  }
  return result;
}

}  // namespace rsopt::storage::sqlite
