#include "rsopt/storage/resume_record_store.h"

namespace rsopt::storage {

core::Result<bool, std::string> InMemoryResumeRecordStore::upsert(
    const domain::ResumeRecord& record) {
  if (record.resume_id.value.empty()) {
    return core::Result<bool, std::string>::err("Resume record has no resume_id");
  }
  std::lock_guard<std::mutex> lock(mutex_);
  records_[record.resume_id] = record;
  return core::Result<bool, std::string>::ok(true);
}

std::optional<domain::ResumeRecord> InMemoryResumeRecordStore::get(
    const core::ResumeId& id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = records_.find(id);
  if (it == records_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::vector<domain::ResumeRecord> InMemoryResumeRecordStore::list_by_user(
    const core::UserId& user) const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<domain::ResumeRecord> result;
  for (const auto& [id, record] : records_) {
    if (record.user_id == user) {
      result.push_back(record);
    }
  }
  return result;
}

}  // namespace rsopt::storage
