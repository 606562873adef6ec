#pragma once

#include "rsopt/core/ids.h"
#include "rsopt/core/result.h"
#include "rsopt/domain/resume_record.h"

#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace rsopt::storage {

// IResumeRecordStore persists the lifecycle record of each uploaded resume.
class IResumeRecordStore {
 public:
  virtual ~IResumeRecordStore() = default;

  // Insert or replace the record with the same resume_id.
  [[nodiscard]] virtual core::Result<bool, std::string> upsert(
      const domain::ResumeRecord& record) = 0;
  [[nodiscard]] virtual std::optional<domain::ResumeRecord> get(
      const core::ResumeId& id) const = 0;
  // Records owned by user, ordered by resume_id.
  [[nodiscard]] virtual std::vector<domain::ResumeRecord> list_by_user(
      const core::UserId& user) const = 0;
};

class InMemoryResumeRecordStore final : public IResumeRecordStore {
 public:
  [[nodiscard]] core::Result<bool, std::string> upsert(
      const domain::ResumeRecord& record) override;
  [[nodiscard]] std::optional<domain::ResumeRecord> get(const core::ResumeId& id) const override;
  [[nodiscard]] std::vector<domain::ResumeRecord> list_by_user(
      const core::UserId& user) const override;

 private:
  mutable std::mutex mutex_;
  std::map<core::ResumeId, domain::ResumeRecord> records_;
};

}  // namespace rsopt::storage
