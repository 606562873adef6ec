#pragma once

#include "rsopt/prediction/mask_predictor.h"
#include "rsopt/storage/audit_log.h"
#include "rsopt/storage/resume_record_store.h"

namespace rsopt::core {

// Services is the composition root handed to the application pipelines.
// It holds references (not ownership); the CLI or a test fixture owns the concrete
// instances and keeps them alive for as long as Services is used.
struct Services {
  storage::IResumeRecordStore& resume_records;    // NOLINT(readability-identifier-naming)
  storage::IAuditLog& audit_log;                  // NOLINT(readability-identifier-naming)
  prediction::IMaskPredictor& mask_predictor;     // NOLINT(readability-identifier-naming)

  Services(storage::IResumeRecordStore& resume_records, storage::IAuditLog& audit_log,
           prediction::IMaskPredictor& mask_predictor)
      : resume_records(resume_records), audit_log(audit_log), mask_predictor(mask_predictor) {}

  ~Services() = default;

  Services(const Services&) = delete;
  Services& operator=(const Services&) = delete;
  Services(Services&&) = delete;
  Services& operator=(Services&&) = delete;
};

}  // namespace rsopt::core
