#pragma once

#include "rsopt/core/id_generator.h"

#include <string>

namespace rsopt::core {

// Strong ID types: vocabulary types that keep resume, user and trace IDs from being mixed up.

struct ResumeId {
  std::string value;
  auto operator<=>(const ResumeId&) const = default;
};

struct UserId {
  std::string value;
  auto operator<=>(const UserId&) const = default;
};

struct TraceId {
  std::string value;
  auto operator<=>(const TraceId&) const = default;
};

inline ResumeId new_resume_id(IIdGenerator& gen) { return ResumeId{gen.next("resume")}; }
inline TraceId new_trace_id(IIdGenerator& gen) { return TraceId{gen.next("trace")}; }

}  // namespace rsopt::core
