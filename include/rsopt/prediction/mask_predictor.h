#pragma once

#include "rsopt/core/result.h"

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace rsopt::prediction {

// Placeholder the predictor fills in.
inline constexpr std::string_view kMaskToken = "[MASK]";

enum class PredictionErrorKind {
  kUnavailable,  // no predictor configured
  kTimeout,
  kFailed,     // backend reported an error
  kMalformed,  // bad context or unparseable backend output
};

struct PredictionError {
  PredictionErrorKind kind{PredictionErrorKind::kUnavailable};
  std::string message;
};

[[nodiscard]] std::string to_string(PredictionErrorKind kind);

using Prediction = core::Result<std::vector<std::string>, PredictionError>;

// IMaskPredictor fills a single kMaskToken placeholder with ranked candidate words.
// Implementations may be absent, slow or empty; callers treat any error as "no prediction".
class IMaskPredictor {
 public:
  virtual ~IMaskPredictor() = default;

  // predict returns at most top_k candidates, best first.
  [[nodiscard]] virtual Prediction predict(std::string_view context, std::size_t top_k) const = 0;
};

// NullMaskPredictor is always unavailable (template-only enhancement).
class NullMaskPredictor final : public IMaskPredictor {
 public:
  [[nodiscard]] Prediction predict(std::string_view context, std::size_t top_k) const override;
};

// DeterministicStubMaskPredictor picks candidates from a fixed lexicon of lead words.
// The starting offset is derived from a stable hash of the context, so the same context
// always yields the same ranking.
class DeterministicStubMaskPredictor final : public IMaskPredictor {
 public:
  DeterministicStubMaskPredictor();
  explicit DeterministicStubMaskPredictor(std::vector<std::string> lexicon);

  [[nodiscard]] Prediction predict(std::string_view context, std::size_t top_k) const override;

 private:
  std::vector<std::string> lexicon_;
};

}  // namespace rsopt::prediction
