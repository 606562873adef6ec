#include "rsopt/prediction/mask_predictor.h"

#include "rsopt/core/hashing.h"

namespace rsopt::prediction {

std::string to_string(const PredictionErrorKind kind) {
  switch (kind) {
    case PredictionErrorKind::kUnavailable:
      return "unavailable";
    case PredictionErrorKind::kTimeout:
      return "timeout";
    case PredictionErrorKind::kFailed:
      return "failed";
    case PredictionErrorKind::kMalformed:
      return "malformed";
  }
  return "unknown";
}

Prediction NullMaskPredictor::predict(std::string_view /* context */,
                                      std::size_t /* top_k */) const {
  return Prediction::err({PredictionErrorKind::kUnavailable, "No mask predictor configured"});
}

DeterministicStubMaskPredictor::DeterministicStubMaskPredictor()
    : DeterministicStubMaskPredictor({"leveraging", "applying", "utilizing", "adopting",
                                      "employing", "deploying", "integrating", "automating"}) {}

DeterministicStubMaskPredictor::DeterministicStubMaskPredictor(std::vector<std::string> lexicon)
    : lexicon_(std::move(lexicon)) {}

Prediction DeterministicStubMaskPredictor::predict(const std::string_view context,
                                                   const std::size_t top_k) const {
  if (context.find(kMaskToken) == std::string_view::npos) {
    return Prediction::err({PredictionErrorKind::kMalformed,
                            "Context has no " + std::string(kMaskToken) + " placeholder"});
  }
  if (lexicon_.empty()) {
    return Prediction::ok({});
  }

  const std::size_t start = core::stable_hash64(context) % lexicon_.size();
  std::vector<std::string> candidates;
  for (std::size_t i = 0; i < lexicon_.size() && candidates.size() < top_k; ++i) {
    candidates.push_back(lexicon_[(start + i) % lexicon_.size()]);
  }
  return Prediction::ok(std::move(candidates));
}

}  // namespace rsopt::prediction
