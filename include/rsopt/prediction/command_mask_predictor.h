#pragma once

#include "rsopt/prediction/mask_predictor.h"

#include <chrono>
#include <string>

namespace rsopt::prediction {

struct CommandMaskPredictorOptions {
  // Invoked as: <command> '<context>' <top_k>
  std::string command;
  std::chrono::seconds timeout{10};
};

// CommandMaskPredictor runs an external fill-mask program (for example a small script around
// a masked language model) and parses its output.
//
// The last non-empty output line must be a JSON array, either of strings or of objects with a
// "token_str" field (the shape fill-mask pipelines print). Candidates are trimmed and empty
// ones dropped. Timeouts, non-zero exits and unparseable output become PredictionErrors.
class CommandMaskPredictor final : public IMaskPredictor {
 public:
  explicit CommandMaskPredictor(CommandMaskPredictorOptions options);

  [[nodiscard]] Prediction predict(std::string_view context, std::size_t top_k) const override;

 private:
  CommandMaskPredictorOptions options_;
};

// parse_prediction_output is the output parser used by CommandMaskPredictor.
[[nodiscard]] Prediction parse_prediction_output(const std::string& output, std::size_t top_k);

}  // namespace rsopt::prediction
