#include "rsopt/prediction/command_mask_predictor.h"

#include "rsopt/core/normalization.h"
#include "rsopt/core/process.h"

#include <nlohmann/json.hpp>

namespace rsopt::prediction {

namespace {

constexpr int kTimeoutExitCode = 124;

std::string last_non_empty_line(const std::string& output) {
  std::size_t end = output.size();
  while (end > 0) {
    const std::size_t start = output.rfind('\n', end - 1);
    const std::size_t begin = start == std::string::npos ? 0 : start + 1;
    std::string line = core::trim(std::string_view(output).substr(begin, end - begin));
    if (!line.empty()) {
      return line;
    }
    if (start == std::string::npos) {
      break;
    }
    end = start;
  }
  return {};
}

}  // namespace

CommandMaskPredictor::CommandMaskPredictor(CommandMaskPredictorOptions options)
    : options_(std::move(options)) {}

Prediction CommandMaskPredictor::predict(const std::string_view context,
                                         const std::size_t top_k) const {
  if (options_.command.empty()) {
    return Prediction::err({PredictionErrorKind::kUnavailable, "Predictor command is empty"});
  }
  if (context.find(kMaskToken) == std::string_view::npos) {
    return Prediction::err({PredictionErrorKind::kMalformed,
                            "Context has no " + std::string(kMaskToken) + " placeholder"});
  }

  const std::string command_line =
      options_.command + " " + core::shell_quote(context) + " " + std::to_string(top_k);
  const auto run = core::run_capture(command_line, options_.timeout);
  if (!run.has_value()) {
    return Prediction::err({PredictionErrorKind::kFailed, run.error()});
  }
  if (run.value().exit_code == kTimeoutExitCode) {
    return Prediction::err({PredictionErrorKind::kTimeout,
                            "Predictor timed out after " +
                                std::to_string(options_.timeout.count()) + "s"});
  }
  if (run.value().exit_code != 0) {
    return Prediction::err({PredictionErrorKind::kFailed,
                            "Predictor exited with code " +
                                std::to_string(run.value().exit_code)});
  }

  return parse_prediction_output(run.value().output, top_k);
}

Prediction parse_prediction_output(const std::string& output, const std::size_t top_k) {
  using json = nlohmann::json;

  const std::string line = last_non_empty_line(output);
  json j;
  try {
    j = json::parse(line);
  } catch (const json::parse_error& e) {
    return Prediction::err(
        {PredictionErrorKind::kMalformed, std::string("Predictor output is not JSON: ") + e.what()});
  }
  if (!j.is_array()) {
    return Prediction::err({PredictionErrorKind::kMalformed, "Predictor output is not an array"});
  }

  std::vector<std::string> candidates;
  for (const auto& item : j) {
    if (candidates.size() == top_k) {
      break;
    }
    std::string word;
    if (item.is_string()) {
      word = item.get<std::string>();
    } else if (item.is_object() && item.contains("token_str") && item["token_str"].is_string()) {
      word = item["token_str"].get<std::string>();
    } else {
      return Prediction::err(
          {PredictionErrorKind::kMalformed, "Predictor output entry is not a string"});
    }
    word = core::trim(word);
    if (!word.empty()) {
      candidates.push_back(std::move(word));
    }
  }
  return Prediction::ok(std::move(candidates));
}

}  // namespace rsopt::prediction
