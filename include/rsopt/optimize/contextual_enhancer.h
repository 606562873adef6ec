#pragma once

#include "rsopt/domain/run_state.h"
#include "rsopt/domain/section_type.h"
#include "rsopt/optimize/optimizer_config.h"
#include "rsopt/prediction/mask_predictor.h"

#include <optional>
#include <string>
#include <string_view>

namespace rsopt::optimize {

struct Enhancement {
  std::string text;
  bool inserted{false};
  bool used_prediction{false};
  // Set when the predictor failed and a template was used instead. A predictor that is not
  // available at all is not an error.
  std::optional<std::string> prediction_error;
};

// ContextualEnhancer appends one keyword to one paragraph.
//
// Sentence paragraphs get a templated sentence from the section profile, or a predicted lead
// word when a mask predictor is available. Skill lists get the keyword appended with the
// list's own delimiter. Every successful insertion is recorded in the run state.
class ContextualEnhancer {
 public:
  // predictor may be null: enhancement then uses templates only.
  ContextualEnhancer(const OptimizerConfig& config, const prediction::IMaskPredictor* predictor);

  // enhance appends a sentence mentioning keyword. Nothing is inserted when the paragraph is
  // empty, already mentions the keyword, or the density guard refuses.
  [[nodiscard]] Enhancement enhance(std::string_view paragraph, std::string_view keyword,
                                    domain::SectionType section,
                                    domain::OptimizationRunState& state) const;

  // append_to_list adds keyword as a new list item. Same rejection rules as enhance; also
  // refuses paragraphs for which list_delimiter() finds no list.
  [[nodiscard]] Enhancement append_to_list(std::string_view paragraph, std::string_view keyword,
                                           domain::OptimizationRunState& state) const;

  // list_delimiter detects a skill list: " | ", ", ", "; " or " • " when the paragraph uses
  // that delimiter, ", " for a short delimiter-free line without terminal punctuation,
  // nullopt for prose.
  [[nodiscard]] static std::optional<std::string> list_delimiter(std::string_view paragraph);

  // template_index = min(template_count - 1, words / 20).
  [[nodiscard]] static std::size_t template_index(std::size_t template_count, std::size_t words);

 private:
  [[nodiscard]] bool accepts(std::string_view paragraph, std::string_view keyword) const;
  [[nodiscard]] std::optional<std::string> predicted_sentence(
      std::string_view base, std::string_view keyword,
      std::optional<std::string>& prediction_error) const;

  const OptimizerConfig& config_;
  const prediction::IMaskPredictor* predictor_;
};

}  // namespace rsopt::optimize
