#pragma once

#include "rsopt/domain/document.h"
#include "rsopt/domain/keyword.h"
#include "rsopt/domain/run_state.h"
#include "rsopt/domain/section_type.h"
#include "rsopt/optimize/contextual_enhancer.h"
#include "rsopt/optimize/optimizer_config.h"
#include "rsopt/optimize/section_classifier.h"

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace rsopt::optimize {

// ParagraphChange describes one rewritten paragraph.
struct ParagraphChange {
  std::size_t paragraph_index{0};
  domain::SectionType section{domain::SectionType::kOther};
  std::vector<std::string> inserted_keywords;  // in insertion order
  bool used_prediction{false};
  std::size_t duplicates_removed{0};
  std::vector<std::string> prediction_errors;  // predictor failures that fell back to templates
};

struct RebuildResult {
  domain::Document document;
  std::vector<ParagraphChange> change_log;
};

// remove_duplicate_sentences drops sentences whose comparison_key repeats an earlier one.
// Text without duplicates is returned unchanged. removed (optional) receives the count.
[[nodiscard]] std::string remove_duplicate_sentences(std::string_view text,
                                                     std::size_t* removed = nullptr);

// DocumentRebuilder walks the paragraphs once, in order, and emits a new Document with the
// same paragraph count. Empty and header paragraphs are copied verbatim; headers switch the
// current section and reset its budget. Content paragraphs receive keywords from the
// candidate list while the section budget and the global ceiling allow; before the first
// header the budget is further capped by pre_header_budget. Formatting travels with each
// paragraph.
class DocumentRebuilder {
 public:
  DocumentRebuilder(const OptimizerConfig& config, const SectionClassifier& classifier,
                    const ContextualEnhancer& enhancer);

  [[nodiscard]] RebuildResult rebuild(const domain::Document& source,
                                      const std::vector<domain::Keyword>& candidates,
                                      domain::OptimizationRunState& state) const;

 private:
  [[nodiscard]] std::string enhance_paragraph(const std::string& text,
                                              const std::vector<domain::Keyword>& candidates,
                                              std::size_t budget,
                                              domain::OptimizationRunState& state,
                                              ParagraphChange& change) const;

  const OptimizerConfig& config_;
  const SectionClassifier& classifier_;
  const ContextualEnhancer& enhancer_;
};

}  // namespace rsopt::optimize
