#pragma once

#include "rsopt/core/result.h"
#include "rsopt/domain/document.h"
#include "rsopt/domain/keyword.h"
#include "rsopt/optimize/contextual_enhancer.h"
#include "rsopt/optimize/document_rebuilder.h"
#include "rsopt/optimize/gap_analyzer.h"
#include "rsopt/optimize/keyword_extractor.h"
#include "rsopt/optimize/optimize_error.h"
#include "rsopt/optimize/optimizer_config.h"
#include "rsopt/optimize/section_classifier.h"
#include "rsopt/prediction/mask_predictor.h"

#include <cstddef>
#include <string_view>
#include <vector>

namespace rsopt::optimize {

struct OptimizationOutcome {
  domain::Document document;
  std::size_t keywords_added{0};
  std::vector<domain::Keyword> missing_keywords;  // gap computed before rebuilding
  std::vector<ParagraphChange> change_log;
};

using OptimizeResult = core::Result<OptimizationOutcome, OptimizeError>;

// OptimizationEngine wires extraction, gap analysis, classification, enhancement and
// rebuilding into one call.
//
// The engine holds only configuration and stateless collaborators: run state is created per
// optimize() call, so one engine may serve concurrent runs. The predictor (optional) is
// borrowed and must outlive the engine.
class OptimizationEngine {
 public:
  explicit OptimizationEngine(OptimizerConfig config,
                              const prediction::IMaskPredictor* predictor = nullptr);

  // Collaborators hold references into config_.
  OptimizationEngine(const OptimizationEngine&) = delete;
  OptimizationEngine& operator=(const OptimizationEngine&) = delete;

  // optimize validates input (kInput error for an empty resume or a job description shorter
  // than min_job_description_length after normalization), then rebuilds the document.
  // When there is nothing to add the source document is returned with zero insertions.
  [[nodiscard]] OptimizeResult optimize(const domain::Document& resume,
                                        std::string_view job_description) const;

  // Gap between resume text and job description, for reporting.
  [[nodiscard]] std::vector<domain::Keyword> missing_keywords(
      std::string_view resume_text, std::string_view job_description) const;

  [[nodiscard]] const OptimizerConfig& config() const { return config_; }
  [[nodiscard]] const KeywordExtractor& extractor() const { return extractor_; }

 private:
  OptimizerConfig config_;
  KeywordExtractor extractor_;
  SectionClassifier classifier_;
  GapAnalyzer gap_analyzer_;
  ContextualEnhancer enhancer_;
  DocumentRebuilder rebuilder_;
};

}  // namespace rsopt::optimize
