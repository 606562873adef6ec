#include "rsopt/optimize/optimization_engine.h"

#include "rsopt/core/normalization.h"
#include "rsopt/domain/run_state.h"

namespace rsopt::optimize {

OptimizationEngine::OptimizationEngine(OptimizerConfig config,
                                       const prediction::IMaskPredictor* predictor)
    : config_(std::move(config)),
      classifier_(config_.profiles),
      gap_analyzer_(extractor_, GapAnalyzerOptions{config_.jd_top_k, config_.resume_top_k}),
      enhancer_(config_, predictor),
      rebuilder_(config_, classifier_, enhancer_) {}

std::vector<domain::Keyword> OptimizationEngine::missing_keywords(
    const std::string_view resume_text, const std::string_view job_description) const {
  return gap_analyzer_.missing_keywords(resume_text, job_description, {},
                                        config_.max_missing_keywords);
}

OptimizeResult OptimizationEngine::optimize(const domain::Document& resume,
                                            const std::string_view job_description) const {
  const std::size_t jd_length = core::normalize_text(job_description).size();
  if (jd_length < config_.min_job_description_length) {
    return OptimizeResult::err(
        {OptimizeErrorKind::kInput,
         "Job description is too short (" + std::to_string(jd_length) +
             " characters, minimum " + std::to_string(config_.min_job_description_length) + ")"});
  }

  const std::string resume_text = resume.joined_text();
  if (core::normalize_text(resume_text).empty()) {
    return OptimizeResult::err({OptimizeErrorKind::kInput, "Resume has no text"});
  }

  domain::OptimizationRunState state;
  OptimizationOutcome outcome;
  outcome.missing_keywords = gap_analyzer_.missing_keywords(
      resume_text, job_description, state.processed_keywords, config_.max_missing_keywords);

  if (outcome.missing_keywords.empty()) {
    outcome.document = resume;
    return OptimizeResult::ok(std::move(outcome));
  }

  RebuildResult rebuilt = rebuilder_.rebuild(resume, outcome.missing_keywords, state);
  outcome.document = std::move(rebuilt.document);
  outcome.change_log = std::move(rebuilt.change_log);
  outcome.keywords_added = state.keywords_added_count;
  return OptimizeResult::ok(std::move(outcome));
}

}  // namespace rsopt::optimize
