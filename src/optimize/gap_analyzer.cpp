#include "rsopt/optimize/gap_analyzer.h"

#include "rsopt/core/normalization.h"

namespace rsopt::optimize {

GapAnalyzer::GapAnalyzer(const KeywordExtractor& extractor, const GapAnalyzerOptions options)
    : extractor_(extractor), options_(options) {}

std::vector<domain::Keyword> GapAnalyzer::missing_keywords(
    const std::string_view resume_text, const std::string_view job_description_text,
    const std::set<std::string>& already_processed, const std::size_t max_keywords) const {
  const auto jd_keywords = extractor_.extract(job_description_text, options_.jd_top_k);
  if (jd_keywords.empty() || max_keywords == 0) {
    return {};
  }

  std::set<std::string> resume_keys;
  for (const auto& keyword : extractor_.extract(resume_text, options_.resume_top_k)) {
    resume_keys.insert(keyword.key);
  }

  std::vector<domain::Keyword> missing;
  for (const auto& keyword : jd_keywords) {
    if (resume_keys.contains(keyword.key) || already_processed.contains(keyword.key)) {
      continue;
    }
    if (keyword.key.size() <= 2 || !domain::is_technical_keyword(keyword.text)) {
      continue;
    }
    // The resume keyword set is truncated; a term that still occurs verbatim is covered.
    if (core::contains_phrase_ci(resume_text, keyword.text)) {
      continue;
    }
    missing.push_back(keyword);
    if (missing.size() == max_keywords) {
      break;
    }
  }
  return missing;
}

std::vector<domain::Keyword> GapAnalyzer::remaining(const std::vector<domain::Keyword>& candidates,
                                                    const std::set<std::string>& processed) {
  std::vector<domain::Keyword> result;
  for (const auto& keyword : candidates) {
    if (!processed.contains(keyword.key)) {
      result.push_back(keyword);
    }
  }
  return result;
}

}  // namespace rsopt::optimize
