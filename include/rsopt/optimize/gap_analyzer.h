#pragma once

#include "rsopt/domain/keyword.h"
#include "rsopt/optimize/keyword_extractor.h"

#include <cstddef>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace rsopt::optimize {

struct GapAnalyzerOptions {
  std::size_t jd_top_k{50};
  std::size_t resume_top_k{30};
};

// GapAnalyzer computes the job-description vocabulary the resume does not cover.
class GapAnalyzer {
 public:
  explicit GapAnalyzer(const KeywordExtractor& extractor, GapAnalyzerOptions options = {});

  // missing_keywords returns job-description keywords, in job-description frequency order,
  // whose lowercase key is absent from the resume's keywords and from already_processed,
  // that are longer than 2 characters, pass domain::is_technical_keyword and do not occur
  // verbatim (word-bounded, case-insensitive) in the resume text.
  // Truncated to max_keywords.
  [[nodiscard]] std::vector<domain::Keyword> missing_keywords(
      std::string_view resume_text, std::string_view job_description_text,
      const std::set<std::string>& already_processed, std::size_t max_keywords) const;

  // remaining filters a previously computed list against keys processed since.
  [[nodiscard]] static std::vector<domain::Keyword> remaining(
      const std::vector<domain::Keyword>& candidates, const std::set<std::string>& processed);

 private:
  const KeywordExtractor& extractor_;
  GapAnalyzerOptions options_;
};

}  // namespace rsopt::optimize
