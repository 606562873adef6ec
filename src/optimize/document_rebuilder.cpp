#include "rsopt/optimize/document_rebuilder.h"

#include "rsopt/core/normalization.h"
#include "rsopt/optimize/gap_analyzer.h"

#include <algorithm>
#include <set>

namespace rsopt::optimize {

using domain::SectionType;

namespace {

// Splits at '.', '!' or '?' followed by whitespace or the end. Each sentence keeps its
// terminator and is trimmed.
std::vector<std::string> split_sentences(const std::string_view text) {
  std::vector<std::string> sentences;
  std::size_t start = 0;
  for (std::size_t i = 0; i < text.size(); ++i) {
    const char ch = text[i];
    if (ch != '.' && ch != '!' && ch != '?') {
      continue;
    }
    if (i + 1 < text.size() && !core::is_ascii_space(text[i + 1])) {
      continue;
    }
    std::string sentence = core::trim(text.substr(start, i + 1 - start));
    if (!sentence.empty()) {
      sentences.push_back(std::move(sentence));
    }
    start = i + 1;
  }
  std::string tail = core::trim(text.substr(std::min(start, text.size())));
  if (!tail.empty()) {
    sentences.push_back(std::move(tail));
  }
  return sentences;
}

}  // namespace

std::string remove_duplicate_sentences(const std::string_view text, std::size_t* removed) {
  std::set<std::string> seen;
  std::vector<std::string> kept;
  std::size_t dropped = 0;

  for (auto& sentence : split_sentences(text)) {
    const std::string key = core::comparison_key(sentence);
    if (!key.empty() && !seen.insert(key).second) {
      ++dropped;
      continue;
    }
    kept.push_back(std::move(sentence));
  }

  if (removed != nullptr) {
    *removed = dropped;
  }
  if (dropped == 0) {
    return std::string(text);
  }

  std::string out;
  for (const auto& sentence : kept) {
    if (!out.empty()) {
      out.push_back(' ');
    }
    out += sentence;
  }
  return out;
}

DocumentRebuilder::DocumentRebuilder(const OptimizerConfig& config,
                                     const SectionClassifier& classifier,
                                     const ContextualEnhancer& enhancer)
    : config_(config), classifier_(classifier), enhancer_(enhancer) {}

RebuildResult DocumentRebuilder::rebuild(const domain::Document& source,
                                         const std::vector<domain::Keyword>& candidates,
                                         domain::OptimizationRunState& state) const {
  RebuildResult result;
  result.document.paragraphs.reserve(source.paragraphs.size());
  bool seen_header = false;

  for (std::size_t i = 0; i < source.paragraphs.size(); ++i) {
    const domain::Paragraph& paragraph = source.paragraphs[i];
    result.document.paragraphs.push_back(paragraph);

    if (core::trim(paragraph.text).empty()) {
      continue;
    }

    if (const auto header = classifier_.header_section(paragraph.text); header.has_value()) {
      state.enter_section(header.value());
      seen_header = true;
      continue;
    }

    // Before the first header each paragraph is classified on its own content.
    if (!seen_header) {
      const SectionType section = classifier_.classify(paragraph.text);
      if (section != state.current_section) {
        state.enter_section(section);
      }
    }

    std::size_t budget = config_.profile(state.current_section).budget;
    if (!seen_header) {
      budget = std::min(budget, config_.pre_header_budget);
    }

    ParagraphChange change;
    change.paragraph_index = i;
    change.section = state.current_section;
    std::string text = enhance_paragraph(paragraph.text, candidates, budget, state, change);
    if (change.inserted_keywords.empty()) {
      continue;
    }

    text = remove_duplicate_sentences(text, &change.duplicates_removed);
    result.document.paragraphs.back().text = std::move(text);
    result.change_log.push_back(std::move(change));
  }

  return result;
}

std::string DocumentRebuilder::enhance_paragraph(const std::string& text,
                                                 const std::vector<domain::Keyword>& candidates,
                                                 const std::size_t budget,
                                                 domain::OptimizationRunState& state,
                                                 ParagraphChange& change) const {
  const SectionType section = state.current_section;
  const bool as_list = section == SectionType::kSkills &&
                       ContextualEnhancer::list_delimiter(text).has_value();

  std::string current = text;
  for (const auto& keyword : GapAnalyzer::remaining(candidates, state.processed_keywords)) {
    if (state.section_keywords_used >= budget ||
        state.keywords_added_count >= config_.global_keyword_ceiling) {
      break;
    }
    if (core::contains_phrase_ci(current, keyword.text)) {
      continue;
    }

    Enhancement enhancement = as_list ? enhancer_.append_to_list(current, keyword.text, state)
                                      : enhancer_.enhance(current, keyword.text, section, state);
    if (enhancement.prediction_error.has_value()) {
      change.prediction_errors.push_back(std::move(*enhancement.prediction_error));
    }
    if (!enhancement.inserted) {
      continue;
    }
    current = std::move(enhancement.text);
    change.inserted_keywords.push_back(keyword.text);
    change.used_prediction = change.used_prediction || enhancement.used_prediction;
  }
  return current;
}

}  // namespace rsopt::optimize
