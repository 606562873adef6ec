#include "rsopt/optimize/contextual_enhancer.h"

#include "rsopt/core/normalization.h"
#include "rsopt/optimize/density_guard.h"
#include "rsopt/optimize/keyword_extractor.h"

#include <algorithm>

namespace rsopt::optimize {

using domain::SectionType;

namespace {

constexpr std::size_t kWordsPerTemplateStep = 20;
constexpr std::size_t kMaxBareListWords = 6;
constexpr std::size_t kMinPredictionLength = 3;
constexpr std::string_view kBullet = "\xE2\x80\xA2";

bool ends_with_terminal_punctuation(const std::string_view text) {
  return !text.empty() && (text.back() == '.' || text.back() == '!' || text.back() == '?');
}

std::string render_template(const std::string& pattern, const std::string_view keyword) {
  static constexpr std::string_view kPlaceholder = "{kw}";
  std::string out;
  std::size_t pos = 0;
  while (true) {
    const std::size_t found = pattern.find(kPlaceholder, pos);
    if (found == std::string::npos) {
      out.append(pattern, pos);
      break;
    }
    out.append(pattern, pos, found - pos);
    out.append(keyword);
    pos = found + kPlaceholder.size();
  }
  return out;
}

// Paragraph text ready for another sentence: trimmed, terminated.
std::string sentence_base(const std::string_view paragraph) {
  std::string base = core::trim(paragraph);
  if (!ends_with_terminal_punctuation(base)) {
    base.push_back('.');
  }
  return base;
}

bool is_usable_prediction(const std::string& candidate, const std::string_view paragraph,
                          const std::string_view keyword) {
  if (candidate.size() < kMinPredictionLength) {
    return false;
  }
  if (!std::all_of(candidate.begin(), candidate.end(), core::is_ascii_alpha)) {
    return false;
  }
  if (is_stop_word(candidate)) {
    return false;
  }
  if (core::normalize_ascii_lower(candidate) == core::normalize_ascii_lower(keyword)) {
    return false;
  }
  return !core::contains_phrase_ci(paragraph, candidate);
}

std::string capitalized(const std::string& word) {
  std::string out = core::normalize_ascii_lower(word);
  if (!out.empty() && out[0] >= 'a' && out[0] <= 'z') {
    out[0] = static_cast<char>(out[0] - ('a' - 'A'));
  }
  return out;
}

}  // namespace

ContextualEnhancer::ContextualEnhancer(const OptimizerConfig& config,
                                       const prediction::IMaskPredictor* predictor)
    : config_(config), predictor_(predictor) {}

std::size_t ContextualEnhancer::template_index(const std::size_t template_count,
                                               const std::size_t words) {
  if (template_count == 0) {
    return 0;
  }
  return std::min(template_count - 1, words / kWordsPerTemplateStep);
}

bool ContextualEnhancer::accepts(const std::string_view paragraph,
                                 const std::string_view keyword) const {
  if (core::trim(paragraph).empty() || core::trim(keyword).empty()) {
    return false;
  }
  if (core::contains_phrase_ci(paragraph, keyword)) {
    return false;
  }
  return DensityGuard::allows_insertion(paragraph, keyword, config_.density_limit);
}

std::optional<std::string> ContextualEnhancer::predicted_sentence(
    const std::string_view base, const std::string_view keyword,
    std::optional<std::string>& prediction_error) const {
  if (predictor_ == nullptr || !config_.enable_prediction) {
    return std::nullopt;
  }

  std::string context(base);
  context += " ";
  context += prediction::kMaskToken;
  context += " ";
  context += keyword;
  context += ".";

  const auto prediction = predictor_->predict(context, config_.prediction_top_k);
  if (!prediction.has_value()) {
    if (prediction.error().kind != prediction::PredictionErrorKind::kUnavailable) {
      prediction_error = "mask prediction failed (" +
                         prediction::to_string(prediction.error().kind) +
                         "): " + prediction.error().message;
    }
    return std::nullopt;
  }

  for (const auto& candidate : prediction.value()) {
    if (is_usable_prediction(candidate, base, keyword)) {
      return capitalized(candidate) + " " + std::string(keyword) + ".";
    }
  }
  return std::nullopt;
}

Enhancement ContextualEnhancer::enhance(const std::string_view paragraph,
                                        const std::string_view keyword, const SectionType section,
                                        domain::OptimizationRunState& state) const {
  Enhancement result{std::string(paragraph), false, false, std::nullopt};
  if (!accepts(paragraph, keyword)) {
    return result;
  }

  const std::string base = sentence_base(paragraph);
  std::optional<std::string> sentence = predicted_sentence(base, keyword, result.prediction_error);
  result.used_prediction = sentence.has_value();

  if (!sentence.has_value()) {
    const auto* templates = &config_.profile(section).templates;
    if (templates->empty()) {
      templates = &config_.profile(SectionType::kOther).templates;
    }
    if (templates->empty()) {
      return result;
    }
    const std::size_t index = template_index(templates->size(), core::count_words(paragraph));
    sentence = render_template((*templates)[index], keyword);
  }

  result.text = base + " " + sentence.value();
  result.inserted = true;
  state.record_insertion(keyword);
  return result;
}

std::optional<std::string> ContextualEnhancer::list_delimiter(const std::string_view paragraph) {
  if (paragraph.find('|') != std::string_view::npos) {
    return std::string(" | ");
  }
  if (paragraph.find(',') != std::string_view::npos) {
    return std::string(", ");
  }
  if (paragraph.find(';') != std::string_view::npos) {
    return std::string("; ");
  }
  if (paragraph.find(kBullet) != std::string_view::npos) {
    return " " + std::string(kBullet) + " ";
  }

  const std::string trimmed = core::trim(paragraph);
  const std::size_t words = core::count_words(trimmed);
  if (words > 0 && words <= kMaxBareListWords && !ends_with_terminal_punctuation(trimmed)) {
    return std::string(", ");
  }
  return std::nullopt;
}

Enhancement ContextualEnhancer::append_to_list(const std::string_view paragraph,
                                               const std::string_view keyword,
                                               domain::OptimizationRunState& state) const {
  Enhancement result{std::string(paragraph), false, false, std::nullopt};
  const auto delimiter = list_delimiter(paragraph);
  if (!delimiter.has_value() || !accepts(paragraph, keyword)) {
    return result;
  }

  std::string base = core::trim(paragraph);
  // Drop a trailing period or dangling delimiter so the new item joins the list.
  const std::string bare_delimiter = core::trim(delimiter.value());
  while (!base.empty()) {
    if (base.back() == '.') {
      base.pop_back();
    } else if (base.ends_with(bare_delimiter)) {
      base.erase(base.size() - bare_delimiter.size());
    } else {
      break;
    }
    base = core::trim(base);
  }

  result.text = base + delimiter.value() + std::string(keyword);
  result.inserted = true;
  state.record_insertion(keyword);
  return result;
}

}  // namespace rsopt::optimize
