#pragma once

#include "rsopt/render/pdf_renderer.h"

#include <functional>
#include <string>
#include <string_view>
#include <vector>

namespace rsopt::render {

// TextPdfRenderer writes a text-only PDF through MuPDF's document writer: US Letter pages,
// 1 inch margins, Helvetica 12 pt with 14 pt leading, one paragraph per block, word wrapped, as
// many pages as needed.
class TextPdfRenderer final : public IPdfRenderer {
 public:
  static constexpr double kPageWidth = 612.0;
  static constexpr double kPageHeight = 792.0;
  static constexpr double kMargin = 72.0;
  static constexpr double kFontSize = 12.0;
  static constexpr double kLeading = 14.0;
  static constexpr std::size_t kLinesPerPage =
      1 + static_cast<std::size_t>((kPageHeight - 2 * kMargin) / kLeading);

  [[nodiscard]] RenderResult render(const domain::Document& document,
                                    const std::string& document_path,
                                    const std::string& pdf_path) const override;
  [[nodiscard]] std::string name() const override { return "text"; }
};

// to_pdf_text maps typographic punctuation to plain stand-ins (dashes and bullets to '-', curly
// quotes to straight ones, ellipsis to "...", tab to space). Control characters and code points
// above U+00FF are dropped. Input and output are UTF-8.
[[nodiscard]] std::string to_pdf_text(std::string_view utf8);

// Width of UTF-8 text in points.
using TextMeasure = std::function<double(std::string_view)>;

// wrap_lines breaks text into lines no wider than max_width. Words wider than a line are split
// on code point boundaries. Empty text yields one empty line.
[[nodiscard]] std::vector<std::string> wrap_lines(std::string_view text, double max_width,
                                                  const TextMeasure& measure);

}  // namespace rsopt::render
