#include "rsopt/render/text_pdf_renderer.h"

#include "rsopt/io/document_io.h"

#include <mupdf/fitz.h>

#include <algorithm>
#include <memory>
#include <optional>

namespace rsopt::render {

namespace {

struct ContextDeleter {
  void operator()(fz_context* ctx) const { fz_drop_context(ctx); }
};
using ContextPtr = std::unique_ptr<fz_context, ContextDeleter>;

// Owns a font for the lifetime of one render; declared after the context it belongs to.
class FontHandle {
 public:
  explicit FontHandle(fz_context* ctx) : ctx_(ctx) {}
  ~FontHandle() { fz_drop_font(ctx_, font_); }
  FontHandle(const FontHandle&) = delete;
  FontHandle& operator=(const FontHandle&) = delete;

  fz_font* get() const { return font_; }
  void reset(fz_font* font) { font_ = font; }

 private:
  fz_context* ctx_;
  fz_font* font_{nullptr};
};

void append_code_point(std::string& out, const int rune) {
  switch (rune) {
    case 0x2013:
    case 0x2014:
    case 0x2022:
      out.push_back('-');
      return;
    case 0x2018:
    case 0x2019:
      out.push_back('\'');
      return;
    case 0x201C:
    case 0x201D:
      out.push_back('"');
      return;
    case 0x2026:
      out += "...";
      return;
    case '\t':
      out.push_back(' ');
      return;
    default:
      break;
  }
  if (rune >= 0x20 && rune <= 0xFF && !(rune >= 0x7F && rune < 0xA0)) {
    char buf[FZ_UTFMAX];
    out.append(buf, static_cast<std::size_t>(fz_runetochar(buf, rune)));
  }
}

// Length of the UTF-8 sequence starting at pos, at least 1.
std::size_t code_point_length(const std::string& text, std::size_t pos) {
  std::size_t end = pos + 1;
  while (end < text.size() && (static_cast<unsigned char>(text[end]) & 0xC0) == 0x80) {
    ++end;
  }
  return end - pos;
}

// Advance of utf8 in points, or nullopt when MuPDF fails.
std::optional<double> measure_text(fz_context* ctx, fz_font* font, const char* utf8) {
  float advance = 0.0f;
  int failed = 0;
  fz_var(advance);
  fz_var(failed);
  fz_try(ctx) {
    const char* p = utf8;
    while (*p != '\0') {
      int rune = 0;
      p += fz_chartorune(&rune, p);
      advance += fz_advance_glyph(ctx, font, fz_encode_character(ctx, font, rune), 0);
    }
  }
  fz_catch(ctx) {
    failed = 1;
  }
  if (failed != 0) {
    return std::nullopt;
  }
  return static_cast<double>(advance) * TextPdfRenderer::kFontSize;
}

// Draws lines kLinesPerPage to a page and saves the document. Returns MuPDF's message on
// failure.
std::optional<std::string> write_pages(fz_context* ctx, fz_font* font,
                                       const std::vector<std::string>& lines,
                                       const char* path) {
  const std::size_t per_page = TextPdfRenderer::kLinesPerPage;
  const std::size_t page_count = lines.empty() ? 1 : (lines.size() + per_page - 1) / per_page;
  const fz_rect mediabox = {0.0f, 0.0f, static_cast<float>(TextPdfRenderer::kPageWidth),
                            static_cast<float>(TextPdfRenderer::kPageHeight)};
  const float black[1] = {0.0f};
  const auto size = static_cast<float>(TextPdfRenderer::kFontSize);
  const auto margin = static_cast<float>(TextPdfRenderer::kMargin);
  const auto leading = static_cast<float>(TextPdfRenderer::kLeading);

  fz_document_writer* writer = nullptr;
  fz_text* text = nullptr;
  fz_var(writer);
  fz_var(text);

  fz_try(ctx) {
    writer = fz_new_document_writer(ctx, path, "pdf", "");
    for (std::size_t page = 0; page < page_count; ++page) {
      fz_device* device = fz_begin_page(ctx, writer, mediabox);
      const std::size_t begin = page * per_page;
      const std::size_t end = std::min(lines.size(), begin + per_page);
      for (std::size_t i = begin; i < end; ++i) {
        if (lines[i].empty()) {
          continue;
        }
        // Page space runs top-down, so the glyph matrix flips y.
        fz_matrix trm = fz_scale(size, -size);
        trm.e = margin;
        trm.f = margin + size + static_cast<float>(i - begin) * leading;
        text = fz_new_text(ctx);
        fz_show_string(ctx, text, font, trm, lines[i].c_str(), 0, 0, FZ_BIDI_LTR, FZ_LANG_UNSET);
        fz_fill_text(ctx, device, text, fz_identity, fz_device_gray(ctx), black, 1.0f,
                     fz_default_color_params);
        fz_drop_text(ctx, text);
        text = nullptr;
      }
      fz_end_page(ctx, writer);
    }
    fz_close_document_writer(ctx, writer);
  }
  fz_always(ctx) {
    fz_drop_text(ctx, text);
    fz_drop_document_writer(ctx, writer);
  }
  fz_catch(ctx) {
    return std::string(fz_caught_message(ctx));
  }
  return std::nullopt;
}

}  // namespace

std::string to_pdf_text(const std::string_view utf8) {
  // fz_chartorune reads up to a terminator.
  const std::string input(utf8);
  std::string out;
  out.reserve(input.size());

  const char* p = input.c_str();
  const char* const end = p + input.size();
  while (p < end) {
    int rune = 0;
    p += fz_chartorune(&rune, p);
    append_code_point(out, rune);
  }
  return out;
}

std::vector<std::string> wrap_lines(const std::string_view text, const double max_width,
                                    const TextMeasure& measure) {
  std::vector<std::string> lines;
  std::string current;

  auto fits = [&](const std::string& candidate) { return measure(candidate) <= max_width; };

  std::size_t pos = 0;
  while (pos < text.size()) {
    while (pos < text.size() && text[pos] == ' ') {
      ++pos;
    }
    const std::size_t end = std::min(text.find(' ', pos), text.size());
    if (end == pos) {
      break;
    }
    std::string word(text.substr(pos, end - pos));
    pos = end;

    const std::string joined = current.empty() ? word : current + " " + word;
    if (fits(joined)) {
      current = joined;
      continue;
    }
    if (!current.empty()) {
      lines.push_back(current);
      current.clear();
    }
    // Split words that cannot fit on a line of their own.
    while (!word.empty() && !fits(word)) {
      std::size_t cut = code_point_length(word, 0);
      while (cut < word.size()) {
        const std::size_t next = cut + code_point_length(word, cut);
        if (!fits(word.substr(0, next))) {
          break;
        }
        cut = next;
      }
      lines.push_back(word.substr(0, cut));
      word.erase(0, cut);
    }
    current = word;
  }

  if (!current.empty() || lines.empty()) {
    lines.push_back(current);
  }
  return lines;
}

RenderResult TextPdfRenderer::render(const domain::Document& document,
                                     const std::string& /* document_path */,
                                     const std::string& pdf_path) const {
  if (auto error = io::check_destination(pdf_path, std::nullopt); error.has_value()) {
    return RenderResult::err({error->message});
  }

  ContextPtr ctx(fz_new_context(nullptr, nullptr, FZ_STORE_DEFAULT));
  if (!ctx) {
    return RenderResult::err({"Failed to create MuPDF context"});
  }

  FontHandle font(ctx.get());
  {
    fz_font* loaded = nullptr;
    fz_var(loaded);
    fz_try(ctx.get()) {
      loaded = fz_new_base14_font(ctx.get(), "Helvetica");
    }
    fz_catch(ctx.get()) {
      return RenderResult::err({std::string("Failed to load Helvetica: ") +
                                fz_caught_message(ctx.get())});
    }
    font.reset(loaded);
  }

  bool measured = true;
  const TextMeasure measure = [&](const std::string_view candidate) {
    const std::string terminated(candidate);
    const auto width = measure_text(ctx.get(), font.get(), terminated.c_str());
    if (!width.has_value()) {
      measured = false;
      return 0.0;
    }
    return *width;
  };

  std::vector<std::string> lines;
  for (const auto& paragraph : document.paragraphs) {
    for (auto& line : wrap_lines(to_pdf_text(paragraph.text), kPageWidth - 2 * kMargin, measure)) {
      lines.push_back(std::move(line));
    }
  }
  if (!measured) {
    return RenderResult::err({"Failed to measure text"});
  }

  const std::string tmp_path = pdf_path + ".tmp";
  if (auto error = write_pages(ctx.get(), font.get(), lines, tmp_path.c_str());
      error.has_value()) {
    return RenderResult::err({"Failed to write " + tmp_path + ": " + *error});
  }

  auto committed = io::commit_temp_file(tmp_path, pdf_path);
  if (!committed.has_value()) {
    return RenderResult::err({committed.error().message});
  }
  return RenderResult::ok({pdf_path, name()});
}

}  // namespace rsopt::render
