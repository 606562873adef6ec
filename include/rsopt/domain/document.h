#pragma once

#include <optional>
#include <string>
#include <vector>

namespace rsopt::domain {

// Formatting is the attribute bag carried by a paragraph from source to output.
// Every field is optional: an unset field means "not specified in the source", and sinks
// emit only what is set. Values are kept in WordprocessingML units.
struct Formatting {
  std::optional<std::string> style_id;           // w:pStyle, e.g. "Heading1"
  std::optional<std::string> alignment;          // w:jc, e.g. "left", "center", "both"
  std::optional<int> indent_left;                // w:ind/@w:left, twips
  std::optional<int> indent_first_line;          // w:ind/@w:firstLine, twips
  std::optional<bool> bold;                      // w:b on the first run
  std::optional<bool> italic;                    // w:i on the first run
  std::optional<std::string> underline;          // w:u/@w:val, e.g. "single"
  std::optional<std::string> font_name;          // w:rFonts/@w:ascii
  std::optional<int> font_size_half_points;      // w:sz/@w:val

  bool operator==(const Formatting&) const = default;
};

struct Paragraph {
  std::string text;
  Formatting formatting;

  bool operator==(const Paragraph&) const = default;
};

// Document is an ordered paragraph sequence. The optimizer never mutates a Document it was
// given; rebuilding produces a new one with the same paragraph count.
struct Document {
  std::vector<Paragraph> paragraphs;

  bool operator==(const Document&) const = default;

  // Paragraph texts joined with '\n' (empty paragraphs included).
  [[nodiscard]] std::string joined_text() const;
};

// Build a Document with default formatting from plain paragraph texts.
[[nodiscard]] Document make_document(const std::vector<std::string>& texts);

}  // namespace rsopt::domain
