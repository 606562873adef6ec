#pragma once

#include "rsopt/io/document_io.h"

#include <optional>
#include <string>

namespace rsopt::io {

/// Paragraphs are the w:p elements of word/document.xml in document order (table cells
/// included), skipping paragraphs nested inside another paragraph's text box. Text is the
/// concatenation of w:t runs; w:tab becomes '\t' and w:br a space. Text box content and the
/// mc:Fallback copy of alternate content are not part of the text. Formatting comes from w:pPr
/// and the first run's w:rPr.
class DocxDocumentSource final : public IDocumentSource {
 public:
  [[nodiscard]] ReadResult read(const std::string& path) const override;
  [[nodiscard]] std::string format() const override { return "docx"; }
};

/// With a template package, the template is copied and only paragraphs whose text changed
/// are rewritten in word/document.xml: their w:pPr and any run holding a drawing or text box
/// are kept, and the text runs are replaced by a single run carrying the first original run's
/// w:rPr. Every other part is copied as is.
/// The template must have the same paragraph count as the document.
///
/// Without a template, a minimal WordprocessingML package is generated from the paragraph
/// texts and formatting.
class DocxDocumentSink final : public IDocumentSink {
 public:
  explicit DocxDocumentSink(std::optional<std::string> template_path = std::nullopt,
                            std::optional<std::string> source_path = std::nullopt);

  [[nodiscard]] WriteResult write(const domain::Document& document,
                                  const std::string& dest_path) const override;
  [[nodiscard]] std::string format() const override { return "docx"; }

 private:
  [[nodiscard]] WriteResult write_from_template(const domain::Document& document,
                                                const std::string& tmp_path) const;
  [[nodiscard]] WriteResult write_fresh(const domain::Document& document,
                                        const std::string& tmp_path) const;

  std::optional<std::string> template_path_;
  std::optional<std::string> source_path_;
};

/// Reads one part (e.g. "word/document.xml") out of a DOCX package on disk.
[[nodiscard]] core::Result<std::string, DocumentIoError> read_docx_part(const std::string& path,
                                                                        const std::string& part);

}  // namespace rsopt::io
