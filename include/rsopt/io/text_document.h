#pragma once

#include "rsopt/io/document_io.h"

#include <optional>
#include <string>

namespace rsopt::io {

/// Plain text: one paragraph per line, no formatting. A trailing newline does not add an
/// empty paragraph; "\r\n" line endings are accepted.
class TextDocumentSource final : public IDocumentSource {
 public:
  [[nodiscard]] ReadResult read(const std::string& path) const override;
  [[nodiscard]] std::string format() const override { return "txt"; }
};

class TextDocumentSink final : public IDocumentSink {
 public:
  explicit TextDocumentSink(std::optional<std::string> source_path = std::nullopt);

  [[nodiscard]] WriteResult write(const domain::Document& document,
                                  const std::string& dest_path) const override;
  [[nodiscard]] std::string format() const override { return "txt"; }

 private:
  std::optional<std::string> source_path_;
};

/// Parses text already in memory with the same rules as TextDocumentSource.
[[nodiscard]] domain::Document document_from_text(const std::string& text);

}  // namespace rsopt::io
