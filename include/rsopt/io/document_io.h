#pragma once

#include "rsopt/core/result.h"
#include "rsopt/domain/document.h"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace rsopt::io {

struct DocumentIoError {
  std::string message;
};

using ReadResult = core::Result<domain::Document, DocumentIoError>;
// Success carries the path that was written.
using WriteResult = core::Result<std::string, DocumentIoError>;

/// Reads an ordered paragraph list (text + formatting) from a stored resume file.
class IDocumentSource {
 public:
  virtual ~IDocumentSource() = default;

  [[nodiscard]] virtual ReadResult read(const std::string& path) const = 0;

  /// Format identifier, e.g. "docx", "txt"
  [[nodiscard]] virtual std::string format() const = 0;
};

/// Writes a paragraph list to a new file. Implementations write "<dest>.tmp" first and rename
/// it over dest, so a failed write never leaves a partial file, and they refuse to overwrite
/// the source document.
class IDocumentSink {
 public:
  virtual ~IDocumentSink() = default;

  [[nodiscard]] virtual WriteResult write(const domain::Document& document,
                                          const std::string& dest_path) const = 0;

  [[nodiscard]] virtual std::string format() const = 0;
};

/// Lowercase extension including the dot (".docx"), empty when there is none.
[[nodiscard]] std::string file_extension(const std::string& path);

/// Extensions accepted for upload and optimization: ".docx" and ".txt".
[[nodiscard]] bool is_supported_extension(const std::string& extension);

/// Source for the file's extension, nullptr when unsupported.
[[nodiscard]] std::unique_ptr<IDocumentSource> create_document_source(const std::string& path);

/// Sink for dest_path's extension, nullptr when unsupported. source_path is the document the
/// output derives from: the DOCX sink patches it (template mode) and every sink refuses to
/// write over it.
[[nodiscard]] std::unique_ptr<IDocumentSink> create_document_sink(
    const std::string& dest_path, const std::optional<std::string>& source_path);

// File helpers shared by the sinks.

[[nodiscard]] core::Result<std::vector<std::uint8_t>, DocumentIoError> read_file_bytes(
    const std::string& path);

/// Error when dest resolves to the same file as source, or its directory cannot be created.
[[nodiscard]] std::optional<DocumentIoError> check_destination(
    const std::string& dest_path, const std::optional<std::string>& source_path);

/// Renames tmp_path over dest_path; removes tmp_path on failure.
[[nodiscard]] WriteResult commit_temp_file(const std::string& tmp_path,
                                           const std::string& dest_path);

}  // namespace rsopt::io
