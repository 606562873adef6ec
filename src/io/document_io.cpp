#include "rsopt/io/document_io.h"

#include "rsopt/io/docx_document.h"
#include "rsopt/io/text_document.h"

#include <filesystem>
#include <fstream>

namespace rsopt::io {

namespace fs = std::filesystem;

std::string file_extension(const std::string& path) {
  std::string ext = fs::path(path).extension().string();
  for (char& ch : ext) {
    if (ch >= 'A' && ch <= 'Z') {
      ch = static_cast<char>(ch - 'A' + 'a');
    }
  }
  return ext;
}

bool is_supported_extension(const std::string& extension) {
  return extension == ".docx" || extension == ".txt";
}

std::unique_ptr<IDocumentSource> create_document_source(const std::string& path) {
  const std::string ext = file_extension(path);
  if (ext == ".docx") {
    return std::make_unique<DocxDocumentSource>();
  }
  if (ext == ".txt") {
    return std::make_unique<TextDocumentSource>();
  }
  return nullptr;
}

std::unique_ptr<IDocumentSink> create_document_sink(
    const std::string& dest_path, const std::optional<std::string>& source_path) {
  const std::string ext = file_extension(dest_path);
  if (ext == ".docx") {
    // Only a DOCX source can serve as the package template.
    std::optional<std::string> template_path;
    if (source_path.has_value() && file_extension(source_path.value()) == ".docx") {
      template_path = source_path;
    }
    return std::make_unique<DocxDocumentSink>(template_path, source_path);
  }
  if (ext == ".txt") {
    return std::make_unique<TextDocumentSink>(source_path);
  }
  return nullptr;
}

core::Result<std::vector<std::uint8_t>, DocumentIoError> read_file_bytes(const std::string& path) {
  using BytesResult = core::Result<std::vector<std::uint8_t>, DocumentIoError>;

  std::ifstream file(path, std::ios::binary | std::ios::ate);
  if (!file.is_open()) {
    return BytesResult::err({"Failed to open file: " + path});
  }

  const auto size = file.tellg();
  file.seekg(0, std::ios::beg);

  std::vector<std::uint8_t> data(static_cast<std::size_t>(size));
  if (size > 0 && !file.read(reinterpret_cast<char*>(data.data()), size)) {
    return BytesResult::err({"Failed to read file: " + path});
  }
  return BytesResult::ok(std::move(data));
}

std::optional<DocumentIoError> check_destination(const std::string& dest_path,
                                                 const std::optional<std::string>& source_path) {
  std::error_code ec;
  if (source_path.has_value()) {
    const bool same = fs::exists(dest_path, ec) && fs::equivalent(dest_path, *source_path, ec);
    if (same || fs::path(dest_path).lexically_normal() ==
                    fs::path(*source_path).lexically_normal()) {
      return DocumentIoError{"Refusing to overwrite the source document: " + dest_path};
    }
  }

  const fs::path parent = fs::path(dest_path).parent_path();
  if (!parent.empty()) {
    fs::create_directories(parent, ec);
    if (ec) {
      return DocumentIoError{"Failed to create output directory " + parent.string() + ": " +
                             ec.message()};
    }
  }
  return std::nullopt;
}

WriteResult commit_temp_file(const std::string& tmp_path, const std::string& dest_path) {
  std::error_code ec;
  fs::rename(tmp_path, dest_path, ec);
  if (ec) {
    std::error_code ignored;
    fs::remove(tmp_path, ignored);
    return WriteResult::err({"Failed to move output into place at " + dest_path + ": " +
                             ec.message()});
  }
  return WriteResult::ok(dest_path);
}

}  // namespace rsopt::io
