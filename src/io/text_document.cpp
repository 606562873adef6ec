#include "rsopt/io/text_document.h"

#include <fstream>

namespace rsopt::io {

domain::Document document_from_text(const std::string& text) {
  domain::Document document;
  std::size_t start = 0;
  while (start < text.size()) {
    std::size_t end = text.find('\n', start);
    if (end == std::string::npos) {
      end = text.size();
    }
    std::string line = text.substr(start, end - start);
    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
    }
    document.paragraphs.push_back(domain::Paragraph{std::move(line), {}});
    start = end + 1;
  }
  return document;
}

ReadResult TextDocumentSource::read(const std::string& path) const {
  auto bytes = read_file_bytes(path);
  if (!bytes.has_value()) {
    return ReadResult::err(bytes.error());
  }
  const auto& data = bytes.value();
  return ReadResult::ok(document_from_text(std::string(data.begin(), data.end())));
}

TextDocumentSink::TextDocumentSink(std::optional<std::string> source_path)
    : source_path_(std::move(source_path)) {}

WriteResult TextDocumentSink::write(const domain::Document& document,
                                    const std::string& dest_path) const {
  if (auto error = check_destination(dest_path, source_path_); error.has_value()) {
    return WriteResult::err(std::move(error.value()));
  }

  const std::string tmp_path = dest_path + ".tmp";
  {
    std::ofstream out(tmp_path, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
      return WriteResult::err({"Failed to open output file: " + tmp_path});
    }
    for (const auto& paragraph : document.paragraphs) {
      out << paragraph.text << '\n';
    }
    if (!out.flush()) {
      return WriteResult::err({"Failed to write output file: " + tmp_path});
    }
  }
  return commit_temp_file(tmp_path, dest_path);
}

}  // namespace rsopt::io
