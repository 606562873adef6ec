#include "rsopt/io/document_io.h"
#include "rsopt/io/text_document.h"

#include <catch2/catch_test_macros.hpp>

#include <filesystem>
#include <fstream>
#include <string>

using namespace rsopt;

namespace {

void write_file(const std::string& path, const std::string& content) {
  std::ofstream out(path, std::ios::binary);
  out << content;
}

}  // namespace

TEST_CASE("document_from_text splits lines into paragraphs", "[io][text]") {
  const auto doc = io::document_from_text("SKILLS\r\nPython | Go\n\nEXPERIENCE\n");

  REQUIRE(doc.paragraphs.size() == 4);
  CHECK(doc.paragraphs[0].text == "SKILLS");
  CHECK(doc.paragraphs[1].text == "Python | Go");
  CHECK(doc.paragraphs[2].text.empty());
  CHECK(doc.paragraphs[3].text == "EXPERIENCE");
  CHECK(io::document_from_text("").paragraphs.empty());
}

TEST_CASE("Text sink writes and the source reads back", "[io][text]") {
  const std::string source_path = "test_text_source.txt";
  const std::string dest_path = "test_text_out/optimized.txt";
  write_file(source_path, "SKILLS\nPython\n");

  const auto source = io::create_document_source(source_path);
  REQUIRE(source != nullptr);
  CHECK(source->format() == "txt");
  auto read = source->read(source_path);
  REQUIRE(read.has_value());

  auto doc = read.value();
  doc.paragraphs[1].text = "Python, Docker";

  const auto sink = io::create_document_sink(dest_path, source_path);
  REQUIRE(sink != nullptr);
  const auto written = sink->write(doc, dest_path);
  REQUIRE(written.has_value());
  CHECK(written.value() == dest_path);
  CHECK_FALSE(std::filesystem::exists(dest_path + ".tmp"));

  const auto reread = io::TextDocumentSource().read(dest_path);
  REQUIRE(reread.has_value());
  CHECK(reread.value() == doc);

  std::filesystem::remove(source_path);
  std::filesystem::remove_all("test_text_out");
}

TEST_CASE("Text sink refuses to overwrite its source", "[io][text]") {
  const std::string path = "test_text_same.txt";
  write_file(path, "original\n");

  const io::TextDocumentSink sink(path);
  const auto result = sink.write(domain::make_document({"changed"}), path);
  REQUIRE_FALSE(result.has_value());
  CHECK(result.error().message.find("Refusing") != std::string::npos);

  const auto reread = io::TextDocumentSource().read(path);
  REQUIRE(reread.has_value());
  CHECK(reread.value().paragraphs[0].text == "original");

  std::filesystem::remove(path);
}

TEST_CASE("Document IO helpers", "[io]") {
  CHECK(io::file_extension("resume.DOCX") == ".docx");
  CHECK(io::file_extension("notes") == "");
  CHECK(io::is_supported_extension(".txt"));
  CHECK_FALSE(io::is_supported_extension(".pdf"));
  CHECK(io::create_document_source("resume.pdf") == nullptr);
  CHECK(io::create_document_sink("resume.odt", std::nullopt) == nullptr);

  const auto missing = io::TextDocumentSource().read("does_not_exist.txt");
  REQUIRE_FALSE(missing.has_value());
  CHECK(missing.error().message.find("does_not_exist.txt") != std::string::npos);
}
