#include "rsopt/io/document_io.h"
#include "rsopt/io/docx_document.h"

#include <catch2/catch_test_macros.hpp>
#include <zip.h>

#include <filesystem>
#include <string>

using namespace rsopt;

namespace {

domain::Document sample_document() {
  auto doc = domain::make_document({"SKILLS", "Python | Git", "", "EXPERIENCE",
                                    "Built data pipelines"});
  doc.paragraphs[0].formatting.style_id = "Heading1";
  doc.paragraphs[0].formatting.bold = true;
  doc.paragraphs[1].formatting.font_name = "Calibri";
  doc.paragraphs[1].formatting.font_size_half_points = 22;
  doc.paragraphs[1].formatting.alignment = "left";
  doc.paragraphs[4].formatting.indent_left = 720;
  doc.paragraphs[4].formatting.indent_first_line = 360;
  doc.paragraphs[4].formatting.italic = false;
  doc.paragraphs[4].formatting.underline = "single";
  return doc;
}

// A heading and a body paragraph whose second run anchors a text box, stored both as the
// mc:Choice drawing and the VML fallback.
constexpr const char* kTextBoxDocumentXml =
    R"(<?xml version="1.0" encoding="UTF-8" standalone="yes"?>)"
    R"(<w:document xmlns:w="http://schemas.openxmlformats.org/wordprocessingml/2006/main")"
    R"( xmlns:mc="http://schemas.openxmlformats.org/markup-compatibility/2006"><w:body>)"
    R"(<w:p><w:pPr><w:tabs><w:tab w:val="left" w:pos="720"/></w:tabs></w:pPr>)"
    R"(<w:r><w:t>Skills</w:t></w:r></w:p>)"
    R"(<w:p><w:r><w:rPr><w:b/></w:rPr><w:t>Python</w:t></w:r>)"
    R"(<w:r><mc:AlternateContent>)"
    R"(<mc:Choice Requires="wps"><w:drawing><w:txbxContent>)"
    R"(<w:p><w:r><w:t>Box</w:t></w:r></w:p>)"
    R"(</w:txbxContent></w:drawing></mc:Choice>)"
    R"(<mc:Fallback><w:pict><w:txbxContent>)"
    R"(<w:p><w:r><w:t>Box</w:t></w:r></w:p>)"
    R"(</w:txbxContent></w:pict></mc:Fallback>)"
    R"(</mc:AlternateContent></w:r></w:p>)"
    R"(</w:body></w:document>)";

// Writes a package holding only word/document.xml.
bool write_package(const std::string& path, const std::string& document_xml) {
  int error_code = 0;
  zip_t* archive = zip_open(path.c_str(), ZIP_CREATE | ZIP_TRUNCATE, &error_code);
  if (!archive) {
    return false;
  }
  zip_source_t* src = zip_source_buffer(archive, document_xml.data(), document_xml.size(), 0);
  if (!src || zip_file_add(archive, "word/document.xml", src, ZIP_FL_OVERWRITE) < 0) {
    zip_source_free(src);
    zip_discard(archive);
    return false;
  }
  return zip_close(archive) == 0;
}

}  // namespace

TEST_CASE("DOCX sink writes a package the source can read", "[io][docx]") {
  const std::string path = "test_docx_fresh.docx";
  const auto doc = sample_document();

  const io::DocxDocumentSink sink;
  const auto written = sink.write(doc, path);
  REQUIRE(written.has_value());

  const auto read = io::DocxDocumentSource().read(path);
  REQUIRE(read.has_value());
  CHECK(read.value() == doc);

  const auto content_types = io::read_docx_part(path, "[Content_Types].xml");
  REQUIRE(content_types.has_value());
  CHECK(content_types.value().find("wordprocessingml") != std::string::npos);

  std::filesystem::remove(path);
}

TEST_CASE("DOCX template mode rewrites changed paragraphs only", "[io][docx]") {
  const std::string source_path = "test_docx_template.docx";
  const std::string dest_path = "test_docx_out/optimized.docx";
  const auto doc = sample_document();
  REQUIRE(io::DocxDocumentSink().write(doc, source_path).has_value());

  auto changed = doc;
  changed.paragraphs[1].text = "Python | Git | Docker";
  changed.paragraphs[4].text = "Built data pipelines. Utilized Kafka for development.";

  const auto sink = io::create_document_sink(dest_path, source_path);
  REQUIRE(sink != nullptr);
  REQUIRE(sink->write(changed, dest_path).has_value());

  const auto read = io::DocxDocumentSource().read(dest_path);
  REQUIRE(read.has_value());
  REQUIRE(read.value().paragraphs.size() == changed.paragraphs.size());
  CHECK(read.value() == changed);

  SECTION("paragraph count must match the template") {
    auto extra = changed;
    extra.paragraphs.push_back(domain::Paragraph{"Another line", {}});
    const auto result = io::DocxDocumentSink(source_path).write(extra, "test_docx_out/extra.docx");
    REQUIRE_FALSE(result.has_value());
    CHECK(result.error().message.find("paragraphs") != std::string::npos);
  }

  SECTION("the source is never overwritten") {
    const auto result = sink->write(changed, source_path);
    CHECK_FALSE(result.has_value());
  }

  std::filesystem::remove(source_path);
  std::filesystem::remove_all("test_docx_out");
}

TEST_CASE("DOCX source reports unreadable files", "[io][docx]") {
  const auto missing = io::DocxDocumentSource().read("does_not_exist.docx");
  REQUIRE_FALSE(missing.has_value());
  CHECK(missing.error().message.find("does_not_exist.docx") != std::string::npos);
}

TEST_CASE("DOCX text boxes stay with their anchoring paragraph", "[io][docx]") {
  const std::string source_path = "test_docx_textbox.docx";
  const std::string dest_path = "test_docx_textbox_out/optimized.docx";
  REQUIRE(write_package(source_path, kTextBoxDocumentXml));

  const auto read = io::DocxDocumentSource().read(source_path);
  REQUIRE(read.has_value());
  REQUIRE(read.value().paragraphs.size() == 2);
  CHECK(read.value().paragraphs[0].text == "Skills");
  CHECK(read.value().paragraphs[1].text == "Python");
  CHECK(read.value().paragraphs[1].formatting.bold == true);

  auto changed = read.value();
  changed.paragraphs[1].text = "Python | Docker";
  REQUIRE(io::DocxDocumentSink(source_path).write(changed, dest_path).has_value());

  const auto reread = io::DocxDocumentSource().read(dest_path);
  REQUIRE(reread.has_value());
  REQUIRE(reread.value().paragraphs.size() == 2);
  CHECK(reread.value().paragraphs[0].text == "Skills");
  CHECK(reread.value().paragraphs[1].text == "Python | Docker");
  CHECK(reread.value().paragraphs[1].formatting.bold == true);

  const auto xml = io::read_docx_part(dest_path, "word/document.xml");
  REQUIRE(xml.has_value());
  CHECK(xml.value().find("w:txbxContent") != std::string::npos);
  CHECK(xml.value().find("Box") != std::string::npos);
  CHECK(xml.value().find("Python | Docker") < xml.value().find("mc:AlternateContent"));

  std::filesystem::remove(source_path);
  std::filesystem::remove_all("test_docx_textbox_out");
}
