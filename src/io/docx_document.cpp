#include "rsopt/io/docx_document.h"

#include <pugixml.hpp>
#include <zip.h>

#include <filesystem>
#include <sstream>
#include <vector>

namespace rsopt::io {

using PartResult = core::Result<std::string, DocumentIoError>;

namespace {

bool is_on(const pugi::xml_node& toggle) {
  if (!toggle) {
    return false;
  }
  const std::string val = toggle.attribute("w:val").as_string("true");
  return val != "0" && val != "false" && val != "off";
}

domain::Formatting read_formatting(const pugi::xml_node& paragraph) {
  domain::Formatting fmt;

  const pugi::xml_node ppr = paragraph.child("w:pPr");
  if (const auto style = ppr.child("w:pStyle"); style) {
    fmt.style_id = style.attribute("w:val").as_string();
  }
  if (const auto jc = ppr.child("w:jc"); jc) {
    fmt.alignment = jc.attribute("w:val").as_string();
  }
  if (const auto ind = ppr.child("w:ind"); ind) {
    if (const auto left = ind.attribute("w:left"); left) {
      fmt.indent_left = left.as_int();
    }
    if (const auto first = ind.attribute("w:firstLine"); first) {
      fmt.indent_first_line = first.as_int();
    }
  }

  const pugi::xml_node rpr = paragraph.child("w:r").child("w:rPr");
  if (rpr) {
    if (const auto b = rpr.child("w:b"); b) {
      fmt.bold = is_on(b);
    }
    if (const auto i = rpr.child("w:i"); i) {
      fmt.italic = is_on(i);
    }
    if (const auto u = rpr.child("w:u"); u) {
      fmt.underline = u.attribute("w:val").as_string("single");
    }
    if (const auto fonts = rpr.child("w:rFonts"); fonts && fonts.attribute("w:ascii")) {
      fmt.font_name = fonts.attribute("w:ascii").as_string();
    }
    if (const auto sz = rpr.child("w:sz"); sz) {
      fmt.font_size_half_points = sz.attribute("w:val").as_int();
    }
  }
  return fmt;
}

void append_text(const pugi::xml_node& node, std::string& text) {
  for (const pugi::xml_node child : node.children()) {
    const std::string name = child.name();
    if (name == "w:t") {
      text += child.child_value();
    } else if (name == "w:tab") {
      text.push_back('\t');
    } else if (name == "w:br" || name == "w:cr") {
      text.push_back(' ');
    } else if (name == "w:pPr" || name == "w:rPr" || name == "w:p" || name == "w:txbxContent" ||
               name == "mc:Fallback") {
      // Properties, text boxes and the fallback copy of alternate content are not body text.
      continue;
    } else {
      append_text(child, text);
    }
  }
}

std::string read_text(const pugi::xml_node& paragraph) {
  std::string text;
  append_text(paragraph, text);
  return text;
}

// Paragraphs of the document flow, in order. Paragraphs nested in text boxes belong to the
// paragraph that anchors them.
std::vector<pugi::xml_node> body_paragraphs(const pugi::xml_document& doc) {
  std::vector<pugi::xml_node> paragraphs;
  for (const pugi::xpath_node& node : doc.select_nodes("//w:p[not(ancestor::w:p)]")) {
    paragraphs.push_back(node.node());
  }
  return paragraphs;
}

}  // namespace

PartResult read_docx_part(const std::string& path, const std::string& part) {
  int error_code = 0;
  zip_t* archive = zip_open(path.c_str(), ZIP_RDONLY, &error_code);
  if (!archive) {
    return PartResult::err({"Failed to open DOCX as ZIP archive: " + path});
  }

  zip_stat_t st;
  zip_stat_init(&st);
  if (zip_stat(archive, part.c_str(), 0, &st) != 0) {
    zip_close(archive);
    return PartResult::err({"Failed to find " + part + " in " + path});
  }

  zip_file_t* file = zip_fopen(archive, part.c_str(), 0);
  if (!file) {
    zip_close(archive);
    return PartResult::err({"Failed to open " + part + " in " + path});
  }

  std::string data(static_cast<std::size_t>(st.size), '\0');
  const zip_int64_t bytes_read = zip_fread(file, data.data(), st.size);
  zip_fclose(file);
  zip_close(archive);

  if (bytes_read != static_cast<zip_int64_t>(st.size)) {
    return PartResult::err({"Failed to read " + part + " completely"});
  }
  return PartResult::ok(std::move(data));
}

ReadResult DocxDocumentSource::read(const std::string& path) const {
  auto xml = read_docx_part(path, "word/document.xml");
  if (!xml.has_value()) {
    return ReadResult::err(xml.error());
  }

  pugi::xml_document doc;
  const pugi::xml_parse_result parsed =
      doc.load_buffer(xml.value().data(), xml.value().size(),
                      pugi::parse_default | pugi::parse_ws_pcdata);
  if (!parsed) {
    return ReadResult::err({"Failed to parse word/document.xml as XML: " +
                            std::string(parsed.description())});
  }

  domain::Document document;
  for (const pugi::xml_node& paragraph : body_paragraphs(doc)) {
    document.paragraphs.push_back(
        domain::Paragraph{read_text(paragraph), read_formatting(paragraph)});
  }
  return ReadResult::ok(std::move(document));
}

}  // namespace rsopt::io

namespace rsopt::io {

namespace fs = std::filesystem;

namespace {

constexpr unsigned int kXmlParseFlags =
    pugi::parse_default | pugi::parse_declaration | pugi::parse_ws_pcdata;

constexpr const char* kContentTypesXml =
    R"(<?xml version="1.0" encoding="UTF-8" standalone="yes"?>)"
    R"(<Types xmlns="http://schemas.openxmlformats.org/package/2006/content-types">)"
    R"(<Default Extension="rels" ContentType="application/vnd.openxmlformats-package.relationships+xml"/>)"
    R"(<Default Extension="xml" ContentType="application/xml"/>)"
    R"(<Override PartName="/word/document.xml" ContentType="application/vnd.openxmlformats-officedocument.wordprocessingml.document.main+xml"/>)"
    R"(</Types>)";

constexpr const char* kPackageRelsXml =
    R"(<?xml version="1.0" encoding="UTF-8" standalone="yes"?>)"
    R"(<Relationships xmlns="http://schemas.openxmlformats.org/package/2006/relationships">)"
    R"(<Relationship Id="rId1" Type="http://schemas.openxmlformats.org/officeDocument/2006/relationships/officeDocument" Target="word/document.xml"/>)"
    R"(</Relationships>)";

std::string serialize(const pugi::xml_document& doc) {
  std::ostringstream out;
  doc.save(out, "", pugi::format_raw);
  return out.str();
}

void fill_text_run(pugi::xml_node run, const std::string& text, const pugi::xml_node& rpr) {
  if (rpr) {
    run.append_copy(rpr);
  }
  pugi::xml_node t = run.append_child("w:t");
  t.append_attribute("xml:space") = "preserve";
  t.text().set(text.c_str());
}

void append_text_run(pugi::xml_node paragraph, const std::string& text,
                     const pugi::xml_node& rpr) {
  fill_text_run(paragraph.append_child("w:r"), text, rpr);
}

bool is_embedded_object(const pugi::xml_node& node) {
  const std::string name = node.name();
  return name == "w:drawing" || name == "w:pict" || name == "w:object" ||
         name == "mc:AlternateContent";
}

// Replaces the text of a paragraph with one run. Paragraph properties and runs that carry
// drawings or text boxes stay in place; the new run takes the position of the first run removed.
void replace_paragraph_text(pugi::xml_node p, const std::string& text) {
  pugi::xml_document holder;
  const pugi::xml_node original_rpr = p.child("w:r").child("w:rPr");
  const pugi::xml_node rpr = original_rpr ? holder.append_copy(original_rpr) : pugi::xml_node();

  std::vector<pugi::xml_node> removed;
  for (pugi::xml_node child : p.children()) {
    if (std::string(child.name()) == "w:pPr") {
      continue;
    }
    if (is_embedded_object(child) || child.find_node(is_embedded_object)) {
      while (pugi::xml_node t = child.child("w:t")) {
        child.remove_child(t);
      }
      continue;
    }
    removed.push_back(child);
  }

  if (!text.empty()) {
    if (removed.empty()) {
      append_text_run(p, text, rpr);
    } else {
      fill_text_run(p.insert_child_before("w:r", removed.front()), text, rpr);
    }
  }
  for (const pugi::xml_node& child : removed) {
    p.remove_child(child);
  }
}

void set_toggle(pugi::xml_node rpr, const char* name, const std::optional<bool>& value) {
  if (!value.has_value()) {
    return;
  }
  pugi::xml_node toggle = rpr.append_child(name);
  if (!value.value()) {
    toggle.append_attribute("w:val") = "0";
  }
}

void append_paragraph(pugi::xml_node body, const domain::Paragraph& paragraph) {
  const domain::Formatting& fmt = paragraph.formatting;
  pugi::xml_node p = body.append_child("w:p");

  if (fmt.style_id || fmt.alignment || fmt.indent_left || fmt.indent_first_line) {
    pugi::xml_node ppr = p.append_child("w:pPr");
    if (fmt.style_id) {
      ppr.append_child("w:pStyle").append_attribute("w:val") = fmt.style_id->c_str();
    }
    if (fmt.indent_left || fmt.indent_first_line) {
      pugi::xml_node ind = ppr.append_child("w:ind");
      if (fmt.indent_left) {
        ind.append_attribute("w:left") = *fmt.indent_left;
      }
      if (fmt.indent_first_line) {
        ind.append_attribute("w:firstLine") = *fmt.indent_first_line;
      }
    }
    if (fmt.alignment) {
      ppr.append_child("w:jc").append_attribute("w:val") = fmt.alignment->c_str();
    }
  }

  if (paragraph.text.empty()) {
    return;
  }

  // w:rPr children follow the schema order: rFonts, b, i, sz, u.
  pugi::xml_document holder;
  pugi::xml_node rpr = holder.append_child("w:rPr");
  if (fmt.font_name) {
    pugi::xml_node fonts = rpr.append_child("w:rFonts");
    fonts.append_attribute("w:ascii") = fmt.font_name->c_str();
    fonts.append_attribute("w:hAnsi") = fmt.font_name->c_str();
  }
  set_toggle(rpr, "w:b", fmt.bold);
  set_toggle(rpr, "w:i", fmt.italic);
  if (fmt.font_size_half_points) {
    rpr.append_child("w:sz").append_attribute("w:val") = *fmt.font_size_half_points;
  }
  if (fmt.underline) {
    rpr.append_child("w:u").append_attribute("w:val") = fmt.underline->c_str();
  }
  append_text_run(p, paragraph.text, rpr.first_child() ? rpr : pugi::xml_node());
}

// Adds an in-memory part. data must stay alive until zip_close.
bool add_part(zip_t* archive, const char* name, const std::string& data) {
  zip_source_t* src = zip_source_buffer(archive, data.data(), data.size(), 0);
  if (!src) {
    return false;
  }
  if (zip_file_add(archive, name, src, ZIP_FL_OVERWRITE | ZIP_FL_ENC_UTF_8) < 0) {
    zip_source_free(src);
    return false;
  }
  return true;
}

WriteResult close_archive(zip_t* archive, const std::string& tmp_path) {
  if (zip_close(archive) != 0) {
    const std::string reason = zip_strerror(archive);
    zip_discard(archive);
    std::error_code ignored;
    fs::remove(tmp_path, ignored);
    return WriteResult::err({"Failed to write DOCX package " + tmp_path + ": " + reason});
  }
  return WriteResult::ok(tmp_path);
}

}  // namespace

DocxDocumentSink::DocxDocumentSink(std::optional<std::string> template_path,
                                   std::optional<std::string> source_path)
    : template_path_(std::move(template_path)), source_path_(std::move(source_path)) {}

WriteResult DocxDocumentSink::write(const domain::Document& document,
                                    const std::string& dest_path) const {
  if (auto error = check_destination(dest_path, source_path_); error.has_value()) {
    return WriteResult::err(std::move(error.value()));
  }
  if (template_path_.has_value()) {
    if (auto error = check_destination(dest_path, template_path_); error.has_value()) {
      return WriteResult::err(std::move(error.value()));
    }
  }

  const std::string tmp_path = dest_path + ".tmp";
  const WriteResult written = template_path_.has_value() ? write_from_template(document, tmp_path)
                                                         : write_fresh(document, tmp_path);
  if (!written.has_value()) {
    return written;
  }
  return commit_temp_file(tmp_path, dest_path);
}

WriteResult DocxDocumentSink::write_from_template(const domain::Document& document,
                                                  const std::string& tmp_path) const {
  auto xml = read_docx_part(*template_path_, "word/document.xml");
  if (!xml.has_value()) {
    return WriteResult::err(xml.error());
  }

  pugi::xml_document doc;
  const pugi::xml_parse_result parsed =
      doc.load_buffer(xml.value().data(), xml.value().size(), kXmlParseFlags);
  if (!parsed) {
    return WriteResult::err({"Failed to parse template word/document.xml: " +
                             std::string(parsed.description())});
  }

  const std::vector<pugi::xml_node> paragraphs = body_paragraphs(doc);
  if (paragraphs.size() != document.paragraphs.size()) {
    return WriteResult::err({"Template has " + std::to_string(paragraphs.size()) +
                             " paragraphs but the document has " +
                             std::to_string(document.paragraphs.size())});
  }

  for (std::size_t i = 0; i < paragraphs.size(); ++i) {
    const std::string& text = document.paragraphs[i].text;
    if (read_text(paragraphs[i]) != text) {
      replace_paragraph_text(paragraphs[i], text);
    }
  }

  std::error_code ec;
  fs::copy_file(*template_path_, tmp_path, fs::copy_options::overwrite_existing, ec);
  if (ec) {
    return WriteResult::err({"Failed to copy template " + *template_path_ + ": " + ec.message()});
  }

  int error_code = 0;
  zip_t* archive = zip_open(tmp_path.c_str(), 0, &error_code);
  if (!archive) {
    fs::remove(tmp_path, ec);
    return WriteResult::err({"Failed to open DOCX package " + tmp_path});
  }

  const std::string document_xml = serialize(doc);
  if (!add_part(archive, "word/document.xml", document_xml)) {
    zip_discard(archive);
    fs::remove(tmp_path, ec);
    return WriteResult::err({"Failed to replace word/document.xml in " + tmp_path});
  }
  return close_archive(archive, tmp_path);
}

WriteResult DocxDocumentSink::write_fresh(const domain::Document& document,
                                          const std::string& tmp_path) const {
  pugi::xml_document doc;
  pugi::xml_node decl = doc.append_child(pugi::node_declaration);
  decl.append_attribute("version") = "1.0";
  decl.append_attribute("encoding") = "UTF-8";
  decl.append_attribute("standalone") = "yes";

  pugi::xml_node root = doc.append_child("w:document");
  root.append_attribute("xmlns:w") = "http://schemas.openxmlformats.org/wordprocessingml/2006/main";
  pugi::xml_node body = root.append_child("w:body");
  for (const auto& paragraph : document.paragraphs) {
    append_paragraph(body, paragraph);
  }

  // US Letter, 1 inch margins.
  pugi::xml_node sect = body.append_child("w:sectPr");
  pugi::xml_node size = sect.append_child("w:pgSz");
  size.append_attribute("w:w") = 12240;
  size.append_attribute("w:h") = 15840;
  pugi::xml_node margins = sect.append_child("w:pgMar");
  for (const char* side : {"w:top", "w:right", "w:bottom", "w:left"}) {
    margins.append_attribute(side) = 1440;
  }

  const std::string document_xml = serialize(doc);
  const std::string content_types = kContentTypesXml;
  const std::string package_rels = kPackageRelsXml;

  int error_code = 0;
  zip_t* archive = zip_open(tmp_path.c_str(), ZIP_CREATE | ZIP_TRUNCATE, &error_code);
  if (!archive) {
    return WriteResult::err({"Failed to create DOCX package " + tmp_path});
  }
  if (!add_part(archive, "[Content_Types].xml", content_types) ||
      !add_part(archive, "_rels/.rels", package_rels) ||
      !add_part(archive, "word/document.xml", document_xml)) {
    zip_discard(archive);
    std::error_code ignored;
    fs::remove(tmp_path, ignored);
    return WriteResult::err({"Failed to add parts to DOCX package " + tmp_path});
  }
  return close_archive(archive, tmp_path);
}

}  // namespace rsopt::io
