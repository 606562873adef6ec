#include "rsopt/domain/document.h"

namespace rsopt::domain {

std::string Document::joined_text() const {
  std::string text;
  for (std::size_t i = 0; i < paragraphs.size(); ++i) {
    if (i > 0) {
      text.push_back('\n');
    }
    text += paragraphs[i].text;
  }
  return text;
}

Document make_document(const std::vector<std::string>& texts) {
  Document doc;
  doc.paragraphs.reserve(texts.size());
  for (const auto& text : texts) {
    doc.paragraphs.push_back(Paragraph{text, Formatting{}});
  }
  return doc;
}

}  // namespace rsopt::domain
