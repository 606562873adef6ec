#pragma once

#include "rsopt/render/pdf_renderer.h"

#include <chrono>
#include <string>

namespace rsopt::render {

struct CommandPdfRendererOptions {
  std::string soffice_command{"soffice"};
  std::chrono::seconds timeout{60};
};

// CommandPdfRenderer converts the written document file with LibreOffice in headless mode:
//   <soffice> --headless --convert-to pdf --outdir <pdf dir> <document_path>
// and moves "<pdf dir>/<document stem>.pdf" to pdf_path when the names differ.
class CommandPdfRenderer final : public IPdfRenderer {
 public:
  explicit CommandPdfRenderer(CommandPdfRendererOptions options = {});

  [[nodiscard]] RenderResult render(const domain::Document& document,
                                    const std::string& document_path,
                                    const std::string& pdf_path) const override;
  [[nodiscard]] std::string name() const override { return "soffice"; }

 private:
  CommandPdfRendererOptions options_;
};

}  // namespace rsopt::render
