#include "rsopt/render/command_pdf_renderer.h"

#include "rsopt/core/process.h"

#include <filesystem>

namespace rsopt::render {

namespace fs = std::filesystem;

CommandPdfRenderer::CommandPdfRenderer(CommandPdfRendererOptions options)
    : options_(std::move(options)) {}

RenderResult CommandPdfRenderer::render(const domain::Document& /* document */,
                                        const std::string& document_path,
                                        const std::string& pdf_path) const {
  std::error_code ec;
  if (document_path.empty() || !fs::exists(document_path, ec)) {
    return RenderResult::err({"Document file not found: " + document_path});
  }

  fs::path out_dir = fs::path(pdf_path).parent_path();
  if (out_dir.empty()) {
    out_dir = ".";
  }
  fs::create_directories(out_dir, ec);

  const std::string command = options_.soffice_command + " --headless --convert-to pdf --outdir " +
                              core::shell_quote(out_dir.string()) + " " +
                              core::shell_quote(document_path);
  const auto run = core::run_capture(command, options_.timeout);
  if (!run.has_value()) {
    return RenderResult::err({run.error()});
  }
  if (run.value().exit_code != 0) {
    return RenderResult::err({"Conversion exited with code " +
                              std::to_string(run.value().exit_code)});
  }

  const fs::path produced = out_dir / (fs::path(document_path).stem().string() + ".pdf");
  if (!fs::exists(produced, ec)) {
    return RenderResult::err({"Conversion produced no file at " + produced.string()});
  }
  if (produced.lexically_normal() != fs::path(pdf_path).lexically_normal()) {
    fs::rename(produced, pdf_path, ec);
    if (ec) {
      return RenderResult::err({"Failed to move " + produced.string() + " to " + pdf_path +
                                ": " + ec.message()});
    }
  }
  return RenderResult::ok({pdf_path, name()});
}

}  // namespace rsopt::render
