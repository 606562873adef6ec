#include "rsopt/render/command_pdf_renderer.h"
#include "rsopt/render/pdf_renderer.h"
#include "rsopt/render/text_pdf_renderer.h"

namespace rsopt::render {

RenderChain::RenderChain(std::vector<std::unique_ptr<IPdfRenderer>> strategies)
    : strategies_(std::move(strategies)) {}

void RenderChain::add(std::unique_ptr<IPdfRenderer> strategy) {
  strategies_.push_back(std::move(strategy));
}

RenderResult RenderChain::render(const domain::Document& document,
                                 const std::string& document_path,
                                 const std::string& pdf_path) const {
  if (strategies_.empty()) {
    return RenderResult::err({"No PDF renderers configured"});
  }

  std::string reasons;
  for (const auto& strategy : strategies_) {
    auto result = strategy->render(document, document_path, pdf_path);
    if (result.has_value()) {
      return result;
    }
    if (!reasons.empty()) {
      reasons += "; ";
    }
    reasons += strategy->name() + ": " + result.error().message;
  }
  return RenderResult::err({"All PDF renderers failed (" + reasons + ")"});
}

std::unique_ptr<RenderChain> make_default_render_chain(const std::string& soffice_command) {
  auto chain = std::make_unique<RenderChain>();
  if (!soffice_command.empty()) {
    chain->add(std::make_unique<CommandPdfRenderer>(CommandPdfRendererOptions{soffice_command}));
  }
  chain->add(std::make_unique<TextPdfRenderer>());
  return chain;
}

}  // namespace rsopt::render
