#pragma once

#include "rsopt/core/result.h"
#include "rsopt/domain/document.h"

#include <memory>
#include <string>
#include <vector>

namespace rsopt::render {

struct RenderError {
  std::string message;
};

struct RenderedPdf {
  std::string pdf_path;
  std::string renderer;  // name() of the strategy that produced it
};

using RenderResult = core::Result<RenderedPdf, RenderError>;

// IPdfRenderer produces a fixed-layout rendering of a rebuilt document. document_path is the
// file the document was written to (strategies that convert files use it); document is the
// same content in memory.
class IPdfRenderer {
 public:
  virtual ~IPdfRenderer() = default;

  [[nodiscard]] virtual RenderResult render(const domain::Document& document,
                                            const std::string& document_path,
                                            const std::string& pdf_path) const = 0;

  [[nodiscard]] virtual std::string name() const = 0;
};

// RenderChain tries its strategies in order; the first success wins. When all fail the
// error lists every strategy's reason.
class RenderChain final : public IPdfRenderer {
 public:
  RenderChain() = default;
  explicit RenderChain(std::vector<std::unique_ptr<IPdfRenderer>> strategies);

  void add(std::unique_ptr<IPdfRenderer> strategy);
  [[nodiscard]] std::size_t size() const { return strategies_.size(); }

  [[nodiscard]] RenderResult render(const domain::Document& document,
                                    const std::string& document_path,
                                    const std::string& pdf_path) const override;
  [[nodiscard]] std::string name() const override { return "chain"; }

 private:
  std::vector<std::unique_ptr<IPdfRenderer>> strategies_;
};

// Default chain: LibreOffice conversion when soffice_command is non-empty, then the built-in
// text renderer.
[[nodiscard]] std::unique_ptr<RenderChain> make_default_render_chain(
    const std::string& soffice_command = "soffice");

}  // namespace rsopt::render
