#include "docu_mcp/extractors/extractor.hpp"

#include <memory>
#include <stdexcept>

namespace docu_mcp::extractors {
namespace {

class UnavailablePdfExtractor final : public TextExtractor {
 public:
  std::string extract(std::string_view /*bytes*/) const override {
    throw std::runtime_error("PDF support was not enabled in this build (libqpdf not found)");
  }

  const char* name() const noexcept override { return "PdfExtractor"; }
};

}  // namespace

std::unique_ptr<TextExtractor> make_pdf_extractor() { return std::make_unique<UnavailablePdfExtractor>(); }

}  // namespace docu_mcp::extractors
