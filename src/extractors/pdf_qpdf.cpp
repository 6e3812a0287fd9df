#include "docu_mcp/extractors/extractor.hpp"

#include <memory>
#include <sstream>
#include <string>
#include <vector>

#include <qpdf/QPDF.hh>
#include <qpdf/QPDFObjectHandle.hh>
#include <qpdf/QPDFPageDocumentHelper.hh>
#include <qpdf/QPDFPageObjectHelper.hh>

namespace docu_mcp::extractors {
namespace {

// Collects the operands of the text-showing operators. Operands precede their
// operator in a content stream, so strings are buffered until the operator
// that consumes them is seen.
class TextShowCallbacks final : public QPDFObjectHandle::ParserCallbacks {
 public:
  explicit TextShowCallbacks(std::ostringstream& text) : text_(text) {}

  void handleObject(QPDFObjectHandle obj) override {
    if (!obj.isOperator()) {
      operands_.push_back(obj);
      return;
    }

    const auto op = obj.getOperatorValue();
    if (op == "Tj" || op == "'" || op == "\"") {
      if (!operands_.empty() && operands_.back().isString()) {
        text_ << operands_.back().getUTF8Value() << ' ';
      }
    } else if (op == "TJ") {
      if (!operands_.empty() && operands_.back().isArray()) {
        for (auto& item : operands_.back().getArrayAsVector()) {
          if (item.isString()) {
            text_ << item.getUTF8Value();
          }
        }
        text_ << ' ';
      }
    } else if (op == "ET" || op == "T*" || op == "Td" || op == "TD") {
      text_ << ' ';
    }
    operands_.clear();
  }

  void handleEOF() override {}

 private:
  std::ostringstream& text_;
  std::vector<QPDFObjectHandle> operands_{};
};

std::string collapse_blanks(const std::string& raw) {
  std::string out;
  out.reserve(raw.size());
  bool pending_space = false;
  for (const char c : raw) {
    if (c == '\n') {
      while (!out.empty() && out.back() == ' ') {
        out.pop_back();
      }
      out.push_back('\n');
      pending_space = false;
    } else if (c == ' ' || c == '\t' || c == '\r') {
      pending_space = !out.empty() && out.back() != '\n';
    } else {
      if (pending_space) {
        out.push_back(' ');
        pending_space = false;
      }
      out.push_back(c);
    }
  }

  const auto begin = out.find_first_not_of(" \n");
  if (begin == std::string::npos) {
    return {};
  }
  const auto end = out.find_last_not_of(" \n");
  return out.substr(begin, end - begin + 1);
}

class QpdfPdfExtractor final : public TextExtractor {
 public:
  std::string extract(const std::string_view bytes) const override {
    QPDF pdf;
    pdf.setSuppressWarnings(true);
    pdf.processMemoryFile("document.pdf", bytes.data(), bytes.size());

    std::ostringstream text;
    for (auto& page : QPDFPageDocumentHelper(pdf).getAllPages()) {
      TextShowCallbacks callbacks(text);
      page.parsePageContents(&callbacks);
      text << '\n';
    }
    return collapse_blanks(text.str());
  }

  const char* name() const noexcept override { return "PdfExtractor"; }
};

}  // namespace

std::unique_ptr<TextExtractor> make_pdf_extractor() { return std::make_unique<QpdfPdfExtractor>(); }

}  // namespace docu_mcp::extractors
