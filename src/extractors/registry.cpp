#include "docu_mcp/extractors/extractor.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <iterator>
#include <stdexcept>
#include <string>
#include <utility>

#include "docu_mcp/core/errors.hpp"

namespace docu_mcp::extractors {

namespace {

using core::DocumentError;
using core::ErrorKind;

std::string read_file_bytes(const std::filesystem::path& path) {
  std::ifstream input(path, std::ios::binary);
  if (!input.is_open()) {
    throw DocumentError(ErrorKind::kReadFailed, "unable to open file: " + path.string());
  }

  std::string bytes{std::istreambuf_iterator<char>(input), std::istreambuf_iterator<char>()};
  if (input.bad()) {
    throw DocumentError(ErrorKind::kReadFailed, "unable to read file: " + path.string());
  }
  return bytes;
}

}  // namespace

void ExtractorRegistry::add(std::string extension, std::shared_ptr<const TextExtractor> extractor) {
  if (extractor == nullptr) {
    throw std::invalid_argument("extractor must not be null");
  }
  if (!extension.empty() && extension.front() == '.') {
    extension.erase(0, 1);
  }
  if (extension.empty()) {
    throw std::invalid_argument("extension must not be empty");
  }
  extractors_[to_lower(extension)] = std::move(extractor);
}

const TextExtractor* ExtractorRegistry::find(const std::string_view extension) const {
  const auto it = extractors_.find(to_lower(extension));
  if (it == extractors_.end()) {
    return nullptr;
  }
  return it->second.get();
}

std::vector<std::string> ExtractorRegistry::extensions() const {
  std::vector<std::string> out;
  out.reserve(extractors_.size());
  for (const auto& [extension, _] : extractors_) {
    out.push_back(extension);
  }
  return out;
}

std::string ExtractorRegistry::extract_file(const std::filesystem::path& path) const {
  const auto extension = extension_of(path);
  if (extension.empty()) {
    throw DocumentError(ErrorKind::kUnsupportedFormat, "file has no extension: " + path.string());
  }

  const auto* extractor = find(extension);
  if (extractor == nullptr) {
    std::string supported;
    for (const auto& [known, _] : extractors_) {
      supported += supported.empty() ? known : ", " + known;
    }
    throw DocumentError(ErrorKind::kUnsupportedFormat,
                        "unsupported file format: " + extension + " (supported: " + supported + ")");
  }

  const auto bytes = read_file_bytes(path);
  try {
    return extractor->extract(bytes);
  } catch (const std::exception&) {
    std::throw_with_nested(DocumentError(
        ErrorKind::kExtractionFailed, std::string(extractor->name()) + " failed to extract text from " + path.string()));
  }
}

std::string to_lower(const std::string_view value) {
  std::string out;
  out.reserve(value.size());
  std::transform(value.begin(), value.end(), std::back_inserter(out),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return out;
}

std::string extension_of(const std::filesystem::path& path) {
  auto extension = path.extension().string();
  if (!extension.empty() && extension.front() == '.') {
    extension.erase(0, 1);
  }
  return to_lower(extension);
}

const char* mime_type_for(const std::string_view extension) {
  const auto lower = to_lower(extension);
  if (lower == "pdf") {
    return "application/pdf";
  }
  if (lower == "docx") {
    return "application/vnd.openxmlformats-officedocument.wordprocessingml.document";
  }
  if (lower == "doc") {
    return "application/msword";
  }
  if (lower == "txt") {
    return "text/plain";
  }
  return "application/octet-stream";
}

ExtractorRegistry build_extractor_registry() {
  ExtractorRegistry registry;
  registry.add("pdf", make_pdf_extractor());
  return registry;
}

}  // namespace docu_mcp::extractors
