#pragma once

#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace docu_mcp::extractors {

class TextExtractor {
 public:
  virtual std::string extract(std::string_view bytes) const = 0;
  virtual const char* name() const noexcept = 0;
  virtual ~TextExtractor() = default;
};

class ExtractorRegistry {
 public:
  // Extensions are stored lowercase and without the leading dot.
  void add(std::string extension, std::shared_ptr<const TextExtractor> extractor);

  const TextExtractor* find(std::string_view extension) const;
  bool supports(std::string_view extension) const { return find(extension) != nullptr; }
  std::vector<std::string> extensions() const;

  // Reads the file and runs the extractor registered for its extension.
  // Throws core::DocumentError (UnsupportedFormat, ReadFailed, ExtractionFailed).
  std::string extract_file(const std::filesystem::path& path) const;

 private:
  std::map<std::string, std::shared_ptr<const TextExtractor>, std::less<>> extractors_{};
};

std::string to_lower(std::string_view value);

// Lowercase extension without the dot; empty when the path has none.
std::string extension_of(const std::filesystem::path& path);

const char* mime_type_for(std::string_view extension);

std::unique_ptr<TextExtractor> make_pdf_extractor();

ExtractorRegistry build_extractor_registry();

}  // namespace docu_mcp::extractors
