#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "docu_mcp/core/config.hpp"
#include "docu_mcp/extractors/extractor.hpp"

namespace docu_mcp::mcp {

struct Resource {
  std::string uri;
  std::string name;
  std::optional<std::string> description{};
  std::optional<std::string> mime_type{};
};

struct ResourceContent {
  std::string uri;
  std::string text;
  std::optional<std::string> mime_type{};
};

struct ResourceUri {
  std::string scheme;
  std::string filename;
};

nlohmann::json to_json(const Resource& resource);
nlohmann::json to_json(const ResourceContent& content);

// Exposes the documents of the active directory as `<ext>://<filename>`
// resources. Every read is confined to the active directory.
class ResourceResolver {
 public:
  ResourceResolver(const core::ConfigStore& config, const extractors::ExtractorRegistry& extractors);

  // Sorted by name. Throws core::DocumentError (NoActiveDirectory when no
  // directory is configured).
  std::vector<Resource> list() const;

  ResourceContent read(std::string_view uri) const;

  // Validates the URI and returns the canonical path it names, without
  // reading the file.
  std::filesystem::path resolve(std::string_view uri) const;

  ResourceUri parse_uri(std::string_view uri) const;

 private:
  std::filesystem::path active_directory() const;

  const core::ConfigStore& config_;
  const extractors::ExtractorRegistry& extractors_;
};

}  // namespace docu_mcp::mcp
