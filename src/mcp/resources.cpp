#include "docu_mcp/mcp/resources.hpp"

#include <algorithm>
#include <iterator>
#include <string>
#include <system_error>

#include "docu_mcp/core/errors.hpp"

namespace docu_mcp::mcp {

namespace fs = std::filesystem;

namespace {

using core::DocumentError;
using core::ErrorKind;

constexpr std::string_view kSchemeSeparator = "://";

bool is_within(const fs::path& candidate, const fs::path& directory) {
  auto dir_it = directory.begin();
  auto candidate_it = candidate.begin();
  for (; dir_it != directory.end(); ++dir_it, ++candidate_it) {
    // A trailing separator yields an empty final element.
    if (dir_it->empty() && std::next(dir_it) == directory.end()) {
      break;
    }
    if (candidate_it == candidate.end() || *candidate_it != *dir_it) {
      return false;
    }
  }
  return candidate_it != candidate.end();
}

// Rejects names that leave the directory before anything is looked up on disk.
bool escapes_lexically(const fs::path& name) {
  if (name.is_absolute() || name.has_root_name() || name.has_root_directory()) {
    return true;
  }
  const auto normalized = name.lexically_normal();
  if (normalized.empty() || normalized == ".") {
    return true;
  }
  return *normalized.begin() == "..";
}

}  // namespace

nlohmann::json to_json(const Resource& resource) {
  nlohmann::json out{{"uri", resource.uri}, {"name", resource.name}};
  if (resource.description.has_value()) {
    out["description"] = *resource.description;
  }
  if (resource.mime_type.has_value()) {
    out["mimeType"] = *resource.mime_type;
  }
  return out;
}

nlohmann::json to_json(const ResourceContent& content) {
  nlohmann::json out{{"uri", content.uri}, {"text", content.text}};
  if (content.mime_type.has_value()) {
    out["mimeType"] = *content.mime_type;
  }
  return out;
}

ResourceResolver::ResourceResolver(const core::ConfigStore& config, const extractors::ExtractorRegistry& extractors)
    : config_(config), extractors_(extractors) {}

fs::path ResourceResolver::active_directory() const {
  const auto config = config_.load();
  if (!config.active_directory.has_value() || config.active_directory->empty()) {
    throw DocumentError(ErrorKind::kNoActiveDirectory, "No active directory set. Use set_document_directory tool first.");
  }
  return fs::path(*config.active_directory);
}

std::vector<Resource> ResourceResolver::list() const {
  const auto directory = active_directory();

  std::error_code ec;
  if (!fs::exists(directory, ec)) {
    throw DocumentError(ErrorKind::kNotFound, "Active directory does not exist: " + directory.string());
  }
  if (!fs::is_directory(directory, ec)) {
    throw DocumentError(ErrorKind::kNotADirectory, "Active directory is not a directory: " + directory.string());
  }

  std::vector<Resource> resources;
  try {
    for (const auto& entry : fs::directory_iterator(directory)) {
      std::error_code entry_ec;
      if (!entry.is_regular_file(entry_ec)) {
        continue;
      }

      const auto extension = extractors::extension_of(entry.path());
      if (extension.empty() || !extractors_.supports(extension)) {
        continue;
      }

      const auto filename = entry.path().filename().string();
      resources.push_back(Resource{.uri = extension + std::string(kSchemeSeparator) + filename,
                                   .name = filename,
                                   .description = "Document: " + filename,
                                   .mime_type = extractors::mime_type_for(extension)});
    }
  } catch (const fs::filesystem_error&) {
    std::throw_with_nested(
        DocumentError(ErrorKind::kReadFailed, "Failed to read active directory: " + directory.string()));
  }

  std::sort(resources.begin(), resources.end(),
            [](const Resource& lhs, const Resource& rhs) { return lhs.name < rhs.name; });
  return resources;
}

ResourceUri ResourceResolver::parse_uri(const std::string_view uri) const {
  const auto separator = uri.find(kSchemeSeparator);
  if (separator == std::string_view::npos || separator == 0) {
    std::string expected;
    for (const auto& extension : extractors_.extensions()) {
      expected += (expected.empty() ? "" : ", ") + extension + std::string(kSchemeSeparator);
    }
    throw DocumentError(ErrorKind::kMalformedUri,
                        "Invalid URI format. Expected one of: " + expected + ", got: " + std::string(uri));
  }

  const std::string scheme(uri.substr(0, separator));
  if (!extractors_.supports(scheme) || scheme != extractors::to_lower(scheme)) {
    throw DocumentError(ErrorKind::kMalformedUri, "Unsupported URI scheme '" + scheme + "' in: " + std::string(uri));
  }

  const std::string filename(uri.substr(separator + kSchemeSeparator.size()));
  if (filename.empty()) {
    throw DocumentError(ErrorKind::kMalformedUri, "URI contains no filename: " + std::string(uri));
  }

  return ResourceUri{.scheme = scheme, .filename = filename};
}

fs::path ResourceResolver::resolve(const std::string_view uri) const {
  const auto parsed = parse_uri(uri);
  const auto directory = active_directory();

  const fs::path name(parsed.filename);
  if (escapes_lexically(name)) {
    throw DocumentError(ErrorKind::kTraversalRejected,
                        "File is not in active directory (security check failed): " + parsed.filename);
  }

  const auto candidate = directory / name;
  std::error_code ec;
  if (!fs::exists(candidate, ec)) {
    throw DocumentError(ErrorKind::kNotFound, "File not found in active directory: " + parsed.filename +
                                                  ". Active directory: " + directory.string());
  }

  const auto canonical_dir = fs::canonical(directory, ec);
  if (ec) {
    throw DocumentError(ErrorKind::kNotFound,
                        "Failed to canonicalize active directory " + directory.string() + ": " + ec.message());
  }
  const auto canonical_file = fs::canonical(candidate, ec);
  if (ec) {
    throw DocumentError(ErrorKind::kNotFound,
                        "Failed to canonicalize file path " + candidate.string() + ": " + ec.message());
  }

  if (!is_within(canonical_file, canonical_dir)) {
    throw DocumentError(ErrorKind::kTraversalRejected,
                        "File is not in active directory (security check failed): " + parsed.filename);
  }

  if (!fs::is_regular_file(canonical_file, ec)) {
    throw DocumentError(ErrorKind::kNotAFile, "Resource is not a regular file: " + parsed.filename);
  }

  return canonical_file;
}

ResourceContent ResourceResolver::read(const std::string_view uri) const {
  const auto path = resolve(uri);
  const auto extension = extractors::extension_of(path);

  std::string text;
  try {
    text = extractors_.extract_file(path);
  } catch (const DocumentError& ex) {
    if (ex.kind() == ErrorKind::kExtractionFailed) {
      throw;
    }
    std::throw_with_nested(
        DocumentError(ErrorKind::kExtractionFailed, "Failed to extract text from resource: " + std::string(uri)));
  }

  return ResourceContent{.uri = std::string(uri), .text = std::move(text), .mime_type = extractors::mime_type_for(extension)};
}

}  // namespace docu_mcp::mcp
