#include "docu_mcp/mcp/tools.hpp"

#include <algorithm>
#include <filesystem>
#include <string>
#include <system_error>
#include <utility>

#include "docu_mcp/core/errors.hpp"

namespace docu_mcp::mcp {

namespace fs = std::filesystem;

using core::DocumentError;
using core::ErrorKind;

SetDocumentDirectoryResult set_document_directory(const SetDocumentDirectoryParams& params, core::ConfigStore& config) {
  const fs::path directory(params.directory);

  std::error_code ec;
  if (params.directory.empty() || !fs::exists(directory, ec)) {
    throw DocumentError(ErrorKind::kNotFound, "Directory does not exist: " + params.directory);
  }
  if (!fs::is_directory(directory, ec)) {
    throw DocumentError(ErrorKind::kNotADirectory, "Path is not a directory: " + params.directory);
  }

  fs::directory_iterator probe(directory, ec);
  if (ec) {
    throw DocumentError(ErrorKind::kUnreadable, "Directory is not readable: " + params.directory + ": " + ec.message());
  }

  const auto canonical = fs::canonical(directory, ec);
  if (ec) {
    throw DocumentError(ErrorKind::kUnreadable, "Failed to canonicalize path " + params.directory + ": " + ec.message());
  }
  const auto normalized = canonical.string();

  auto current = config.load();
  if (std::find(current.directories.begin(), current.directories.end(), normalized) == current.directories.end()) {
    current.directories.push_back(normalized);
  }
  current.active_directory = normalized;

  config.save(current);

  return SetDocumentDirectoryResult{.message = "Directory set as active: " + normalized, .active_directory = normalized};
}

DocumentDirectories list_document_directories(const core::ConfigStore& config) {
  auto current = config.load();
  return DocumentDirectories{.directories = std::move(current.directories),
                             .active_directory = std::move(current.active_directory)};
}

}  // namespace docu_mcp::mcp
