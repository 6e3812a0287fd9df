#include "docu_mcp/mcp/tools.hpp"

#include <algorithm>
#include <filesystem>
#include <system_error>

#include "docu_mcp/core/errors.hpp"

namespace docu_mcp::mcp {

namespace fs = std::filesystem;

using core::DocumentError;
using core::ErrorKind;

DirectoryListing list_files_in_directory(const ListFilesInDirectoryParams& params, const core::ConfigStore& config) {
  fs::path directory;
  if (params.directory.has_value()) {
    directory = *params.directory;
  } else {
    const auto current = config.load();
    if (!current.active_directory.has_value()) {
      throw DocumentError(ErrorKind::kNoActiveDirectory,
                          "No active directory set. Use set_document_directory tool first, or provide a directory "
                          "parameter.");
    }
    directory = *current.active_directory;
  }

  std::error_code ec;
  if (directory.empty() || !fs::exists(directory, ec)) {
    throw DocumentError(ErrorKind::kNotFound, "Directory does not exist: " + directory.string());
  }
  if (!fs::is_directory(directory, ec)) {
    throw DocumentError(ErrorKind::kNotADirectory, "Path is not a directory: " + directory.string());
  }

  DirectoryListing listing{.directory = directory.string(), .files = {}};
  try {
    for (const auto& entry : fs::directory_iterator(directory)) {
      std::error_code entry_ec;
      auto extension = entry.path().extension().string();
      if (!extension.empty() && extension.front() == '.') {
        extension.erase(0, 1);
      }

      listing.files.push_back(FileInfo{.name = entry.path().filename().string(),
                                       .path = entry.path().string(),
                                       .is_file = entry.is_regular_file(entry_ec),
                                       .extension = extension.empty() ? std::nullopt : std::optional(extension)});
    }
  } catch (const fs::filesystem_error&) {
    std::throw_with_nested(DocumentError(ErrorKind::kReadFailed, "Failed to read directory: " + directory.string()));
  }

  std::stable_sort(listing.files.begin(), listing.files.end(),
                   [](const FileInfo& lhs, const FileInfo& rhs) { return lhs.name < rhs.name; });
  return listing;
}

}  // namespace docu_mcp::mcp
