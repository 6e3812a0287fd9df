#pragma once

#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "docu_mcp/core/config.hpp"
#include "docu_mcp/extractors/extractor.hpp"

namespace docu_mcp::mcp {

struct ToolContext {
  core::ConfigStore& config;
  const extractors::ExtractorRegistry& extractors;
};

struct Tool {
  std::string name;
  std::string description;
  nlohmann::json input_schema;
  std::function<nlohmann::json(const nlohmann::json&, ToolContext&)> handler;
};

// Ordered as advertised by tools/list.
using ToolRegistry = std::vector<Tool>;

ToolRegistry build_tool_registry();

const Tool* find_tool(const ToolRegistry& registry, std::string_view name);

struct SetDocumentDirectoryParams {
  std::string directory;
};

struct SetDocumentDirectoryResult {
  std::string message;
  std::string active_directory;
};

struct DocumentDirectories {
  std::vector<std::string> directories;
  std::optional<std::string> active_directory;
};

struct ExtractTextFromFileParams {
  std::string file_path;
};

struct ExtractTextFromFileResult {
  std::string text;
};

struct ListFilesInDirectoryParams {
  std::optional<std::string> directory;
};

struct FileInfo {
  std::string name;
  std::string path;
  bool is_file;
  std::optional<std::string> extension;
};

struct DirectoryListing {
  std::string directory;
  std::vector<FileInfo> files;
};

SetDocumentDirectoryResult set_document_directory(const SetDocumentDirectoryParams& params, core::ConfigStore& config);
DocumentDirectories list_document_directories(const core::ConfigStore& config);
ExtractTextFromFileResult extract_text_from_file(const ExtractTextFromFileParams& params,
                                                 const extractors::ExtractorRegistry& extractors);
DirectoryListing list_files_in_directory(const ListFilesInDirectoryParams& params, const core::ConfigStore& config);

}  // namespace docu_mcp::mcp
