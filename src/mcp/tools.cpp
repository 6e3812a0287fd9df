#include "docu_mcp/mcp/tools.hpp"

#include <algorithm>
#include <string>
#include <utility>

#include "docu_mcp/core/errors.hpp"

namespace docu_mcp::mcp {

namespace {

using core::DocumentError;
using core::ErrorKind;

std::string require_string(const nlohmann::json& args, const char* tool, const char* field) {
  const auto it = args.find(field);
  if (it == args.end() || !it->is_string()) {
    throw DocumentError(ErrorKind::kInvalidArguments,
                        std::string("Failed to parse ") + tool + " params: " + field + " must be a string");
  }
  return it->get<std::string>();
}

std::optional<std::string> optional_string(const nlohmann::json& args, const char* tool, const char* field) {
  const auto it = args.find(field);
  if (it == args.end() || it->is_null()) {
    return std::nullopt;
  }
  if (!it->is_string()) {
    throw DocumentError(ErrorKind::kInvalidArguments,
                        std::string("Failed to parse ") + tool + " params: " + field + " must be a string");
  }
  return it->get<std::string>();
}

nlohmann::json optional_to_json(const std::optional<std::string>& value) {
  if (value.has_value()) {
    return *value;
  }
  return nullptr;
}

nlohmann::json handle_set_document_directory(const nlohmann::json& args, ToolContext& context) {
  const SetDocumentDirectoryParams params{.directory = require_string(args, "set_document_directory", "directory")};
  const auto result = set_document_directory(params, context.config);
  return nlohmann::json{{"message", result.message}, {"active_directory", result.active_directory}};
}

nlohmann::json handle_list_document_directories(const nlohmann::json& /*args*/, ToolContext& context) {
  const auto result = list_document_directories(context.config);
  return nlohmann::json{{"directories", result.directories},
                        {"active_directory", optional_to_json(result.active_directory)}};
}

nlohmann::json handle_extract_text_from_file(const nlohmann::json& args, ToolContext& context) {
  const ExtractTextFromFileParams params{.file_path = require_string(args, "extract_text_from_file", "file_path")};
  return nlohmann::json{{"text", extract_text_from_file(params, context.extractors).text}};
}

nlohmann::json handle_list_files_in_directory(const nlohmann::json& args, ToolContext& context) {
  const ListFilesInDirectoryParams params{.directory = optional_string(args, "list_files_in_directory", "directory")};
  const auto listing = list_files_in_directory(params, context.config);

  nlohmann::json files = nlohmann::json::array();
  for (const auto& file : listing.files) {
    files.push_back({{"name", file.name},
                     {"path", file.path},
                     {"is_file", file.is_file},
                     {"extension", optional_to_json(file.extension)}});
  }
  return nlohmann::json{{"directory", listing.directory}, {"files", std::move(files)}};
}

nlohmann::json path_argument_schema(const char* field, const char* description, const bool required) {
  return nlohmann::json{{"type", "object"},
                        {"properties", {{field, {{"type", "string"}, {"description", description}}}}},
                        {"required", required ? nlohmann::json::array({field}) : nlohmann::json::array()}};
}

}  // namespace

ToolRegistry build_tool_registry() {
  ToolRegistry registry;

  registry.push_back(Tool{.name = "set_document_directory",
                          .description = "Set the active document directory. Validates directory exists and is "
                                         "readable, adds to directories list if not present, sets as "
                                         "active_directory, and saves config.",
                          .input_schema = path_argument_schema("directory", "Path to directory", true),
                          .handler = handle_set_document_directory});

  registry.push_back(Tool{.name = "list_document_directories",
                          .description = "List all document directories and the active directory.",
                          .input_schema = nlohmann::json{{"type", "object"}, {"properties", nlohmann::json::object()}},
                          .handler = handle_list_document_directories});

  registry.push_back(Tool{.name = "extract_text_from_file",
                          .description = "Extract text from a document file using the appropriate extractor.",
                          .input_schema =
                              path_argument_schema("file_path", "Path to the file to extract text from", true),
                          .handler = handle_extract_text_from_file});

  registry.push_back(Tool{.name = "list_files_in_directory",
                          .description = "List all files and subdirectories in a directory. If no directory is "
                                         "provided, uses the active directory.",
                          .input_schema = path_argument_schema(
                              "directory", "Optional directory path. If not provided, uses the active directory.",
                              false),
                          .handler = handle_list_files_in_directory});

  return registry;
}

const Tool* find_tool(const ToolRegistry& registry, const std::string_view name) {
  const auto it =
      std::find_if(registry.begin(), registry.end(), [name](const Tool& tool) { return tool.name == name; });
  if (it == registry.end()) {
    return nullptr;
  }
  return &*it;
}

}  // namespace docu_mcp::mcp
