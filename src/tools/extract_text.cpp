#include "docu_mcp/mcp/tools.hpp"

#include <filesystem>
#include <system_error>

#include "docu_mcp/core/errors.hpp"

namespace docu_mcp::mcp {

using core::DocumentError;
using core::ErrorKind;

// Any readable path is accepted; this tool is not confined to the active directory.
ExtractTextFromFileResult extract_text_from_file(const ExtractTextFromFileParams& params,
                                                 const extractors::ExtractorRegistry& extractors) {
  const std::filesystem::path file(params.file_path);

  std::error_code ec;
  if (params.file_path.empty() || !std::filesystem::exists(file, ec)) {
    throw DocumentError(ErrorKind::kNotFound, "File does not exist: " + params.file_path);
  }
  if (!std::filesystem::is_regular_file(file, ec)) {
    throw DocumentError(ErrorKind::kNotAFile, "Path is not a file: " + params.file_path);
  }

  return ExtractTextFromFileResult{.text = extractors.extract_file(file)};
}

}  // namespace docu_mcp::mcp
