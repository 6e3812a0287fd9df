#include "docu_mcp/core/errors.hpp"

#include <string>

namespace docu_mcp::core {

namespace {

void append_nested(const std::exception& error, std::string& out) {
  out += error.what();
  try {
    std::rethrow_if_nested(error);
  } catch (const std::exception& nested) {
    out += ": ";
    append_nested(nested, out);
  } catch (...) {
    out += ": unknown error";
  }
}

}  // namespace

const char* error_kind_name(const ErrorKind kind) noexcept {
  switch (kind) {
    case ErrorKind::kNotFound:
      return "not_found";
    case ErrorKind::kNotADirectory:
      return "not_a_directory";
    case ErrorKind::kNotAFile:
      return "not_a_file";
    case ErrorKind::kUnreadable:
      return "unreadable";
    case ErrorKind::kNoActiveDirectory:
      return "no_active_directory";
    case ErrorKind::kMalformedUri:
      return "malformed_uri";
    case ErrorKind::kTraversalRejected:
      return "traversal_rejected";
    case ErrorKind::kUnsupportedFormat:
      return "unsupported_format";
    case ErrorKind::kExtractionFailed:
      return "extraction_failed";
    case ErrorKind::kPersistFailed:
      return "persist_failed";
    case ErrorKind::kPersistLoadFailed:
      return "persist_load_failed";
    case ErrorKind::kReadFailed:
      return "read_failed";
    case ErrorKind::kInvalidArguments:
      return "invalid_arguments";
  }
  return "unknown";
}

DocumentError::DocumentError(const ErrorKind kind, const std::string& message)
    : std::runtime_error(message), kind_(kind) {}

std::string describe_error(const std::exception& error) {
  std::string out;
  append_nested(error, out);
  return out;
}

}  // namespace docu_mcp::core
