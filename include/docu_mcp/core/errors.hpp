#pragma once

#include <exception>
#include <stdexcept>
#include <string>

namespace docu_mcp::core {

enum class ErrorKind {
  kNotFound,
  kNotADirectory,
  kNotAFile,
  kUnreadable,
  kNoActiveDirectory,
  kMalformedUri,
  kTraversalRejected,
  kUnsupportedFormat,
  kExtractionFailed,
  kPersistFailed,
  kPersistLoadFailed,
  kReadFailed,
  kInvalidArguments,
};

// Stable snake_case name used in logs and in error `data` payloads.
const char* error_kind_name(ErrorKind kind) noexcept;

class DocumentError : public std::runtime_error {
 public:
  DocumentError(ErrorKind kind, const std::string& message);

  ErrorKind kind() const noexcept { return kind_; }

 private:
  ErrorKind kind_;
};

// Renders an exception and every exception nested inside it as
// "outer: inner: innermost".
std::string describe_error(const std::exception& error);

}  // namespace docu_mcp::core
