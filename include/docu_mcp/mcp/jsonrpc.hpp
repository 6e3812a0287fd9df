#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace docu_mcp::mcp {

constexpr const char* kJsonRpcVersion = "2.0";

namespace error_code {
constexpr int kParseError = -32700;
constexpr int kInvalidRequest = -32600;
constexpr int kMethodNotFound = -32601;
constexpr int kInvalidParams = -32602;  // reserved; invalid params are reported as kRequestFailed
constexpr int kNotInitialized = -32002;
constexpr int kRequestFailed = -32000;
}  // namespace error_code

struct JsonRpcError {
  int code;
  std::string message;
  std::optional<nlohmann::json> data{};
};

struct JsonRpcMessage {
  std::string method;
  nlohmann::json params;
  // Absent for notifications. A present id keeps its JSON type (number,
  // string or null) so it can be echoed unchanged.
  std::optional<nlohmann::json> id;

  bool is_notification() const noexcept { return !id.has_value(); }
};

// Raised for lines that cannot be turned into a JsonRpcMessage. Carries the
// error to send back and the id to send it with.
class JsonRpcFailure : public std::runtime_error {
 public:
  JsonRpcFailure(JsonRpcError error, nlohmann::json id);

  const JsonRpcError& error() const noexcept { return error_; }
  const nlohmann::json& id() const noexcept { return id_; }

 private:
  JsonRpcError error_;
  nlohmann::json id_;
};

JsonRpcMessage parse_message(std::string_view line);

nlohmann::json make_result_response(const nlohmann::json& id, const nlohmann::json& result);
nlohmann::json make_error_response(const nlohmann::json& id, const JsonRpcError& error);

}  // namespace docu_mcp::mcp
