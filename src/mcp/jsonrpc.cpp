#include "docu_mcp/mcp/jsonrpc.hpp"

#include <string>
#include <utility>

namespace docu_mcp::mcp {

namespace {

[[noreturn]] void reject(const int code, std::string message, const nlohmann::json& id,
                         std::optional<nlohmann::json> data = std::nullopt) {
  throw JsonRpcFailure(JsonRpcError{.code = code, .message = std::move(message), .data = std::move(data)}, id);
}

bool is_valid_id(const nlohmann::json& id) { return id.is_null() || id.is_string() || id.is_number(); }

}  // namespace

JsonRpcFailure::JsonRpcFailure(JsonRpcError error, nlohmann::json id)
    : std::runtime_error(error.message), error_(std::move(error)), id_(std::move(id)) {}

JsonRpcMessage parse_message(const std::string_view line) {
  nlohmann::json request;
  try {
    request = nlohmann::json::parse(line);
  } catch (const nlohmann::json::parse_error& ex) {
    reject(error_code::kParseError, "Parse error", nullptr, nlohmann::json(ex.what()));
  }

  if (!request.is_object()) {
    reject(error_code::kParseError, "Parse error", nullptr, nlohmann::json("request must be a JSON object"));
  }

  JsonRpcMessage parsed{.method = {}, .params = nlohmann::json::object(), .id = std::nullopt};

  const auto id_it = request.find("id");
  if (id_it != request.end()) {
    if (!is_valid_id(*id_it)) {
      reject(error_code::kInvalidRequest, "Invalid request: id must be a string, number, or null", nullptr);
    }
    parsed.id = *id_it;
  }
  const nlohmann::json reply_id = parsed.id.value_or(nullptr);

  const auto jsonrpc_it = request.find("jsonrpc");
  if (jsonrpc_it == request.end() || !jsonrpc_it->is_string()) {
    reject(error_code::kParseError, "Parse error", reply_id, nlohmann::json("jsonrpc must be a string"));
  }

  const auto method_it = request.find("method");
  if (method_it == request.end() || !method_it->is_string()) {
    reject(error_code::kParseError, "Parse error", reply_id, nlohmann::json("method must be a string"));
  }

  const auto& version = jsonrpc_it->get_ref<const std::string&>();
  if (version != kJsonRpcVersion) {
    reject(error_code::kInvalidRequest, "Invalid JSON-RPC version: " + version + ". Expected 2.0", reply_id);
  }

  parsed.method = method_it->get<std::string>();

  // Any shape is kept; request handlers reject params they cannot use, and a
  // notification must never be answered.
  const auto params_it = request.find("params");
  if (params_it != request.end() && !params_it->is_null()) {
    parsed.params = *params_it;
  }

  return parsed;
}

nlohmann::json make_result_response(const nlohmann::json& id, const nlohmann::json& result) {
  return nlohmann::json{{"jsonrpc", kJsonRpcVersion}, {"id", id}, {"result", result}};
}

nlohmann::json make_error_response(const nlohmann::json& id, const JsonRpcError& error) {
  nlohmann::json body{{"code", error.code}, {"message", error.message}};
  if (error.data.has_value()) {
    body["data"] = *error.data;
  }
  return nlohmann::json{{"jsonrpc", kJsonRpcVersion}, {"id", id}, {"error", std::move(body)}};
}

}  // namespace docu_mcp::mcp
