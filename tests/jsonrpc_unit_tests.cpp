#include <iostream>
#include <string>

#include <nlohmann/json.hpp>

#include "docu_mcp/mcp/jsonrpc.hpp"
#include "test_support.hpp"

using docu_mcp::mcp::JsonRpcError;
using docu_mcp::mcp::JsonRpcFailure;
using docu_mcp::mcp::make_error_response;
using docu_mcp::mcp::make_result_response;
using docu_mcp::mcp::parse_message;
using docu_mcp::testing::fail;
namespace error_code = docu_mcp::mcp::error_code;

namespace {

bool rejects_with(const std::string& line, const int code, const nlohmann::json& id) {
  try {
    (void)parse_message(line);
  } catch (const JsonRpcFailure& failure) {
    const auto& echoed = failure.id();
    return failure.error().code == code && echoed == id && echoed.is_number() == id.is_number() &&
           echoed.is_string() == id.is_string() && echoed.is_null() == id.is_null();
  }
  return false;
}

int test_parse_request_preserves_id_type() {
  const auto numeric = parse_message(R"({"jsonrpc":"2.0","id":7,"method":"tools/list"})");
  if (!numeric.id.has_value() || !numeric.id->is_number_integer() || numeric.id->get<int>() != 7) {
    return fail("test_parse_request_preserves_id_type", "numeric id should stay numeric");
  }

  const auto text = parse_message(R"({"jsonrpc":"2.0","id":"7","method":"tools/list"})");
  if (!text.id.has_value() || !text.id->is_string() || text.id->get<std::string>() != "7") {
    return fail("test_parse_request_preserves_id_type", "string id should stay a string");
  }

  const auto null_id = parse_message(R"({"jsonrpc":"2.0","id":null,"method":"tools/list"})");
  if (null_id.is_notification() || !null_id.id->is_null()) {
    return fail("test_parse_request_preserves_id_type", "explicit null id is a request");
  }

  const auto fractional = parse_message(R"({"jsonrpc":"2.0","id":1.5,"method":"tools/list"})");
  if (!fractional.id->is_number_float()) {
    return fail("test_parse_request_preserves_id_type", "fractional id should stay a float");
  }

  return 0;
}

int test_parse_notification_and_default_params() {
  const auto notification = parse_message(R"({"jsonrpc":"2.0","method":"initialized"})");
  if (!notification.is_notification()) {
    return fail("test_parse_notification_and_default_params", "message without id must be a notification");
  }
  if (!notification.params.is_object() || !notification.params.empty()) {
    return fail("test_parse_notification_and_default_params", "absent params should default to an empty object");
  }

  const auto with_params = parse_message(R"({"jsonrpc":"2.0","id":1,"method":"x","params":{"a":1}})");
  if (with_params.params.value("a", 0) != 1) {
    return fail("test_parse_notification_and_default_params", "params should be kept");
  }

  const auto scalar_notification = parse_message(R"({"jsonrpc":"2.0","method":"notifications/initialized","params":5})");
  if (!scalar_notification.is_notification() || scalar_notification.params != 5) {
    return fail("test_parse_notification_and_default_params", "scalar params on a notification should be kept as-is");
  }

  const auto scalar_request = parse_message(R"({"jsonrpc":"2.0","id":2,"method":"x","params":"str"})");
  if (scalar_request.params != "str" || !scalar_request.id.has_value() || *scalar_request.id != 2) {
    return fail("test_parse_notification_and_default_params", "scalar params on a request should be kept as-is");
  }
  return 0;
}

int test_parse_rejections() {
  if (!rejects_with("not json", error_code::kParseError, nullptr)) {
    return fail("test_parse_rejections", "invalid JSON should be a parse error with null id");
  }
  if (!rejects_with("[1,2]", error_code::kParseError, nullptr)) {
    return fail("test_parse_rejections", "non-object should be a parse error");
  }
  if (!rejects_with(R"({"jsonrpc":"1.0","id":5,"method":"initialize"})", error_code::kInvalidRequest, 5)) {
    return fail("test_parse_rejections", "wrong version should be invalid request echoing the id");
  }
  if (!rejects_with(R"({"jsonrpc":"1.0","id":"abc","method":"initialize"})", error_code::kInvalidRequest, "abc")) {
    return fail("test_parse_rejections", "wrong version should echo a string id");
  }
  if (!rejects_with(R"({"jsonrpc":"2.0","id":true,"method":"initialize"})", error_code::kInvalidRequest, nullptr)) {
    return fail("test_parse_rejections", "boolean id should be rejected");
  }
  if (!rejects_with(R"({"jsonrpc":"2.0","id":9})", error_code::kParseError, 9)) {
    return fail("test_parse_rejections", "missing method should be a parse error echoing the id");
  }
  if (!rejects_with(R"({"id":4,"method":"tools/list"})", error_code::kParseError, 4)) {
    return fail("test_parse_rejections", "missing jsonrpc should be a parse error");
  }
  return 0;
}

int test_parse_error_carries_diagnostic() {
  try {
    (void)parse_message("{\"jsonrpc\":");
  } catch (const JsonRpcFailure& failure) {
    if (!failure.error().data.has_value() || !failure.error().data->is_string() ||
        failure.error().data->get<std::string>().empty()) {
      return fail("test_parse_error_carries_diagnostic", "parser diagnostic should be attached as data");
    }
    return 0;
  }
  return fail("test_parse_error_carries_diagnostic", "truncated JSON should be rejected");
}

int test_response_shapes() {
  const auto result = make_result_response(7, nlohmann::json{{"ok", true}});
  if (result.dump() != R"({"id":7,"jsonrpc":"2.0","result":{"ok":true}})") {
    return fail("test_response_shapes", "unexpected result response: " + result.dump());
  }

  const auto bare_error = make_error_response("a", JsonRpcError{.code = -32601, .message = "Unknown method: x"});
  if (bare_error.at("error").contains("data") || bare_error.contains("result")) {
    return fail("test_response_shapes", "error without data must not carry data or result");
  }
  if (!bare_error.at("id").is_string()) {
    return fail("test_response_shapes", "error response should echo string id");
  }

  const auto detailed =
      make_error_response(nullptr, JsonRpcError{.code = -32700, .message = "Parse error", .data = nlohmann::json("x")});
  if (detailed.at("error").at("data") != "x" || !detailed.at("id").is_null()) {
    return fail("test_response_shapes", "error data and null id should be serialized");
  }
  return 0;
}

}  // namespace

int main() {
  if (int rc = test_parse_request_preserves_id_type(); rc != 0) {
    return rc;
  }
  if (int rc = test_parse_notification_and_default_params(); rc != 0) {
    return rc;
  }
  if (int rc = test_parse_rejections(); rc != 0) {
    return rc;
  }
  if (int rc = test_parse_error_carries_diagnostic(); rc != 0) {
    return rc;
  }
  if (int rc = test_response_shapes(); rc != 0) {
    return rc;
  }

  std::cout << "[PASS] jsonrpc unit tests\n";
  return 0;
}
