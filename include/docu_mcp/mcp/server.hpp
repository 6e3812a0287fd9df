#pragma once

#include <exception>
#include <iosfwd>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "docu_mcp/mcp/jsonrpc.hpp"
#include "docu_mcp/mcp/resources.hpp"
#include "docu_mcp/mcp/tools.hpp"
#include "docu_mcp/version.hpp"

namespace docu_mcp::mcp {

struct ServerOptions {
  std::string name{kServerName};
  std::string version{kServerVersion};
  std::vector<std::string> protocol_versions{"2024-11-05", "2025-06-18", "2025-11-25"};
  // Log every inbound method before dispatch.
  bool trace{false};
};

enum class Method {
  kInitialize,
  kInitialized,
  kToolsList,
  kToolsCall,
  kResourcesList,
  kResourcesRead,
};

std::optional<Method> method_from_name(std::string_view name);

// One MCP session over a line-delimited JSON-RPC stream. Requests are served
// strictly one at a time; nothing here is thread-safe.
class Server {
 public:
  Server(ToolRegistry tools, ToolContext context, std::ostream& log, ServerOptions options = {});

  // Returns the serialized response for one input line, or nothing for
  // notifications and blank lines. Never throws for client errors.
  std::optional<std::string> handle(std::string_view line);

  // Serves `in` until EOF. Returns 0 on EOF; throws std::runtime_error when
  // reading `in` or writing `out` fails.
  int run(std::istream& in, std::ostream& out);

  bool initialized() const noexcept { return initialized_; }

 private:
  nlohmann::json handle_request(const JsonRpcMessage& request);
  void handle_notification(const JsonRpcMessage& notification);

  nlohmann::json handle_initialize(const nlohmann::json& id, const nlohmann::json& params);
  nlohmann::json handle_tools_list() const;
  nlohmann::json handle_tools_call(const nlohmann::json& id, const nlohmann::json& params);
  nlohmann::json handle_resources_list(const nlohmann::json& id) const;
  nlohmann::json handle_resources_read(const nlohmann::json& id, const nlohmann::json& params) const;

  nlohmann::json request_failed(const nlohmann::json& id, const std::string& method, const std::string& prefix,
                                const std::exception& error) const;

  ToolRegistry tools_;
  ToolContext context_;
  ResourceResolver resources_;
  std::ostream& log_;
  ServerOptions options_;
  bool initialized_{false};
};

}  // namespace docu_mcp::mcp
