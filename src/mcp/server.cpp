#include "docu_mcp/mcp/server.hpp"

#include <algorithm>
#include <cctype>
#include <istream>
#include <ostream>
#include <stdexcept>
#include <string>
#include <utility>

#include "docu_mcp/core/errors.hpp"

namespace docu_mcp::mcp {

namespace {

std::string_view trim(std::string_view line) {
  while (!line.empty() && std::isspace(static_cast<unsigned char>(line.front())) != 0) {
    line.remove_prefix(1);
  }
  while (!line.empty() && std::isspace(static_cast<unsigned char>(line.back())) != 0) {
    line.remove_suffix(1);
  }
  return line;
}

// Extracted text and file names are not guaranteed to be valid UTF-8.
std::string serialize(const nlohmann::json& value) {
  return value.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

std::string join(const std::vector<std::string>& values) {
  std::string out;
  for (const auto& value : values) {
    out += out.empty() ? value : ", " + value;
  }
  return out;
}

}  // namespace

std::optional<Method> method_from_name(const std::string_view name) {
  if (name == "initialize") {
    return Method::kInitialize;
  }
  if (name == "initialized" || name == "notifications/initialized") {
    return Method::kInitialized;
  }
  if (name == "tools/list") {
    return Method::kToolsList;
  }
  if (name == "tools/call") {
    return Method::kToolsCall;
  }
  if (name == "resources/list") {
    return Method::kResourcesList;
  }
  if (name == "resources/read") {
    return Method::kResourcesRead;
  }
  return std::nullopt;
}

Server::Server(ToolRegistry tools, ToolContext context, std::ostream& log, ServerOptions options)
    : tools_(std::move(tools)),
      context_(context),
      resources_(context.config, context.extractors),
      log_(log),
      options_(std::move(options)) {}

int Server::run(std::istream& in, std::ostream& out) {
  std::string line;
  while (std::getline(in, line)) {
    const auto response = handle(line);
    if (!response.has_value()) {
      continue;
    }

    out << *response << '\n';
    out.flush();
    if (!out) {
      throw std::runtime_error("failed to write response to output stream");
    }
  }

  if (in.bad()) {
    throw std::runtime_error("failed to read request from input stream");
  }
  return 0;
}

std::optional<std::string> Server::handle(const std::string_view raw_line) {
  const auto line = trim(raw_line);
  if (line.empty()) {
    return std::nullopt;
  }

  try {
    const auto message = parse_message(line);
    if (options_.trace) {
      log_ << options_.name << ": <- " << message.method;
      if (message.id.has_value()) {
        log_ << " id=" << serialize(*message.id);
      }
      log_ << '\n';
    }

    if (message.is_notification()) {
      handle_notification(message);
      return std::nullopt;
    }
    return serialize(handle_request(message));
  } catch (const JsonRpcFailure& failure) {
    log_ << options_.name << ": rejected message: " << failure.what();
    if (failure.error().data.has_value() && failure.error().data->is_string()) {
      log_ << " (" << failure.error().data->get<std::string>() << ')';
    }
    log_ << " | line: " << line << '\n';
    return serialize(make_error_response(failure.id(), failure.error()));
  } catch (const std::exception& ex) {
    log_ << options_.name << ": failed to process message: " << core::describe_error(ex) << '\n';
    return serialize(make_error_response(
        nullptr, JsonRpcError{.code = error_code::kRequestFailed, .message = std::string("Request failed: ") + ex.what()}));
  }
}

void Server::handle_notification(const JsonRpcMessage& notification) {
  const auto method = method_from_name(notification.method);
  if (method != Method::kInitialized) {
    return;
  }
  if (!initialized_) {
    log_ << options_.name << ": notification '" << notification.method
         << "' failed: received initialized notification before initialize request\n";
  }
}

nlohmann::json Server::handle_request(const JsonRpcMessage& request) {
  const auto& id = *request.id;
  const auto method = method_from_name(request.method);
  if (!method.has_value() || *method == Method::kInitialized) {
    return make_error_response(
        id, JsonRpcError{.code = error_code::kMethodNotFound, .message = "Unknown method: " + request.method});
  }

  if (*method != Method::kInitialize && !initialized_) {
    return make_error_response(id, JsonRpcError{.code = error_code::kNotInitialized, .message = "Not initialized"});
  }

  try {
    switch (*method) {
      case Method::kInitialize:
        return handle_initialize(id, request.params);
      case Method::kToolsList:
        return make_result_response(id, handle_tools_list());
      case Method::kToolsCall:
        return handle_tools_call(id, request.params);
      case Method::kResourcesList:
        return handle_resources_list(id);
      case Method::kResourcesRead:
        return handle_resources_read(id, request.params);
      case Method::kInitialized:
        break;
    }
  } catch (const std::exception& ex) {
    return request_failed(id, request.method, "Request failed: ", ex);
  }

  return make_error_response(
      id, JsonRpcError{.code = error_code::kMethodNotFound, .message = "Unknown method: " + request.method});
}

nlohmann::json Server::handle_initialize(const nlohmann::json& id, const nlohmann::json& params) {
  if (initialized_) {
    return make_error_response(id, JsonRpcError{.code = error_code::kRequestFailed, .message = "Already initialized"});
  }

  if (!params.is_object()) {
    throw std::invalid_argument("Failed to parse initialize params: params must be an object");
  }
  const auto version_it = params.find("protocolVersion");
  if (version_it == params.end() || !version_it->is_string()) {
    throw std::invalid_argument("Failed to parse initialize params: protocolVersion must be a string");
  }
  const auto& version = version_it->get_ref<const std::string&>();

  const auto& supported = options_.protocol_versions;
  if (std::find(supported.begin(), supported.end(), version) == supported.end()) {
    return make_error_response(
        id, JsonRpcError{.code = error_code::kRequestFailed,
                         .message = "Unsupported protocol version: " + version + ". Supported versions: " +
                                    join(supported)});
  }

  if (const auto info_it = params.find("clientInfo"); info_it != params.end() && info_it->is_object()) {
    log_ << options_.name << ": client " << serialize(info_it->value("name", nlohmann::json("unknown")))
         << " negotiated protocol " << version << '\n';
  }

  initialized_ = true;

  return make_result_response(
      id, nlohmann::json{{"protocolVersion", version},
                         {"capabilities",
                          {{"tools", {{"listChanged", true}}},
                           {"resources", {{"subscribe", true}, {"listChanged", true}}}}},
                         {"serverInfo", {{"name", options_.name}, {"version", options_.version}}}});
}

nlohmann::json Server::handle_tools_list() const {
  nlohmann::json tools = nlohmann::json::array();
  for (const auto& tool : tools_) {
    tools.push_back({{"name", tool.name}, {"description", tool.description}, {"inputSchema", tool.input_schema}});
  }
  return nlohmann::json{{"tools", tools}};
}

nlohmann::json Server::handle_tools_call(const nlohmann::json& id, const nlohmann::json& params) {
  if (!params.is_object()) {
    throw std::invalid_argument("Missing params for tools/call");
  }

  const auto name_it = params.find("name");
  if (name_it == params.end() || !name_it->is_string()) {
    throw std::invalid_argument("Missing tool name");
  }
  const auto& name = name_it->get_ref<const std::string&>();

  const auto* tool = find_tool(tools_, name);
  if (tool == nullptr) {
    return make_error_response(id, JsonRpcError{.code = error_code::kMethodNotFound, .message = "Unknown tool: " + name});
  }

  nlohmann::json arguments = nlohmann::json::object();
  if (const auto args_it = params.find("arguments"); args_it != params.end() && !args_it->is_null()) {
    if (!args_it->is_object()) {
      throw std::invalid_argument("arguments must be an object");
    }
    arguments = *args_it;
  }

  nlohmann::json result;
  try {
    result = tool->handler(arguments, context_);
  } catch (const std::exception& ex) {
    return request_failed(id, "tools/call " + name, "Request failed: ", ex);
  }

  return make_result_response(
      id, nlohmann::json{{"content", nlohmann::json::array({{{"type", "text"}, {"text", serialize(result)}}})}});
}

nlohmann::json Server::handle_resources_list(const nlohmann::json& id) const {
  std::vector<Resource> listed;
  try {
    listed = resources_.list();
  } catch (const core::DocumentError& ex) {
    if (ex.kind() != core::ErrorKind::kNoActiveDirectory) {
      return request_failed(id, "resources/list", "Failed to list resources: ", ex);
    }
  } catch (const std::exception& ex) {
    return request_failed(id, "resources/list", "Failed to list resources: ", ex);
  }

  nlohmann::json resources = nlohmann::json::array();
  for (const auto& resource : listed) {
    resources.push_back(to_json(resource));
  }
  return make_result_response(id, nlohmann::json{{"resources", resources}});
}

nlohmann::json Server::handle_resources_read(const nlohmann::json& id, const nlohmann::json& params) const {
  if (!params.is_object()) {
    throw std::invalid_argument("Missing params for resources/read");
  }
  const auto uri_it = params.find("uri");
  if (uri_it == params.end() || !uri_it->is_string()) {
    throw std::invalid_argument("Missing URI");
  }
  const auto& uri = uri_it->get_ref<const std::string&>();

  try {
    const auto content = resources_.read(uri);
    return make_result_response(id, nlohmann::json{{"contents", nlohmann::json::array({to_json(content)})}});
  } catch (const std::exception& ex) {
    const auto cause = core::describe_error(ex);
    const auto* document_error = dynamic_cast<const core::DocumentError*>(&ex);
    log_ << options_.name << ": request 'resources/read' failed for " << uri << ": " << cause << '\n';
    return make_error_response(
        id, JsonRpcError{.code = error_code::kRequestFailed,
                         .message = std::string("Failed to read resource: ") + ex.what(),
                         .data = nlohmann::json{
                             {"uri", uri},
                             {"kind", document_error != nullptr ? core::error_kind_name(document_error->kind())
                                                                : "internal"},
                             {"cause", cause}}});
  }
}

nlohmann::json Server::request_failed(const nlohmann::json& id, const std::string& method, const std::string& prefix,
                                      const std::exception& error) const {
  const auto cause = core::describe_error(error);
  log_ << options_.name << ": request '" << method << "' failed: " << cause << '\n';
  return make_error_response(id, JsonRpcError{.code = error_code::kRequestFailed,
                                              .message = prefix + error.what(),
                                              .data = nlohmann::json(cause)});
}

}  // namespace docu_mcp::mcp
