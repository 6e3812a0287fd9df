#include <csignal>
#include <exception>
#include <filesystem>
#include <iostream>
#include <string>

#include "docu_mcp/core/config.hpp"
#include "docu_mcp/core/errors.hpp"
#include "docu_mcp/extractors/extractor.hpp"
#include "docu_mcp/mcp/server.hpp"
#include "docu_mcp/mcp/tools.hpp"

int main(int argc, char** argv) {
  // A closed stdout must surface as a failed write, not terminate the process.
  std::signal(SIGPIPE, SIG_IGN);

  std::filesystem::path config_path;
  try {
    config_path = argc > 1 ? std::filesystem::path(argv[1]) : docu_mcp::core::default_config_path();
  } catch (const std::exception& ex) {
    std::cerr << "docu-mcp: config error: " << ex.what() << '\n';
    return 1;
  }

  std::cerr << "docu-mcp: using config " << config_path.string() << '\n';

  docu_mcp::core::JsonFileConfigStore config_store(config_path);
  const auto extractors = docu_mcp::extractors::build_extractor_registry();

  docu_mcp::mcp::ServerOptions options{};
  options.trace = docu_mcp::core::env_flag("DOCU_MCP_TRACE", false);

  docu_mcp::mcp::Server server(docu_mcp::mcp::build_tool_registry(),
                               docu_mcp::mcp::ToolContext{.config = config_store, .extractors = extractors}, std::cerr,
                               options);
  try {
    return server.run(std::cin, std::cout);
  } catch (const std::exception& ex) {
    std::cerr << "docu-mcp: fatal: " << docu_mcp::core::describe_error(ex) << '\n';
    return 1;
  }
}
