#pragma once

namespace docu_mcp {

constexpr const char* kServerName = "docu-mcp";
constexpr const char* kServerVersion = "0.1.0";

}  // namespace docu_mcp
