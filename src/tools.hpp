#pragma once

#include "config.hpp"
#include "http_client.hpp"
#include "tool_registry.hpp"

namespace mcp_tools {

// list_files, get_weather, get_weather_forecast, get_groups, get_usercount
// and get_repoteams. `config` must outlive the registry.
ToolRegistry build_tool_registry(const ServerConfig& config, HttpGet transport);

} // namespace mcp_tools
