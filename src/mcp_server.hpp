#pragma once

#include "tool_registry.hpp"
#include <iosfwd>
#include <string>
#include <nlohmann/json.hpp>

namespace mcp_tools {

class McpServer {
public:
    explicit McpServer(const ToolRegistry& tools);

    // Read one request per line until end of input, writing one response
    // line per request (none for notifications). Returns the exit status.
    int run(std::istream& in, std::ostream& out);

    // Handle one raw input line. Null json means nothing to send back.
    nlohmann::json handle_line(const std::string& line);

    // Handle one decoded JSON-RPC message. Null json for notifications.
    nlohmann::json handle_request(const nlohmann::json& request);

private:
    // MCP protocol handlers
    nlohmann::json handle_initialize(const nlohmann::json& params);
    nlohmann::json handle_tools_list();
    nlohmann::json handle_tools_call(const nlohmann::json& params);
    void handle_notification(const std::string& method);

    const ToolRegistry& tools_;
    bool initialized_ = false;
};

// Serialize a message for the wire. Invalid UTF-8 (e.g. in file names) is
// replaced rather than thrown on.
std::string to_wire(const nlohmann::json& message, int indent = -1);

} // namespace mcp_tools
