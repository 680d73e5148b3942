#pragma once

#include <stdexcept>
#include <string>

namespace mcp_tools {

// Arguments that do not match a tool's declared schema. Surfaces as a
// JSON-RPC -32602 error.
class InvalidParams : public std::runtime_error {
public:
    explicit InvalidParams(const std::string& message) : std::runtime_error(message) {}
};

// A tool ran but could not complete for a domain reason. The message is
// safe to show to the peer and ends up in {"success": false, "error": ...}.
class ToolError : public std::runtime_error {
public:
    explicit ToolError(const std::string& message) : std::runtime_error(message) {}
};

} // namespace mcp_tools
