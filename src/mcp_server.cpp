#include "mcp_server.hpp"
#include "errors.hpp"
#include "jsonrpc.hpp"
#include "server_log.hpp"
#include <algorithm>
#include <array>
#include <istream>
#include <ostream>

namespace mcp_tools {

namespace {

constexpr const char* kServerName = "mcp-tools-server";
constexpr const char* kServerVersion = "1.0.0";

// Newest first
const std::array<const char*, 3> kProtocolVersions = {"2025-06-18", "2025-03-26", "2024-11-05"};

bool is_blank(const std::string& s) {
    return s.find_first_not_of(" \t\r\n") == std::string::npos;
}

} // namespace

std::string to_wire(const nlohmann::json& message, int indent) {
    return message.dump(indent, ' ', false, nlohmann::json::error_handler_t::replace);
}

McpServer::McpServer(const ToolRegistry& tools)
    : tools_(tools)
{
}

int McpServer::run(std::istream& in, std::ostream& out) {
    ServerLog::log("MCP", "Session started with " + std::to_string(tools_.size()) + " tools");

    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (is_blank(line)) {
            continue;
        }

        nlohmann::json response = handle_line(line);
        if (response.is_null()) {
            continue;
        }

        // One line per response, flushed so the peer never waits on a buffer
        out << to_wire(response) << '\n';
        out.flush();
    }

    ServerLog::log("MCP", "Input closed, session ended");
    return 0;
}

nlohmann::json McpServer::handle_line(const std::string& line) {
    nlohmann::json request = nlohmann::json::parse(line, nullptr, false);
    if (request.is_discarded()) {
        ServerLog::warn("MCP", "Discarding unparseable input (" + std::to_string(line.size()) + " bytes)");
        return error_response(nullptr, kParseError, "Parse error");
    }
    return handle_request(request);
}

nlohmann::json McpServer::handle_request(const nlohmann::json& request) {
    nlohmann::json id = nullptr;

    try {
        RpcRequest req = parse_request(request);
        id = req.id;

        if (req.is_notification) {
            handle_notification(req.method);
            return nlohmann::json();
        }

        ServerLog::log("MCP", req.method);

        if (req.method == "initialize") {
            return success_response(id, handle_initialize(req.params));
        }
        else if (req.method == "ping") {
            return success_response(id, nlohmann::json::object());
        }
        else if (req.method == "tools/list") {
            return success_response(id, handle_tools_list());
        }
        else if (req.method == "tools/call") {
            return success_response(id, handle_tools_call(req.params));
        }
        else {
            return error_response(id, kMethodNotFound, "Method not found: " + req.method);
        }

    } catch (const RpcError& e) {
        ServerLog::warn("MCP", e.what());
        return error_response(e.id().is_null() ? id : e.id(), e.code(), e.what());
    } catch (const InvalidParams& e) {
        ServerLog::warn("MCP", std::string("Invalid params: ") + e.what());
        return error_response(id, kInvalidParams, e.what());
    } catch (const std::exception& e) {
        ServerLog::error("MCP", std::string("Internal error: ") + e.what());
        return error_response(id, kInternalError, "Internal error");
    }
}

void McpServer::handle_notification(const std::string& method) {
    if (method == "notifications/initialized") {
        // Client acknowledgment of the handshake
        ServerLog::log("MCP", "Client initialized");
    } else if (method.compare(0, 14, "notifications/") == 0) {
        ServerLog::log("MCP", method);
    } else {
        ServerLog::warn("MCP", "Ignoring notification for method: " + method);
    }
}

nlohmann::json McpServer::handle_initialize(const nlohmann::json& params) {
    std::string version = kProtocolVersions.front();
    if (params.is_object()) {
        auto it = params.find("protocolVersion");
        if (it != params.end() && it->is_string()) {
            const std::string requested = it->get<std::string>();
            bool supported = std::find(kProtocolVersions.begin(), kProtocolVersions.end(), requested)
                             != kProtocolVersions.end();
            if (supported) {
                version = requested;
            } else {
                ServerLog::warn("MCP", "Client asked for protocol " + requested + ", offering " + version);
            }
        }
    }

    if (initialized_) {
        ServerLog::warn("MCP", "initialize received more than once");
    }
    initialized_ = true;

    return {
        {"protocolVersion", version},
        {"capabilities", {
            {"tools", {{"listChanged", false}}}
        }},
        {"serverInfo", {
            {"name", kServerName},
            {"version", kServerVersion}
        }},
        {"instructions",
            "Tool server for local file listing, demo weather data and the groups directory API.\n\n"
            "- list_files: inspect a directory (Windows drive paths work in container mode)\n"
            "- get_weather / get_weather_forecast: static sample weather payloads\n"
            "- get_groups: paginated group name -> id map from the configured API\n"
            "- get_usercount: member count of one group\n"
            "- get_repoteams: teams with access to a GitHub repository\n\n"
            "Domain failures come back as normal results with success=false and an error message."}
    };
}

nlohmann::json McpServer::handle_tools_list() {
    return tools_.list();
}

nlohmann::json McpServer::handle_tools_call(const nlohmann::json& params) {
    if (!params.is_object()) {
        throw InvalidParams("params must be an object");
    }

    auto name_it = params.find("name");
    if (name_it == params.end() || !name_it->is_string()) {
        throw InvalidParams("name must be a string");
    }
    const std::string name = name_it->get<std::string>();

    const ToolDescriptor* tool = tools_.find(name);
    if (tool == nullptr) {
        throw RpcError(kMethodNotFound, "Unknown tool: " + name);
    }

    nlohmann::json args = params.value("arguments", nlohmann::json::object());
    nlohmann::json result = tools_.call(*tool, args);

    auto success_it = result.find("success");
    bool is_error = success_it != result.end() && success_it->is_boolean() && !success_it->get<bool>();

    nlohmann::json content = nlohmann::json::array();
    content.push_back({
        {"type", "text"},
        {"text", to_wire(result, 2)}
    });

    result["content"] = content;
    result["isError"] = is_error;
    return result;
}

} // namespace mcp_tools
