#include "tool_registry.hpp"
#include "errors.hpp"
#include "server_log.hpp"
#include <algorithm>
#include <stdexcept>

namespace mcp_tools {

namespace {

nlohmann::json failure(const std::string& message) {
    return {
        {"success", false},
        {"error", message}
    };
}

// Integers may arrive as 5.0 from some clients
std::optional<int64_t> as_integer(const nlohmann::json& v) {
    if (v.is_number_integer()) return v.get<int64_t>();
    if (v.is_number_float()) {
        double d = v.get<double>();
        if (d >= -9.0e18 && d <= 9.0e18 && d == static_cast<double>(static_cast<int64_t>(d))) {
            return static_cast<int64_t>(d);
        }
    }
    return std::nullopt;
}

std::string join(const std::vector<std::string>& items, const std::string& sep) {
    std::string out;
    for (std::size_t i = 0; i < items.size(); i++) {
        if (i > 0) out += sep;
        out += items[i];
    }
    return out;
}

} // namespace

nlohmann::json ToolDescriptor::input_schema() const {
    nlohmann::json properties = nlohmann::json::object();
    nlohmann::json required = nlohmann::json::array();

    for (const auto& p : params) {
        nlohmann::json prop = {
            {"type", param_type_to_string(p.type)},
            {"description", p.description}
        };
        if (!p.default_value.is_null()) prop["default"] = p.default_value;
        if (!p.allowed.empty()) prop["enum"] = p.allowed;
        if (p.minimum) prop["minimum"] = *p.minimum;
        if (p.maximum) prop["maximum"] = *p.maximum;

        properties[p.name] = prop;
        if (p.required) required.push_back(p.name);
    }

    nlohmann::json schema = {
        {"type", "object"},
        {"properties", properties}
    };
    if (!required.empty()) {
        schema["required"] = required;
    }
    return schema;
}

nlohmann::json ToolDescriptor::prepare_arguments(const nlohmann::json& args) const {
    if (!args.is_null() && !args.is_object()) {
        throw InvalidParams("arguments must be an object");
    }
    nlohmann::json prepared = args.is_object() ? args : nlohmann::json::object();

    for (const auto& p : params) {
        auto it = prepared.find(p.name);
        if (it == prepared.end() || it->is_null()) {
            if (p.required) {
                throw InvalidParams("Missing required parameter: " + p.name);
            }
            if (!p.default_value.is_null()) {
                prepared[p.name] = p.default_value;
            } else if (it != prepared.end()) {
                prepared.erase(it);
            }
            continue;
        }

        switch (p.type) {
            case ParamType::String:
                if (!it->is_string()) {
                    throw InvalidParams("Parameter '" + p.name + "' must be a string");
                }
                if (!p.allowed.empty() &&
                    std::find(p.allowed.begin(), p.allowed.end(), it->get<std::string>()) == p.allowed.end()) {
                    throw InvalidParams("Parameter '" + p.name + "' must be one of: " + join(p.allowed, ", "));
                }
                break;
            case ParamType::Integer: {
                auto v = as_integer(*it);
                if (!v) {
                    throw InvalidParams("Parameter '" + p.name + "' must be an integer");
                }
                *it = *v;
                break;
            }
            case ParamType::Boolean:
                if (!it->is_boolean()) {
                    throw InvalidParams("Parameter '" + p.name + "' must be a boolean");
                }
                break;
        }
    }

    return prepared;
}

ToolRegistry::ToolRegistry(std::vector<ToolDescriptor> tools)
    : tools_(std::move(tools))
{
    for (std::size_t i = 0; i < tools_.size(); i++) {
        if (!tools_[i].handler) {
            throw std::invalid_argument("Tool has no handler: " + tools_[i].name);
        }
        if (!index_.emplace(tools_[i].name, i).second) {
            throw std::invalid_argument("Duplicate tool name: " + tools_[i].name);
        }
    }
}

const ToolDescriptor* ToolRegistry::find(const std::string& name) const {
    auto it = index_.find(name);
    return it == index_.end() ? nullptr : &tools_[it->second];
}

nlohmann::json ToolRegistry::list() const {
    nlohmann::json tools = nlohmann::json::array();
    for (const auto& tool : tools_) {
        tools.push_back({
            {"name", tool.name},
            {"description", tool.description},
            {"inputSchema", tool.input_schema()}
        });
    }
    return {{"tools", tools}};
}

nlohmann::json ToolRegistry::call(const ToolDescriptor& tool, const nlohmann::json& args) const {
    nlohmann::json prepared = tool.prepare_arguments(args);

    try {
        nlohmann::json result = tool.handler(prepared);
        if (!result.is_object()) {
            ServerLog::error("Tools", tool.name + " returned a non-object result");
            return failure("Tool " + tool.name + " produced an invalid result");
        }
        return result;
    } catch (const InvalidParams&) {
        throw;
    } catch (const ToolError& e) {
        ServerLog::warn("Tools", tool.name + ": " + e.what());
        return failure(e.what());
    } catch (const std::exception& e) {
        // Internal detail stays in the server log
        ServerLog::error("Tools", tool.name + " failed: " + e.what());
        return failure("Internal error while running " + tool.name);
    }
}

} // namespace mcp_tools
