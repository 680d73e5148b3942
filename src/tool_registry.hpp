#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include <nlohmann/json.hpp>

namespace mcp_tools {

enum class ParamType {
    String,
    Integer,
    Boolean
};

inline std::string param_type_to_string(ParamType t) {
    switch (t) {
        case ParamType::String: return "string";
        case ParamType::Integer: return "integer";
        case ParamType::Boolean: return "boolean";
        default: return "unknown";
    }
}

struct ParamSpec {
    std::string name;
    ParamType type = ParamType::String;
    bool required = false;
    nlohmann::json default_value;            // null = no default
    std::string description;
    std::vector<std::string> allowed;        // enum, strings only
    std::optional<int64_t> minimum;          // advertised only, handlers clamp
    std::optional<int64_t> maximum;
};

using ToolHandler = std::function<nlohmann::json(const nlohmann::json& args)>;

struct ToolDescriptor {
    std::string name;
    std::string description;
    std::vector<ParamSpec> params;
    ToolHandler handler;

    // JSON Schema advertised through tools/list
    nlohmann::json input_schema() const;

    // Check types, enums and required flags, then fill defaults.
    // Throws InvalidParams.
    nlohmann::json prepare_arguments(const nlohmann::json& args) const;
};

// Fixed tool table. Built once at startup, read-only afterwards.
class ToolRegistry {
public:
    explicit ToolRegistry(std::vector<ToolDescriptor> tools);

    const ToolDescriptor* find(const std::string& name) const;
    const std::vector<ToolDescriptor>& tools() const { return tools_; }
    std::size_t size() const { return tools_.size(); }

    // {"tools": [{name, description, inputSchema}]} in registration order
    nlohmann::json list() const;

    // Validate and invoke. InvalidParams propagates to the caller; any
    // other handler failure becomes {"success": false, "error": ...}.
    nlohmann::json call(const ToolDescriptor& tool, const nlohmann::json& args) const;

private:
    std::vector<ToolDescriptor> tools_;
    std::unordered_map<std::string, std::size_t> index_;
};

} // namespace mcp_tools
