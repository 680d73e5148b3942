#include "config.hpp"
#include "server_log.hpp"
#include <cstdlib>
#include <fstream>

namespace mcp_tools {

namespace {

std::string get_env(const char* name) {
    const char* v = std::getenv(name);
    return v ? std::string(v) : std::string();
}

std::string trim(const std::string& s) {
    const char* ws = " \t\r\n";
    auto begin = s.find_first_not_of(ws);
    if (begin == std::string::npos) return "";
    auto end = s.find_last_not_of(ws);
    return s.substr(begin, end - begin + 1);
}

std::string strip_trailing_slashes(std::string s) {
    while (!s.empty() && s.back() == '/') {
        s.pop_back();
    }
    return s;
}

std::string to_lower(std::string s) {
    for (auto& c : s) {
        if (c >= 'A' && c <= 'Z') c = static_cast<char>(c - 'A' + 'a');
    }
    return s;
}

ApiSettings load_api_settings(const char* endpoint_var, const char* token_var, int timeout) {
    ApiSettings api;
    api.endpoint = strip_trailing_slashes(trim(get_env(endpoint_var)));
    api.bearer_token = trim(get_env(token_var));
    api.endpoint_var = endpoint_var;
    api.token_var = token_var;
    api.timeout_seconds = timeout;
    return api;
}

} // namespace

bool parse_bool(const std::string& value, bool fallback) {
    const std::string v = to_lower(trim(value));
    if (v == "1" || v == "true" || v == "yes" || v == "y" || v == "on") return true;
    if (v == "0" || v == "false" || v == "no" || v == "n" || v == "off") return false;
    return fallback;
}

ServerConfig load_config_from_env() {
    ServerConfig cfg;

    int timeout = 30;
    if (auto t = get_env("API_TIMEOUT_SECONDS"); !t.empty()) {
        int parsed = std::atoi(t.c_str());
        if (parsed > 0) {
            timeout = parsed;
        } else {
            ServerLog::warn("Config", "Ignoring invalid API_TIMEOUT_SECONDS: " + t);
        }
    }

    cfg.groups_api = load_api_settings("API_ENDPOINT", "BEARER_TOKEN", timeout);
    cfg.github_api = load_api_settings("GITHUB_API_ENDPOINT", "GITHUB_BEARER_TOKEN", timeout);
    cfg.github_org = trim(get_env("GITHUB_ORG_NAME"));

    cfg.paths.container_mode = parse_bool(get_env("MCP_CONTAINER_MODE"), false);
    if (auto root = strip_trailing_slashes(trim(get_env("MCP_HOST_ROOT"))); !root.empty()) {
        cfg.paths.mount_root = root;
    }

    return cfg;
}

std::map<std::string, std::string> read_env_file(const std::string& path) {
    std::map<std::string, std::string> values;

    std::ifstream file(path);
    if (!file.is_open()) {
        return values;
    }

    std::string line;
    while (std::getline(file, line)) {
        line = trim(line);
        if (line.empty() || line[0] == '#') continue;

        if (line.compare(0, 7, "export ") == 0) {
            line = trim(line.substr(7));
        }

        auto eq = line.find('=');
        if (eq == std::string::npos) continue;

        std::string key = trim(line.substr(0, eq));
        std::string value = trim(line.substr(eq + 1));
        if (key.empty()) continue;

        if (value.size() >= 2 &&
            ((value.front() == '"' && value.back() == '"') ||
             (value.front() == '\'' && value.back() == '\''))) {
            value = value.substr(1, value.size() - 2);
        } else {
            // Unquoted values may carry a trailing comment
            auto hash = value.find(" #");
            if (hash != std::string::npos) {
                value = trim(value.substr(0, hash));
            }
        }

        values[key] = value;
    }

    return values;
}

int apply_env_file(const std::string& path) {
    int exported = 0;
    for (const auto& [key, value] : read_env_file(path)) {
        if (std::getenv(key.c_str()) != nullptr) continue;
        if (setenv(key.c_str(), value.c_str(), 0) == 0) {
            ++exported;
        } else {
            ServerLog::warn("Config", "Could not export " + key + " from " + path);
        }
    }
    return exported;
}

} // namespace mcp_tools
