#include "config.hpp"
#include "http_client.hpp"
#include "mcp_server.hpp"
#include "server_log.hpp"
#include "tools.hpp"

#include <filesystem>
#include <iostream>
#include <string>

using namespace mcp_tools;

void print_usage(const char* program) {
    std::cerr << "MCP Tools Server - JSON-RPC tool server over stdin/stdout\n\n";
    std::cerr << "Usage: " << program << " [options]\n\n";
    std::cerr << "Options:\n";
    std::cerr << "  --env-file PATH    Read KEY=VALUE settings from PATH (default: .env)\n";
    std::cerr << "  --container-mode   Translate Windows drive paths under the host root\n";
    std::cerr << "  --host-root PATH   Mount point of the host drives (default: /host)\n";
    std::cerr << "  --help             Show this help message\n\n";
    std::cerr << "Environment:\n";
    std::cerr << "  API_ENDPOINT, BEARER_TOKEN            groups API\n";
    std::cerr << "  GITHUB_API_ENDPOINT, GITHUB_BEARER_TOKEN, GITHUB_ORG_NAME\n";
    std::cerr << "  MCP_CONTAINER_MODE, MCP_HOST_ROOT, API_TIMEOUT_SECONDS\n";
}

int main(int argc, char* argv[]) {
    std::string env_file = ".env";
    bool container_mode = false;
    std::string host_root;

    // Parse command line arguments
    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            print_usage(argv[0]);
            return 0;
        }
        else if (arg == "--env-file" && i + 1 < argc) {
            env_file = argv[++i];
        }
        else if (arg == "--container-mode") {
            container_mode = true;
        }
        else if (arg == "--host-root" && i + 1 < argc) {
            host_root = argv[++i];
        }
        else {
            std::cerr << "Unknown option: " << arg << std::endl;
            print_usage(argv[0]);
            return 1;
        }
    }

    try {
        std::error_code ec;
        if (std::filesystem::exists(env_file, ec)) {
            int exported = apply_env_file(env_file);
            ServerLog::log("Config", "Loaded " + std::to_string(exported) + " settings from " + env_file);
        }

        ServerConfig config = load_config_from_env();
        if (container_mode) {
            config.paths.container_mode = true;
        }
        if (!host_root.empty()) {
            config.paths.mount_root = std::filesystem::path(host_root).lexically_normal().string();
            while (config.paths.mount_root.size() > 1 && config.paths.mount_root.back() == '/') {
                config.paths.mount_root.pop_back();
            }
        }

        ServerLog::log("Config", std::string("Container mode: ") +
                       (config.paths.container_mode ? "on (host root " + config.paths.mount_root + ")" : "off"));
        ServerLog::log("Config", std::string("Groups API: ") +
                       (config.groups_api.endpoint.empty() ? "not configured" : config.groups_api.endpoint));

        // Configuration is frozen from here on
        const ServerConfig& frozen = config;
        ToolRegistry registry = build_tool_registry(frozen, make_http_get());
        McpServer server(registry);

        return server.run(std::cin, std::cout);

    } catch (const std::exception& e) {
        ServerLog::error("Main", std::string("Fatal error: ") + e.what());
        return 1;
    }
}
