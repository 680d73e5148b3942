#pragma once

#include <functional>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace mcp_tools {

using KeyValueList = std::vector<std::pair<std::string, std::string>>;

struct HttpGetRequest {
    std::string base_url;        // scheme://host[:port][/base/path]
    std::string path;            // Appended to the base path
    KeyValueList query;
    KeyValueList headers;
    int timeout_seconds = 30;
};

enum class TransportError {
    None,
    InvalidUrl,
    ConnectionFailed,
    Timeout
};

struct HttpReply {
    TransportError error = TransportError::None;
    int status = 0;
    std::string body;
};

// One GET, one attempt. Swappable so the API proxy can be driven without
// a network.
using HttpGet = std::function<HttpReply(const HttpGetRequest&)>;

// cpp-httplib backed transport
HttpGet make_http_get();

struct BaseUrl {
    std::string scheme_host_port;
    std::string base_path;
};

// Split "https://api.example.com:8443/v1" into origin and base path
std::optional<BaseUrl> split_base_url(const std::string& url);

std::string join_url_path(const std::string& base, const std::string& path);

} // namespace mcp_tools
