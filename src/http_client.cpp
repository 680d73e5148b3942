#include "http_client.hpp"
#include "server_log.hpp"
#include <httplib.h>
#include <chrono>

namespace mcp_tools {

namespace {

bool starts_with(const std::string& s, const std::string& prefix) {
    return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

HttpReply transport_failure(TransportError error) {
    HttpReply reply;
    reply.error = error;
    return reply;
}

HttpReply httplib_get(const HttpGetRequest& req) {
    auto url = split_base_url(req.base_url);
    if (!url) {
        return transport_failure(TransportError::InvalidUrl);
    }

#ifndef CPPHTTPLIB_OPENSSL_SUPPORT
    // httplib::Client throws on an https origin when built without TLS
    if (starts_with(url->scheme_host_port, "https://")) {
        ServerLog::error("HTTP", "https endpoint configured but TLS support is not built in");
        return transport_failure(TransportError::InvalidUrl);
    }
#endif

    httplib::Client cli(url->scheme_host_port);
    if (!cli.is_valid()) {
        return transport_failure(TransportError::InvalidUrl);
    }
    cli.set_connection_timeout(req.timeout_seconds, 0);
    cli.set_read_timeout(req.timeout_seconds, 0);
    cli.set_write_timeout(req.timeout_seconds, 0);
    // A 3xx is returned as-is; the bearer header must not follow a Location
    cli.set_follow_location(false);

    httplib::Params params;
    for (const auto& [key, value] : req.query) {
        params.emplace(key, value);
    }
    httplib::Headers headers;
    for (const auto& [key, value] : req.headers) {
        headers.emplace(key, value);
    }

    const std::string path = join_url_path(url->base_path, req.path);
    const auto started = std::chrono::steady_clock::now();
    auto res = cli.Get(path, params, headers);

    if (!res) {
        const auto err = res.error();
        const auto elapsed = std::chrono::steady_clock::now() - started;
        ServerLog::warn("HTTP", "GET " + path + " failed: " + httplib::to_string(err));

        if (err == httplib::Error::ConnectionTimeout ||
            elapsed >= std::chrono::seconds(req.timeout_seconds)) {
            return transport_failure(TransportError::Timeout);
        }
        return transport_failure(TransportError::ConnectionFailed);
    }

    HttpReply reply;
    reply.status = res->status;
    reply.body = std::move(res->body);
    return reply;
}

} // namespace

std::optional<BaseUrl> split_base_url(const std::string& url) {
    std::string rest;
    std::string scheme;
    if (starts_with(url, "http://")) {
        scheme = "http://";
        rest = url.substr(7);
    } else if (starts_with(url, "https://")) {
        scheme = "https://";
        rest = url.substr(8);
    } else {
        return std::nullopt;
    }

    BaseUrl out;
    auto slash = rest.find('/');
    std::string authority = rest.substr(0, slash);
    if (authority.empty()) {
        return std::nullopt;
    }
    out.scheme_host_port = scheme + authority;
    if (slash != std::string::npos) {
        out.base_path = rest.substr(slash);
        while (!out.base_path.empty() && out.base_path.back() == '/') {
            out.base_path.pop_back();
        }
    }
    return out;
}

std::string join_url_path(const std::string& base, const std::string& path) {
    if (base.empty()) return path.empty() || path.front() != '/' ? "/" + path : path;
    if (path.empty()) return base;
    if (base.back() == '/' && path.front() == '/') return base + path.substr(1);
    if (base.back() != '/' && path.front() != '/') return base + "/" + path;
    return base + path;
}

HttpGet make_http_get() {
    return httplib_get;
}

} // namespace mcp_tools
