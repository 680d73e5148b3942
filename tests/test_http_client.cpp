#include <catch2/catch_test_macros.hpp>
#include "http_client.hpp"
#include "api_client.hpp"
#include "test_helpers.hpp"
#include <httplib.h>
#include <atomic>
#include <chrono>
#include <thread>

using namespace mcp_tools;
using mcp_tools::testing::QuietLog;

namespace {

// httplib::Server listening on an ephemeral loopback port for one test
class LocalServer {
public:
    LocalServer() {
        port_ = server_.bind_to_any_port("127.0.0.1");
        thread_ = std::thread([this] { server_.listen_after_bind(); });
        server_.wait_until_ready();
    }
    ~LocalServer() {
        server_.stop();
        if (thread_.joinable()) thread_.join();
    }

    LocalServer(const LocalServer&) = delete;
    LocalServer& operator=(const LocalServer&) = delete;

    httplib::Server& server() { return server_; }
    std::string url() const { return "http://127.0.0.1:" + std::to_string(port_); }

private:
    httplib::Server server_;
    int port_ = -1;
    std::thread thread_;
};

HttpGetRequest get_request(const std::string& base_url, const std::string& path, int timeout_seconds) {
    HttpGetRequest req;
    req.base_url = base_url;
    req.path = path;
    req.headers = {{"Authorization", "Bearer tok-123"}, {"Accept", "application/json"}};
    req.timeout_seconds = timeout_seconds;
    return req;
}

} // namespace

TEST_CASE("HTTP transport against a local server", "[http]") {
    QuietLog quiet;
    HttpGet http_get = make_http_get();

    SECTION("Status, body and query reach the peer") {
        std::string seen_auth;
        std::string seen_page;
        LocalServer local;
        local.server().Get("/api/groups", [&](const httplib::Request& req, httplib::Response& res) {
            seen_auth = req.get_header_value("Authorization");
            seen_page = req.get_param_value("page");
            res.set_content(R"({"groups": []})", "application/json");
        });

        auto req = get_request(local.url() + "/api", "/groups", 5);
        req.query = {{"page", "2"}};
        auto reply = http_get(req);

        REQUIRE(reply.error == TransportError::None);
        REQUIRE(reply.status == 200);
        REQUIRE(reply.body == R"({"groups": []})");
        REQUIRE(seen_auth == "Bearer tok-123");
        REQUIRE(seen_page == "2");
    }

    SECTION("Slow responses time out") {
        LocalServer local;
        local.server().Get("/slow", [](const httplib::Request&, httplib::Response& res) {
            std::this_thread::sleep_for(std::chrono::milliseconds(2500));
            res.set_content("{}", "application/json");
        });

        auto reply = http_get(get_request(local.url(), "/slow", 1));
        REQUIRE(reply.error == TransportError::Timeout);

        auto outcome = classify_reply(reply);
        REQUIRE(outcome.status == ApiStatus::NetworkError);
        REQUIRE(outcome.message == "API request timed out. Please try again.");
    }

    SECTION("Nothing listening is a connection failure") {
        // Bound but never listening, so the connect is refused
        httplib::Server idle;
        int port = idle.bind_to_any_port("127.0.0.1");
        REQUIRE(port > 0);

        auto reply = http_get(get_request("http://127.0.0.1:" + std::to_string(port), "/groups", 5));
        REQUIRE(reply.error == TransportError::ConnectionFailed);
        REQUIRE(classify_reply(reply).message == "Failed to connect to API");
    }

    SECTION("Redirects are returned, not followed") {
        std::atomic<int> elsewhere_hits{0};
        LocalServer elsewhere;
        elsewhere.server().Get("/landing", [&](const httplib::Request&, httplib::Response& res) {
            elsewhere_hits++;
            res.set_content("{}", "application/json");
        });

        const std::string target = elsewhere.url() + "/landing";
        LocalServer origin;
        origin.server().Get("/groups", [&](const httplib::Request&, httplib::Response& res) {
            res.set_redirect(target);
        });

        auto reply = http_get(get_request(origin.url(), "/groups", 5));
        REQUIRE(reply.error == TransportError::None);
        REQUIRE(reply.status == 302);
        REQUIRE(elsewhere_hits.load() == 0);

        auto outcome = classify_reply(reply);
        REQUIRE(outcome.status == ApiStatus::ServerError);
        REQUIRE(outcome.status_code == 302);
    }

    SECTION("Unusable base URLs never open a connection") {
        REQUIRE(http_get(get_request("ftp://127.0.0.1", "/groups", 5)).error == TransportError::InvalidUrl);
        REQUIRE(http_get(get_request("127.0.0.1:80", "/groups", 5)).error == TransportError::InvalidUrl);
    }
}
