#include "server_log.hpp"
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>

namespace mcp_tools {

ServerLog::Sink ServerLog::sink_ = ServerLog::stderr_sink;
std::mutex ServerLog::mutex_;

void ServerLog::set_sink(Sink sink) {
    std::lock_guard<std::mutex> lock(mutex_);
    sink_ = sink ? std::move(sink) : stderr_sink;
}

void ServerLog::log(const std::string& component, const std::string& message) {
    write(component, message, LogLevel::Info);
}

void ServerLog::warn(const std::string& component, const std::string& message) {
    write(component, message, LogLevel::Warning);
}

void ServerLog::error(const std::string& component, const std::string& message) {
    write(component, message, LogLevel::Error);
}

void ServerLog::write(const std::string& component, const std::string& message, LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (sink_) {
        sink_(component, message, level);
    }
}

void ServerLog::stderr_sink(const std::string& component,
                            const std::string& message, LogLevel level) {
    std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm utc{};
    gmtime_r(&now, &utc);

    std::cerr << std::put_time(&utc, "%Y-%m-%dT%H:%M:%SZ")
              << " [" << component << "] "
              << log_level_to_string(level) << " "
              << message << std::endl;
}

} // namespace mcp_tools
