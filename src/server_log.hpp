#pragma once

#include <string>
#include <functional>
#include <mutex>

namespace mcp_tools {

enum class LogLevel : int {
    Info = 0,
    Warning = 1,
    Error = 2
};

inline const char* log_level_to_string(LogLevel level) {
    switch (level) {
        case LogLevel::Info: return "INFO";
        case LogLevel::Warning: return "WARN";
        case LogLevel::Error: return "ERROR";
        default: return "UNKNOWN";
    }
}

// Global server log sink. Stdout carries the protocol, so every sink
// installed here must stay off it.
class ServerLog {
public:
    using Sink = std::function<void(const std::string& component,
                                     const std::string& message,
                                     LogLevel level)>;

    static void set_sink(Sink sink);
    static void log(const std::string& component, const std::string& message);
    static void warn(const std::string& component, const std::string& message);
    static void error(const std::string& component, const std::string& message);

    // Default sink: timestamped lines on stderr
    static void stderr_sink(const std::string& component,
                            const std::string& message, LogLevel level);

    // Discards everything (used by tests)
    static void null_sink(const std::string&, const std::string&, LogLevel) {}

private:
    static void write(const std::string& component, const std::string& message, LogLevel level);

    static Sink sink_;
    static std::mutex mutex_;
};

} // namespace mcp_tools
