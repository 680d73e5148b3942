#include "path_resolver.hpp"
#include <cstdlib>

namespace mcp_tools {

namespace fs = std::filesystem;

namespace {

bool is_ascii_letter(char c) {
    return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z');
}

char to_upper_ascii(char c) {
    return (c >= 'a' && c <= 'z') ? static_cast<char>(c - 'a' + 'A') : c;
}

// Remove a trailing separator so "/tmp/" and "/tmp" compare equal
fs::path strip_trailing_separator(const fs::path& p) {
    std::string s = p.string();
    while (s.size() > 1 && s.back() == '/') {
        s.pop_back();
    }
    return fs::path(s);
}

std::string expand_home(const std::string& raw) {
    if (raw.empty() || raw[0] != '~') return raw;
    if (raw.size() > 1 && raw[1] != '/') return raw;  // ~user is not supported

    const char* home = std::getenv("HOME");
    if (home == nullptr || *home == '\0') return raw;
    return std::string(home) + raw.substr(1);
}

fs::path resolve_native(const std::string& raw) {
    std::error_code ec;
    fs::path p = fs::absolute(fs::path(expand_home(raw)), ec);
    if (ec) {
        throw InvalidPath("Cannot resolve path: " + raw);
    }
    return strip_trailing_separator(p.lexically_normal());
}

bool under_mount_root(const std::string& raw, const std::string& root) {
    if (root.empty()) return false;
    if (raw == root) return true;
    return raw.size() > root.size() &&
           raw.compare(0, root.size(), root) == 0 &&
           raw[root.size()] == '/';
}

fs::path resolve_drive(const std::string& raw, const PathSettings& settings) {
    std::string drive(1, to_upper_ascii(raw[0]));
    fs::path drive_root = fs::path(settings.mount_root) / drive;

    std::string remainder = raw.size() > 2 ? raw.substr(3) : std::string();
    for (auto& c : remainder) {
        if (c == '\\') c = '/';
    }

    fs::path joined = (drive_root / remainder).lexically_normal();
    joined = strip_trailing_separator(joined);

    // ".." must not walk out of the mounted drive
    fs::path rel = joined.lexically_relative(drive_root);
    if (rel.empty() || *rel.begin() == "..") {
        throw InvalidPath("Path escapes drive " + drive + ": " + raw);
    }
    return joined;
}

} // namespace

bool is_drive_path(const std::string& raw) {
    if (raw.size() < 2 || !is_ascii_letter(raw[0]) || raw[1] != ':') return false;
    return raw.size() == 2 || raw[2] == '/' || raw[2] == '\\';
}

fs::path resolve_path(const std::string& raw, const PathSettings& settings) {
    if (raw.empty()) {
        throw InvalidPath("Path is empty");
    }
    if (raw.find('\0') != std::string::npos) {
        throw InvalidPath("Path contains a NUL byte");
    }

    if (settings.container_mode) {
        if (is_drive_path(raw)) {
            return resolve_drive(raw, settings);
        }
        if (under_mount_root(raw, settings.mount_root)) {
            return fs::path(raw);
        }
    }

    return resolve_native(raw);
}

} // namespace mcp_tools
