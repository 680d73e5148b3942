#pragma once

#include "config.hpp"
#include <filesystem>
#include <stdexcept>
#include <string>

namespace mcp_tools {

// Raised when a user-supplied path cannot be represented on this host
class InvalidPath : public std::runtime_error {
public:
    explicit InvalidPath(const std::string& message) : std::runtime_error(message) {}
};

// Translate a user-supplied path into one valid in the current environment.
//
// Outside container mode this is plain OS resolution: '~' expansion, made
// absolute against the working directory, '.' and '..' folded lexically.
//
// In container mode, Windows drive paths ("C:\Users\x" or "C:/Users/x") are
// rewritten under the mount root ("/host/C/Users/x"). Paths already under
// the mount root pass through untouched, so resolving twice is a no-op.
//
// Throws InvalidPath for empty paths, embedded NUL bytes, and drive paths
// whose '..' segments climb above the drive root.
std::filesystem::path resolve_path(const std::string& raw, const PathSettings& settings);

// True for "X:" optionally followed by '/' or '\' and a remainder
bool is_drive_path(const std::string& raw);

} // namespace mcp_tools
