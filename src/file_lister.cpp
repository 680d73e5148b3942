#include "file_lister.hpp"
#include "server_log.hpp"
#include <algorithm>
#include <cerrno>
#include <sys/stat.h>

namespace mcp_tools {

namespace fs = std::filesystem;

namespace {

char fold_ascii(char c) {
    return (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : c;
}

double to_unix_seconds(const struct timespec& ts) {
    return static_cast<double>(ts.tv_sec) + static_cast<double>(ts.tv_nsec) / 1e9;
}

DirectoryListing failed(const fs::path& dir, const std::string& message) {
    DirectoryListing listing;
    listing.path = dir.string();
    listing.success = false;
    listing.error = message;
    return listing;
}

// status() follows symlinks, so a link to a directory lists as a directory
// and a dangling link is dropped like any other unreadable entry.
std::optional<FileEntry> stat_entry(const fs::path& p, std::error_code& ec) {
    fs::file_status status = fs::status(p, ec);
    if (ec) {
        return std::nullopt;
    }
    if (!fs::exists(status)) {
        ec = std::make_error_code(std::errc::no_such_file_or_directory);
        return std::nullopt;
    }

    FileEntry entry;
    entry.name = p.filename().string();
    entry.path = p.string();
    if (fs::is_directory(status)) {
        entry.type = EntryType::Directory;
    } else {
        entry.type = EntryType::File;
        // file_size only answers for regular files
        if (fs::is_regular_file(status)) {
            entry.size = fs::file_size(p, ec);
            if (ec) {
                return std::nullopt;
            }
        } else {
            entry.size = 0;
        }
    }

    // file_time_type has no Unix epoch in C++17
    struct stat st {};
    if (::stat(p.c_str(), &st) != 0) {
        ec = std::error_code(errno, std::generic_category());
        return std::nullopt;
    }
    entry.modified = to_unix_seconds(st.st_mtim);
    return entry;
}

} // namespace

bool entry_name_less(const std::string& a, const std::string& b) {
    auto mismatch = std::mismatch(a.begin(), a.end(), b.begin(), b.end(),
        [](char x, char y) { return fold_ascii(x) == fold_ascii(y); });

    if (mismatch.first == a.end() && mismatch.second == b.end()) {
        return a < b;  // Same name ignoring case
    }
    if (mismatch.first == a.end()) return true;
    if (mismatch.second == b.end()) return false;
    return static_cast<unsigned char>(fold_ascii(*mismatch.first)) <
           static_cast<unsigned char>(fold_ascii(*mismatch.second));
}

DirectoryListing list_directory(const fs::path& dir, const std::string& display_path) {
    std::error_code ec;
    fs::file_status status = fs::status(dir, ec);

    if (ec && ec != std::errc::no_such_file_or_directory) {
        if (ec == std::errc::permission_denied) {
            return failed(dir, "Permission denied accessing: " + display_path);
        }
        return failed(dir, "Path does not exist: " + display_path);
    }
    if (!fs::exists(status)) {
        return failed(dir, "Path does not exist: " + display_path);
    }
    if (!fs::is_directory(status)) {
        return failed(dir, "Path is not a directory: " + display_path);
    }

    fs::directory_iterator it(dir, ec);
    if (ec) {
        ServerLog::error("Files", "Cannot open " + dir.string() + ": " + ec.message());
        if (ec == std::errc::permission_denied) {
            return failed(dir, "Permission denied accessing: " + display_path);
        }
        return failed(dir, "Failed to read directory: " + display_path);
    }

    DirectoryListing listing;
    listing.path = dir.string();

    // increment() leaves the iterator at end when it fails
    for (; it != fs::directory_iterator(); it.increment(ec)) {
        const fs::path child = it->path();
        std::error_code entry_ec;
        auto entry = stat_entry(child, entry_ec);
        if (!entry) {
            ServerLog::warn("Files", "Skipping " + child.string() + ": " + entry_ec.message());
            continue;
        }
        listing.files.push_back(std::move(*entry));
    }
    if (ec) {
        ServerLog::error("Files", "Enumeration of " + dir.string() + " stopped: " + ec.message());
        return failed(dir, "Failed to read directory: " + display_path);
    }

    std::sort(listing.files.begin(), listing.files.end(),
        [](const FileEntry& a, const FileEntry& b) { return entry_name_less(a.name, b.name); });

    listing.success = true;
    return listing;
}

} // namespace mcp_tools
