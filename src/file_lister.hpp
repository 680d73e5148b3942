#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace mcp_tools {

enum class EntryType {
    File,
    Directory
};

inline std::string entry_type_to_string(EntryType t) {
    return t == EntryType::Directory ? "directory" : "file";
}

struct FileEntry {
    std::string name;
    std::string path;
    EntryType type = EntryType::File;
    std::optional<std::uintmax_t> size;      // Absent for directories
    double modified = 0.0;                   // Unix timestamp, seconds

    nlohmann::json to_json() const {
        nlohmann::json j;
        j["name"] = name;
        j["path"] = path;
        j["type"] = entry_type_to_string(type);
        j["size"] = size ? nlohmann::json(*size) : nlohmann::json(nullptr);
        j["modified"] = modified;
        return j;
    }
};

struct DirectoryListing {
    std::string path;
    std::vector<FileEntry> files;
    bool success = false;
    std::string error;

    nlohmann::json to_json() const {
        nlohmann::json entries = nlohmann::json::array();
        for (const auto& f : files) {
            entries.push_back(f.to_json());
        }

        nlohmann::json j;
        j["path"] = path;
        j["total_items"] = files.size();
        j["files"] = entries;
        j["success"] = success;
        j["error"] = success ? nlohmann::json(nullptr) : nlohmann::json(error);
        return j;
    }
};

// List the direct children of a directory. `display_path` is what the
// caller asked for and is the only path text used in error messages.
DirectoryListing list_directory(const std::filesystem::path& dir, const std::string& display_path);

// Case-insensitive ASCII ordering with a case-sensitive tie break
bool entry_name_less(const std::string& a, const std::string& b);

} // namespace mcp_tools
