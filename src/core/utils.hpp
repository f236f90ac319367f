#pragma once

#include <string>
#include <filesystem>
#include "types.hpp"

// Trim leading and trailing whitespace in-place.
inline void trim(std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) { s.clear(); return; }
    s.erase(0, start);
    s.erase(s.find_last_not_of(" \t\r\n") + 1);
}

// Expand a leading "~/" to the user's home directory.
std::filesystem::path expand_home(const std::string& path);

// Read a whole file as raw bytes.
Result<std::string> read_file(const std::filesystem::path& path);

// Write to a temporary sibling, then rename over the destination, so readers
// never observe a half-written file.
Result<void> write_file_atomic(const std::filesystem::path& path, const std::string& content);

// Lowercase hex MD5 of a byte string.
std::string md5_hex(const std::string& data);

// Lowercase hex MD5 of a file's content, streamed.
Result<std::string> compute_file_md5(const std::filesystem::path& path);

// Random RFC 4122 version 4 UUID, used as a session revision token.
std::string generate_revision_id();

// Forward slashes, no duplicate separators, no "./" segments, no trailing slash
// (a lone "/" is kept).
std::string normalize_path(const std::string& path);

// normalize_path(base + "/" + rel). An empty base yields the relative path.
std::string join_remote_path(const std::string& base, const std::string& rel);
