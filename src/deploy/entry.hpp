#pragma once

#include <string>
#include <vector>
#include <optional>
#include <filesystem>
#include <core/types.hpp>

enum class EntryKind {
    File,
    Directory,
};

// One file or directory record. Directories never carry a fingerprint,
// files always do.
struct Entry {
    std::string path;                       // relative, forward slashes
    EntryKind kind = EntryKind::File;
    std::optional<std::string> md5;

    bool is_file() const { return kind == EntryKind::File; }
    bool is_directory() const { return kind == EntryKind::Directory; }

    static Entry file(std::string path, std::string md5) {
        return Entry{std::move(path), EntryKind::File, std::move(md5)};
    }
    static Entry directory(std::string path) {
        return Entry{std::move(path), EntryKind::Directory, std::nullopt};
    }
};

bool operator==(const Entry& a, const Entry& b);

using Inventory = std::vector<Entry>;

const char* entry_kind_name(EntryKind kind);

// JSON array of {path, type: "file"|"directory", md5: hex|false}.
// Leading "/" on legacy paths is stripped.
Result<Inventory> parse_inventory(const std::string& json_text);
std::string serialize_inventory(const Inventory& inventory);

Result<Inventory> load_inventory(const std::filesystem::path& path);
Result<void> save_inventory(const std::filesystem::path& path, const Inventory& inventory);

// JSON array of {path, type} (the audit log shape).
std::string serialize_entry_list(const std::vector<Entry>& entries);
