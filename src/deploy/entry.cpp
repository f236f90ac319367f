#include "entry.hpp"
#include <core/utils.hpp>
#include <nlohmann/json.hpp>
#include <fmt/format.h>

using json = nlohmann::json;

bool operator==(const Entry& a, const Entry& b) {
    return a.path == b.path && a.kind == b.kind && a.md5 == b.md5;
}

const char* entry_kind_name(EntryKind kind) {
    return kind == EntryKind::Directory ? "directory" : "file";
}

static std::string clean_entry_path(const std::string& raw) {
    std::string p = normalize_path(raw);
    while (!p.empty() && p[0] == '/') p.erase(0, 1);
    return p;
}

Result<Inventory> parse_inventory(const std::string& json_text) {
    try {
        json root = json::parse(json_text);
        if (!root.is_array()) {
            return Result<Inventory>::Err("inventory is not a JSON array");
        }

        Inventory out;
        out.reserve(root.size());
        for (const auto& item : root) {
            if (!item.is_object() || !item.contains("path") || !item["path"].is_string()) {
                return Result<Inventory>::Err("inventory entry without a string path");
            }

            Entry e;
            e.path = clean_entry_path(item["path"].get<std::string>());
            std::string type = item.value("type", std::string("file"));
            if (type == "directory") {
                e.kind = EntryKind::Directory;
            } else if (type == "file") {
                e.kind = EntryKind::File;
            } else {
                return Result<Inventory>::Err(fmt::format("unknown entry type '{}' for {}", type, e.path));
            }

            if (item.contains("md5") && item["md5"].is_string()) {
                e.md5 = item["md5"].get<std::string>();
            }
            out.push_back(std::move(e));
        }
        return Result<Inventory>::Ok(std::move(out));
    } catch (const json::exception& e) {
        return Result<Inventory>::Err(std::string("malformed inventory: ") + e.what());
    }
}

std::string serialize_inventory(const Inventory& inventory) {
    json root = json::array();
    for (const auto& e : inventory) {
        json item;
        item["path"] = e.path;
        item["type"] = entry_kind_name(e.kind);
        if (e.md5) {
            item["md5"] = *e.md5;
        } else {
            item["md5"] = false;
        }
        root.push_back(std::move(item));
    }
    return root.dump(4);
}

Result<Inventory> load_inventory(const std::filesystem::path& path) {
    auto content = read_file(path);
    if (content.is_err()) {
        return Result<Inventory>::Err(content.error);
    }
    auto parsed = parse_inventory(content.value);
    if (parsed.is_err()) {
        return Result<Inventory>::Err(path.string() + ": " + parsed.error);
    }
    return parsed;
}

Result<void> save_inventory(const std::filesystem::path& path, const Inventory& inventory) {
    return write_file_atomic(path, serialize_inventory(inventory));
}

std::string serialize_entry_list(const std::vector<Entry>& entries) {
    json root = json::array();
    for (const auto& e : entries) {
        root.push_back({{"path", e.path}, {"type", entry_kind_name(e.kind)}});
    }
    return root.dump();
}
