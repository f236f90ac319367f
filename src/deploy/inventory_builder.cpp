#include "inventory_builder.hpp"
#include "binary_detect.hpp"
#include <core/constants.hpp>
#include <core/utils.hpp>
#include <core/log.hpp>
#include <fmt/format.h>
#include <algorithm>
#include <stdexcept>

// One byte per decimal digit holding the digit value (12345 -> 01 02 03 04 05),
// not its ASCII character.
std::string size_digit_bytes(std::uintmax_t size) {
    std::string digits = std::to_string(size);
    for (auto& c : digits) {
        c = static_cast<char>(c - '0');
    }
    return digits;
}

InventoryBuilder::InventoryBuilder(const fs::path& input_dir, TransportKind kind)
    : input_dir_(input_dir), kind_(kind), caps_(capabilities_for(kind)) {
}

Result<std::string> InventoryBuilder::fingerprint(const fs::path& file) {
    auto binary = is_binary_file(file);
    if (binary.is_err()) {
        return Result<std::string>::Err(binary.error);
    }

    if (!binary.value) {
        return compute_file_md5(file);
    }

    std::error_code ec;
    auto size = fs::file_size(file, ec);
    if (ec) {
        return Result<std::string>::Err(fmt::format("Cannot stat {}: {}", file.string(), ec.message()));
    }
    return Result<std::string>::Ok(md5_hex(size_digit_bytes(size)));
}

bool InventoryBuilder::include_file(const std::string& name, bool at_root) const {
    bool special = name == HTACCESS_FILENAME || name == REDIRECTS_FILENAME;

    if (at_root && special) {
        return caps_.root_dotfiles;
    }
    if (at_root && (name == INVENTORY_FILENAME || name == std::string(INVENTORY_FILENAME) + ".tmp")) {
        return false;
    }
    if (!name.empty() && name[0] == '.') {
        return name == HTACCESS_FILENAME;
    }
    return true;
}

void InventoryBuilder::walk(const fs::path& dir, const std::string& rel_prefix, Inventory& out) const {
    std::vector<fs::directory_entry> children;
    for (const auto& entry : fs::directory_iterator(dir)) {
        children.push_back(entry);
    }
    std::sort(children.begin(), children.end(),
              [](const fs::directory_entry& a, const fs::directory_entry& b) {
                  return a.path().filename().string() < b.path().filename().string();
              });

    const bool at_root = rel_prefix.empty();

    for (const auto& child : children) {
        std::string name = child.path().filename().string();
        if (name == VCS_DIRNAME) continue;

        std::string rel = at_root ? name : rel_prefix + "/" + name;

        // Follows symlinks, like a stat() walk
        if (fs::is_directory(child.path())) {
            if (caps_.explicit_directories) {
                out.push_back(Entry::directory(rel));
            }
            walk(child.path(), rel, out);
            continue;
        }

        if (!include_file(name, at_root)) continue;

        Result<std::string> md5 = Result<std::string>::Err("");
        if (at_root && (name == HTACCESS_FILENAME || name == REDIRECTS_FILENAME)) {
            md5 = compute_file_md5(child.path());
        } else {
            md5 = fingerprint(child.path());
        }
        if (md5.is_err()) {
            throw std::runtime_error(md5.error);
        }

        out.push_back(Entry::file(rel, md5.value));
    }
}

Result<Inventory> InventoryBuilder::build() const {
    if (!fs::is_directory(input_dir_)) {
        return Result<Inventory>::Err("Input directory does not exist: " + input_dir_.string());
    }

    Inventory inventory;
    try {
        walk(input_dir_, "", inventory);
    } catch (const std::exception& e) {
        deploy_log(fmt::format("Inventory: walk of {} failed: {}", input_dir_.string(), e.what()));
        return Result<Inventory>::Err(fmt::format("Cannot read {}: {}", input_dir_.string(), e.what()));
    }

    deploy_log(fmt::format("Inventory: {} entries under {} (protocol {})",
                           inventory.size(), input_dir_.string(), transport_kind_name(kind_)));
    return Result<Inventory>::Ok(std::move(inventory));
}

Result<Inventory> InventoryBuilder::build_and_save() const {
    auto inventory = build();
    if (inventory.is_err()) {
        return inventory;
    }

    auto saved = save_inventory(inventory_path(), inventory.value);
    if (saved.is_err()) {
        return Result<Inventory>::Err(saved.error);
    }
    return inventory;
}
