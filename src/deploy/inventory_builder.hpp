#pragma once

#include <string>
#include <cstdint>
#include <filesystem>
#include <core/types.hpp>
#include <core/constants.hpp>
#include <transport/capabilities.hpp>
#include "entry.hpp"

namespace fs = std::filesystem;

// Byte string hashed for a binary file of the given size.
std::string size_digit_bytes(std::uintmax_t size);

// Walks the local output tree and fingerprints every file.
//
// Rules:
//   - .git directories are skipped at any depth
//   - hidden files are skipped, except .htaccess
//   - root-level .htaccess and _redirects are only inventoried when the
//     transport can represent them
//   - directory entries are only emitted for transports with explicit
//     directories
//   - the inventory file itself is never inventoried
//
// Entries come out depth-first, parent before children, siblings by name.
class InventoryBuilder {
public:
    InventoryBuilder(const fs::path& input_dir, TransportKind kind);

    // Walk and fingerprint without touching the disk.
    Result<Inventory> build() const;

    // build() then write the result to inventory_path(). Nothing is written
    // when the walk fails.
    Result<Inventory> build_and_save() const;

    fs::path inventory_path() const { return input_dir_ / INVENTORY_FILENAME; }

    // Content MD5 for text files. Binary files hash the decimal string of
    // their byte size instead; previously published snapshots depend on it.
    static Result<std::string> fingerprint(const fs::path& file);

private:
    fs::path input_dir_;
    TransportKind kind_;
    TransportCapabilities caps_;

    void walk(const fs::path& dir, const std::string& rel_prefix, Inventory& out) const;
    bool include_file(const std::string& name, bool at_root) const;
};
