#pragma once

#include <vector>
#include <filesystem>
#include <core/types.hpp>
#include <transport/capabilities.hpp>
#include "entry.hpp"

struct DiffResult {
    std::vector<Entry> to_remove;   // path + kind only
    std::vector<Entry> to_upload;   // path + kind only

    bool empty() const { return to_remove.empty() && to_upload.empty(); }
};

// Path + fingerprint equi-join of the local inventory against the remote one.
// A rename is one removal plus one upload.
class DiffEngine {
public:
    explicit DiffEngine(TransportKind kind);

    DiffResult diff(const Inventory& local, const Inventory& remote) const;

    // The cached remote inventory, or an empty one when the snapshot is not
    // usable, missing or malformed.
    static Inventory load_remote(const std::filesystem::path& path, bool usable);

private:
    TransportCapabilities caps_;

    bool excluded(const Entry& e) const {
        return e.is_directory() && !caps_.explicit_directories;
    }
};
