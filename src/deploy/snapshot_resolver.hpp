#pragma once

#include <string>
#include <optional>
#include <filesystem>
#include <core/types.hpp>

namespace fs = std::filesystem;

enum class SnapshotVerdict {
    RevisionMatch,      // remote revision == cached revision
    ChecksumMatch,      // no cached revision, remote revision == md5(cached remote inventory)
    LegacyInventory,    // remote manifest is a raw inventory, adopted as the cache
    Mismatch,           // descriptor present but does not match
    Missing,            // nothing fetched from the remote
    Unreadable,         // parse or I/O failure
};

struct SnapshotResolution {
    SnapshotVerdict verdict = SnapshotVerdict::Missing;
    std::string detail;

    // Whether the cached remote inventory may be diffed against.
    bool usable() const {
        return verdict == SnapshotVerdict::RevisionMatch ||
               verdict == SnapshotVerdict::ChecksumMatch ||
               verdict == SnapshotVerdict::LegacyInventory;
    }
};

const char* snapshot_verdict_name(SnapshotVerdict verdict);

// Decides whether the remote already holds the snapshot we cached after the
// last successful session. Never fails: anything unexpected is Unreadable.
class SnapshotResolver {
public:
    explicit SnapshotResolver(const fs::path& config_dir);

    SnapshotResolution resolve(const std::optional<std::string>& fetched_manifest) const;

    fs::path remote_inventory_path() const;
    fs::path revision_path() const;

    // Revision recorded by the last successful session, if any.
    std::optional<std::string> cached_revision() const;

private:
    fs::path config_dir_;

    SnapshotResolution resolve_or_throw(const std::string& fetched) const;
};

// {"revision": "<token>"}
std::string make_revision_descriptor(const std::string& revision);
