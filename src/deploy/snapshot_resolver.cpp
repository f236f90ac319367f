#include "snapshot_resolver.hpp"
#include <core/constants.hpp>
#include <core/utils.hpp>
#include <core/log.hpp>
#include <nlohmann/json.hpp>
#include <fmt/format.h>
#include <stdexcept>

using json = nlohmann::json;

const char* snapshot_verdict_name(SnapshotVerdict verdict) {
    switch (verdict) {
        case SnapshotVerdict::RevisionMatch:   return "revision-match";
        case SnapshotVerdict::ChecksumMatch:   return "checksum-match";
        case SnapshotVerdict::LegacyInventory: return "legacy-inventory";
        case SnapshotVerdict::Mismatch:        return "mismatch";
        case SnapshotVerdict::Missing:         return "missing";
        case SnapshotVerdict::Unreadable:      return "unreadable";
    }
    return "unknown";
}

std::string make_revision_descriptor(const std::string& revision) {
    json d;
    d["revision"] = revision;
    return d.dump();
}

SnapshotResolver::SnapshotResolver(const fs::path& config_dir)
    : config_dir_(config_dir) {
}

fs::path SnapshotResolver::remote_inventory_path() const {
    return config_dir_ / REMOTE_INVENTORY_FILENAME;
}

fs::path SnapshotResolver::revision_path() const {
    return config_dir_ / SYNC_REVISION_FILENAME;
}

std::optional<std::string> SnapshotResolver::cached_revision() const {
    if (!fs::exists(revision_path())) {
        return std::nullopt;
    }

    auto content = read_file(revision_path());
    if (content.is_err()) {
        throw std::runtime_error(content.error);
    }

    json d = json::parse(content.value);
    if (!d.is_object() || !d.contains("revision") || !d["revision"].is_string()) {
        return std::nullopt;
    }
    auto rev = d["revision"].get<std::string>();
    if (rev.empty()) return std::nullopt;
    return rev;
}

SnapshotResolution SnapshotResolver::resolve_or_throw(const std::string& fetched) const {
    json manifest = json::parse(fetched);

    if (manifest.is_object() && manifest.contains("revision") &&
        manifest["revision"].is_string() && !manifest["revision"].get<std::string>().empty()) {
        std::string remote_rev = manifest["revision"].get<std::string>();

        // The cached inventory must exist for either comparison to mean anything
        auto cached_inventory = read_file(remote_inventory_path());
        if (cached_inventory.is_err()) {
            throw std::runtime_error(cached_inventory.error);
        }

        auto local_rev = cached_revision();
        if (local_rev) {
            if (*local_rev == remote_rev) {
                return {SnapshotVerdict::RevisionMatch, remote_rev};
            }
            return {SnapshotVerdict::Mismatch,
                    fmt::format("remote {} != cached {}", remote_rev, *local_rev)};
        }

        std::string checksum = md5_hex(cached_inventory.value);
        if (checksum == remote_rev) {
            return {SnapshotVerdict::ChecksumMatch, remote_rev};
        }
        return {SnapshotVerdict::Mismatch,
                fmt::format("remote {} != checksum {}", remote_rev, checksum)};
    }

    if (manifest.is_array()) {
        // Remote predates revision tokens: its manifest is the inventory itself
        fs::create_directories(config_dir_);
        auto written = write_file_atomic(remote_inventory_path(), fetched);
        if (written.is_err()) {
            throw std::runtime_error(written.error);
        }
        return {SnapshotVerdict::LegacyInventory, fmt::format("{} entries", manifest.size())};
    }

    return {SnapshotVerdict::Unreadable, "manifest is neither a descriptor nor an inventory"};
}

SnapshotResolution SnapshotResolver::resolve(const std::optional<std::string>& fetched_manifest) const {
    SnapshotResolution result;

    if (!fetched_manifest) {
        result = {SnapshotVerdict::Missing, "no remote manifest"};
    } else {
        try {
            result = resolve_or_throw(*fetched_manifest);
        } catch (const std::exception& e) {
            result = {SnapshotVerdict::Unreadable, e.what()};
        }
    }

    deploy_log(fmt::format("Snapshot: {} ({}), usable={}",
                           snapshot_verdict_name(result.verdict), result.detail, result.usable()));
    return result;
}
