#include "diff_engine.hpp"
#include <core/log.hpp>
#include <fmt/format.h>
#include <unordered_map>
#include <unordered_set>

DiffEngine::DiffEngine(TransportKind kind)
    : caps_(capabilities_for(kind)) {
}

static Entry strip(const Entry& e) {
    return Entry{e.path, e.kind, std::nullopt};
}

DiffResult DiffEngine::diff(const Inventory& local, const Inventory& remote) const {
    DiffResult result;

    std::unordered_set<std::string> local_paths;
    local_paths.reserve(local.size());
    for (const auto& e : local) local_paths.insert(e.path);

    std::unordered_map<std::string, std::optional<std::string>> remote_md5;
    remote_md5.reserve(remote.size());
    for (const auto& e : remote) remote_md5.emplace(e.path, e.md5);

    for (const auto& r : remote) {
        if (local_paths.count(r.path)) continue;
        if (excluded(r)) continue;
        result.to_remove.push_back(strip(r));
    }

    // Directories carry no fingerprint on either side, so path presence decides
    for (const auto& l : local) {
        auto it = remote_md5.find(l.path);
        if (it != remote_md5.end() && it->second == l.md5) continue;
        if (excluded(l)) continue;
        result.to_upload.push_back(strip(l));
    }

    deploy_log(fmt::format("Diff: {} local, {} remote -> {} to remove, {} to upload",
                           local.size(), remote.size(),
                           result.to_remove.size(), result.to_upload.size()));
    return result;
}

Inventory DiffEngine::load_remote(const std::filesystem::path& path, bool usable) {
    if (!usable) {
        return {};
    }

    auto loaded = load_inventory(path);
    if (loaded.is_err()) {
        deploy_log("Diff: malformed remote inventory, treating as empty: " + loaded.error);
        return {};
    }
    return loaded.value;
}
