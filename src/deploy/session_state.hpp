#pragma once

#include <string>
#include <vector>
#include <filesystem>
#include <core/types.hpp>
#include <core/constants.hpp>
#include <core/utils.hpp>
#include "entry.hpp"

namespace fs = std::filesystem;

enum class PumpState {
    Idle,
    Removing,
    Uploading,
    Finalizing,
    Done,
    Failed,
};

const char* pump_state_name(PumpState state);

struct SessionPaths {
    fs::path input_dir;         // local build output
    fs::path config_dir;        // cached remote inventory + revision
    fs::path app_dir;           // audit logs
    std::string output_dir;     // remote directory ("" = remote root)
};

// Everything scoped to one deployment run. Mutated only by the session
// coordinator and the transfer pump, never concurrently.
struct SessionState {
    SessionPaths paths;
    TransportKind transport = TransportKind::Local;
    std::string revision;

    std::vector<Entry> removals;    // LIFO, back() next
    std::vector<Entry> uploads;     // LIFO, back() next

    int operation_count = 0;        // includes the final publish
    int completed_operations = 0;
    int progress = 0;

    PumpState state = PumpState::Idle;
    std::string error;

    fs::path inventory_path() const { return paths.input_dir / INVENTORY_FILENAME; }
    fs::path local_path(const std::string& rel) const { return paths.input_dir / rel; }
    std::string remote_path(const std::string& rel) const {
        return join_remote_path(paths.output_dir, rel);
    }
    std::string remote_manifest_path() const { return remote_path(INVENTORY_FILENAME); }
};
