#pragma once

#include <atomic>
#include <memory>
#include <string>
#include <optional>
#include <core/types.hpp>
#include <transport/transport.hpp>
#include "session_state.hpp"
#include "session_lock.hpp"
#include "scheduler.hpp"
#include "progress.hpp"
#include "event_loop.hpp"
#include "transfer_pump.hpp"
#include "snapshot_resolver.hpp"

// Owns one deployment run: builds the inventory, resolves the remote
// snapshot, diffs, schedules and drives the pump to completion.
class DeploySession {
public:
    DeploySession(const SessionPaths& paths, std::unique_ptr<Transport> transport,
                  ProgressSink& progress);
    ~DeploySession();

    // Address remote paths from the transport's root instead of the
    // configured output directory.
    void set_output(bool use_empty);

    // Full lifecycle. Returns once the pump is Done or Failed.
    Result<void> run(StatusCallback callback = nullptr);

    // Everything up to scheduling, no mutating transport call and no
    // finalization. The local inventory file is still written.
    Result<Schedule> plan(StatusCallback callback = nullptr);

    // Honoured between queue items. Safe from any thread.
    void request_cancel();

    const SessionState& state() const { return state_; }
    const SnapshotResolution& snapshot() const { return snapshot_; }
    Transport& transport() { return *transport_; }

    // Relocate the just-used inventory to the cached remote inventory and
    // stamp the session revision over both the inventory and revision files.
    Result<void> replace_sync_info_files();

private:
    SessionState state_;
    std::string configured_output_;
    // Declared before transport_ so it outlives the transport's worker threads
    EventLoop loop_;
    std::unique_ptr<Transport> transport_;
    ProgressSink& progress_;
    SessionLock lock_;
    std::unique_ptr<TransferPump> pump_;
    std::atomic<bool> cancel_requested_{false};
    SnapshotResolution snapshot_;

    Result<Schedule> prepare(StatusCallback callback);
    std::optional<std::string> fetch_remote_manifest();
    void report(int progress);
};
