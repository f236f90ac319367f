#include "transfer_pump.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <fmt/format.h>
#include <algorithm>
#include <cmath>

const char* pump_state_name(PumpState state) {
    switch (state) {
        case PumpState::Idle:       return "idle";
        case PumpState::Removing:   return "removing";
        case PumpState::Uploading:  return "uploading";
        case PumpState::Finalizing: return "finalizing";
        case PumpState::Done:       return "done";
        case PumpState::Failed:     return "failed";
    }
    return "unknown";
}

TransferPump::TransferPump(SessionState& session, Transport& transport,
                           ProgressSink& progress, Dispatcher post)
    : session_(session), transport_(transport), progress_(progress),
      post_(std::move(post)), caps_(capabilities_for(session.transport)) {
}

int TransferPump::count_operations(const SessionState& session, const TransportCapabilities& caps) {
    auto counted = [&](const std::vector<Entry>& stack) {
        return static_cast<int>(std::count_if(stack.begin(), stack.end(), [&](const Entry& e) {
            return e.is_file() || caps.counts_directory_ops;
        }));
    };
    return counted(session.removals) + counted(session.uploads) + 1;
}

int TransferPump::drain_progress(int completed, int total) {
    if (total <= 0) return PROGRESS_DIFF_DONE;
    double per_op = PROGRESS_DRAIN_SPAN / total;
    int p = PROGRESS_DIFF_DONE + static_cast<int>(std::floor(completed * per_op));
    return std::clamp(p, PROGRESS_DIFF_DONE, PROGRESS_PUBLISHING);
}

void TransferPump::start(FinishedCallback on_finished) {
    on_finished_ = std::move(on_finished);
    session_.operation_count = count_operations(session_, caps_);
    session_.completed_operations = 0;
    session_.progress = PROGRESS_DIFF_DONE;
    enter(PumpState::Removing);

    deploy_log(fmt::format("Pump: {} operations ({} removals, {} uploads), mode={}",
                           session_.operation_count, session_.removals.size(),
                           session_.uploads.size(),
                           caps_.self_managed_sync ? "delegated" : "per-item"));
    report(false);

    if (caps_.self_managed_sync) {
        delegate();
    } else {
        step();
    }
}

void TransferPump::step() {
    if (canceled()) {
        fail("canceled");
        return;
    }

    switch (session_.state) {
        case PumpState::Removing:
            if (!session_.removals.empty()) {
                remove_next();
                return;
            }
            enter(PumpState::Uploading);
            report(true);
            step();
            return;
        case PumpState::Uploading:
            if (!session_.uploads.empty()) {
                upload_next();
                return;
            }
            finalize();
            return;
        default:
            return;
    }
}

void TransferPump::remove_next() {
    Entry entry = session_.removals.back();
    session_.removals.pop_back();

    std::string remote = session_.remote_path(entry.path);
    bool counted = entry.is_file() || caps_.counts_directory_ops;

    if (entry.is_file()) {
        transport_.remove_file(remote, continuation("remove_file " + remote, counted));
    } else {
        transport_.remove_directory(remote, continuation("remove_directory " + remote, counted));
    }
}

void TransferPump::upload_next() {
    Entry entry = session_.uploads.back();
    session_.uploads.pop_back();

    fs::path local = session_.local_path(entry.path);
    std::string remote = session_.remote_path(entry.path);
    bool counted = entry.is_file() || caps_.counts_directory_ops;

    if (entry.is_file()) {
        transport_.upload_file(local, remote, continuation("upload_file " + remote, counted));
    } else {
        transport_.upload_directory(local, remote, continuation("upload_directory " + remote, counted));
    }
}

void TransferPump::delegate() {
    deploy_log("Pump: delegating sync to " + std::string(transport_kind_name(session_.transport)));

    transport_.start_sync(
        session_,
        [this]() { post_([this]() { advance(); }); },
        [this](Result<void> result) {
            post_([this, result]() {
                if (result.is_err()) {
                    fail("start_sync: " + result.error);
                    return;
                }
                session_.removals.clear();
                session_.uploads.clear();
                if (canceled()) {
                    fail("canceled");
                    return;
                }
                finalize();
            });
        });
}

CompletionCallback TransferPump::continuation(std::string label, bool counted) {
    return [this, label = std::move(label), counted](Result<void> result) {
        post_([this, label, counted, result]() {
            on_operation_done(label, counted, result);
        });
    };
}

void TransferPump::on_operation_done(const std::string& label, bool counted, const Result<void>& result) {
    if (result.is_err()) {
        fail(label + ": " + result.error);
        return;
    }

    deploy_log("Pump: ok " + label);
    if (counted) advance();
    step();
}

void TransferPump::advance() {
    if (session_.state == PumpState::Done || session_.state == PumpState::Failed) return;

    // The publish operation is never counted here
    if (session_.completed_operations < session_.operation_count - 1) {
        session_.completed_operations++;
    }
    int p = drain_progress(session_.completed_operations, session_.operation_count);
    session_.progress = std::max(session_.progress, p);
    report(true);
}

void TransferPump::finalize() {
    enter(PumpState::Finalizing);
    session_.progress = PROGRESS_PUBLISHING;
    report(true);

    if (publish_hook_) {
        auto hooked = publish_hook_();
        if (hooked.is_err()) {
            fail("replace sync info: " + hooked.error);
            return;
        }
    }

    std::string remote = session_.remote_manifest_path();
    transport_.upload_new_file_list(session_.inventory_path(), remote,
        [this](Result<void> result) {
            post_([this, result]() { on_published(result); });
        });
}

void TransferPump::on_published(const Result<void>& result) {
    if (result.is_err()) {
        fail("upload_new_file_list " + session_.remote_manifest_path() + ": " + result.error);
        return;
    }

    session_.completed_operations = session_.operation_count;
    session_.progress = PROGRESS_DONE;
    enter(PumpState::Done);
    report(true);
    deploy_log(fmt::format("Pump: done, revision {} published", session_.revision));
    finish();
}

void TransferPump::report(bool with_operations) {
    ProgressUpdate update;
    update.progress = session_.progress;
    if (with_operations) {
        update.operations = std::make_pair(session_.completed_operations, session_.operation_count);
    }
    progress_.report(update);
}

void TransferPump::fail(const std::string& error) {
    deploy_log(fmt::format("Pump: failed while {}: {}", pump_state_name(session_.state), error));
    session_.state = PumpState::Failed;
    session_.error = error;
    finish();
}

void TransferPump::enter(PumpState next) {
    deploy_log(fmt::format("Pump: {} -> {}", pump_state_name(session_.state), pump_state_name(next)));
    session_.state = next;
}

void TransferPump::finish() {
    if (on_finished_) {
        auto cb = std::move(on_finished_);
        on_finished_ = nullptr;
        cb(session_);
    }
}
