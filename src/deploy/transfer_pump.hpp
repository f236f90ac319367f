#pragma once

#include <atomic>
#include <string>
#include <functional>
#include <core/types.hpp>
#include <transport/transport.hpp>
#include <transport/capabilities.hpp>
#include "session_state.hpp"
#include "progress.hpp"

// Drains session.removals then session.uploads through the transport, one
// operation in flight at a time, then publishes the new snapshot.
//
// States: Idle -> Removing -> Uploading -> Finalizing -> Done
//                    \___________\_____________\______-> Failed
//
// Every transport completion is posted back through the dispatcher, so the
// next step always starts from the session thread.
class TransferPump {
public:
    using Dispatcher = std::function<void(std::function<void()>)>;
    using PublishHook = std::function<Result<void>()>;
    using FinishedCallback = std::function<void(const SessionState&)>;

    TransferPump(SessionState& session, Transport& transport,
                 ProgressSink& progress, Dispatcher post);

    // Runs right before the manifest upload (relocates the sync info files).
    void set_publish_hook(PublishHook hook) { publish_hook_ = std::move(hook); }

    // Fills operation_count and starts draining. on_finished fires once, in
    // Done or Failed.
    void start(FinishedCallback on_finished);

    // Honoured between queue items.
    void request_cancel() { cancel_requested_.store(true); }

    // External cancellation flag, checked alongside request_cancel().
    void set_cancel_token(const std::atomic<bool>* token) { cancel_token_ = token; }

    // Counted entries in both stacks plus the final publish.
    static int count_operations(const SessionState& session, const TransportCapabilities& caps);

    // 8 + floor(completed * 90 / total), capped at 98.
    static int drain_progress(int completed, int total);

private:
    SessionState& session_;
    Transport& transport_;
    ProgressSink& progress_;
    Dispatcher post_;
    TransportCapabilities caps_;
    PublishHook publish_hook_;
    FinishedCallback on_finished_;
    std::atomic<bool> cancel_requested_{false};
    const std::atomic<bool>* cancel_token_ = nullptr;

    bool canceled() const {
        return cancel_requested_.load() || (cancel_token_ && cancel_token_->load());
    }

    void step();
    void remove_next();
    void upload_next();
    void delegate();
    void finalize();

    // Wraps a transport completion so it re-enters through the dispatcher.
    CompletionCallback continuation(std::string label, bool counted);
    void on_operation_done(const std::string& label, bool counted, const Result<void>& result);
    void on_published(const Result<void>& result);

    void advance();
    void report(bool with_operations);
    void enter(PumpState next);
    void fail(const std::string& error);
    void finish();
};
