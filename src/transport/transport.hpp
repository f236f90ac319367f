#pragma once

#include <string>
#include <optional>
#include <functional>
#include <filesystem>
#include <core/types.hpp>
#include <deploy/session_state.hpp>
#include "capabilities.hpp"

namespace fs = std::filesystem;

// Reported exactly once per operation, from any thread.
using CompletionCallback = std::function<void(Result<void>)>;

// Reported by delegated transports after each counted operation.
using OperationTick = std::function<void()>;

// A deployment backend. One concrete class per protocol, selected once per
// session. Mutating operations report completion asynchronously; the pump
// never issues the next one before the previous completed.
class Transport {
public:
    virtual ~Transport() = default;

    virtual TransportKind kind() const = 0;

    // Connect, check credentials and the output directory, disconnect.
    virtual Result<void> test_connection(StatusCallback callback = nullptr) = 0;

    // Open the connection used by the rest of the session.
    virtual Result<void> init_connection(StatusCallback callback = nullptr) = 0;

    // Raw bytes of the remote manifest, nullopt when there is none.
    virtual Result<std::optional<std::string>> fetch_manifest(const std::string& remote_path) = 0;

    virtual void remove_file(const std::string& remote_path, CompletionCallback done) = 0;
    virtual void remove_directory(const std::string& remote_path, CompletionCallback done) = 0;
    virtual void upload_file(const fs::path& local_path, const std::string& remote_path,
                             CompletionCallback done) = 0;
    virtual void upload_directory(const fs::path& local_path, const std::string& remote_path,
                                  CompletionCallback done) = 0;

    // Publish the new manifest (the revision descriptor by the time this runs).
    virtual void upload_new_file_list(const fs::path& local_manifest, const std::string& remote_path,
                                      CompletionCallback done) = 0;

    // Delegated mode: consume session.removals and session.uploads end-to-end
    // and report one aggregate completion. Only called when the protocol's
    // capabilities say self_managed_sync.
    virtual void start_sync(SessionState& session, OperationTick tick, CompletionCallback done) {
        (void)session;
        (void)tick;
        done(Result<void>::Err(std::string(transport_kind_name(kind())) + " does not manage its own sync"));
    }

    // True when remote paths are relative to the transport's own root
    // rather than the configured output directory.
    virtual bool addresses_from_root() const { return false; }

    virtual void close() {}
};
