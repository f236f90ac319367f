#pragma once

#include <set>
#include <mutex>
#include <string>
#include <thread>
#include <vector>
#include <functional>
#include <transport/transport.hpp>
#include <deploy/progress.hpp>

// Records every call as "<operation> <remote path>". Completions run inline
// unless complete_async is set, in which case they arrive from a worker
// thread like a network transport's would.
class FakeTransport : public Transport {
public:
    explicit FakeTransport(TransportKind kind = TransportKind::Sftp) : kind_(kind) {}

    ~FakeTransport() override {
        for (auto& t : workers_) {
            if (t.joinable()) t.join();
        }
    }

    TransportKind kind() const override { return kind_; }

    Result<void> test_connection(StatusCallback) override { return Result<void>::Ok(); }

    Result<void> init_connection(StatusCallback) override {
        record("init_connection");
        return init_result;
    }

    Result<std::optional<std::string>> fetch_manifest(const std::string& remote_path) override {
        record("fetch_manifest " + remote_path);
        return Result<std::optional<std::string>>::Ok(manifest);
    }

    void remove_file(const std::string& remote_path, CompletionCallback done) override {
        complete("remove_file " + remote_path, std::move(done));
    }

    void remove_directory(const std::string& remote_path, CompletionCallback done) override {
        complete("remove_directory " + remote_path, std::move(done));
    }

    void upload_file(const fs::path&, const std::string& remote_path, CompletionCallback done) override {
        complete("upload_file " + remote_path, std::move(done));
    }

    void upload_directory(const fs::path&, const std::string& remote_path, CompletionCallback done) override {
        complete("upload_directory " + remote_path, std::move(done));
    }

    void upload_new_file_list(const fs::path&, const std::string& remote_path,
                              CompletionCallback done) override {
        complete("upload_new_file_list " + remote_path, std::move(done));
    }

    void start_sync(SessionState& session, OperationTick tick, CompletionCallback done) override {
        if (!manages_sync) {
            Transport::start_sync(session, std::move(tick), std::move(done));
            return;
        }
        record("start_sync");
        synced_removals = session.removals.size();
        synced_uploads = session.uploads.size();
        for (size_t i = 0; i < synced_removals + synced_uploads; i++) tick();
        done(sync_result);
    }

    void close() override { record("close"); }

    std::vector<std::string> calls() {
        std::lock_guard<std::mutex> lock(mutex_);
        return calls_;
    }

    // Only the mutating operations, in issue order.
    std::vector<std::string> operations() {
        std::vector<std::string> out;
        for (const auto& c : calls()) {
            if (c.rfind("init_connection", 0) == 0 || c.rfind("fetch_manifest", 0) == 0 ||
                c == "close") {
                continue;
            }
            out.push_back(c);
        }
        return out;
    }

    std::set<std::string> fail_on;                 // calls that complete with an error
    std::function<void(const std::string&)> on_call;
    bool complete_async = false;
    bool manages_sync = false;
    Result<void> sync_result = Result<void>::Ok();
    Result<void> init_result = Result<void>::Ok();
    std::optional<std::string> manifest;
    size_t synced_removals = 0;
    size_t synced_uploads = 0;

private:
    TransportKind kind_;
    std::mutex mutex_;
    std::vector<std::string> calls_;
    std::vector<std::thread> workers_;

    void record(const std::string& call) {
        std::lock_guard<std::mutex> lock(mutex_);
        calls_.push_back(call);
    }

    void complete(const std::string& call, CompletionCallback done) {
        record(call);
        if (on_call) on_call(call);

        Result<void> result = fail_on.count(call)
            ? Result<void>::Err("injected failure")
            : Result<void>::Ok();

        if (complete_async) {
            std::lock_guard<std::mutex> lock(mutex_);
            workers_.emplace_back([done = std::move(done), result]() { done(result); });
            return;
        }
        done(result);
    }
};

class RecordingSink : public ProgressSink {
public:
    void report(const ProgressUpdate& update) override {
        std::lock_guard<std::mutex> lock(mutex_);
        updates_.push_back(update);
    }

    std::vector<ProgressUpdate> updates() {
        std::lock_guard<std::mutex> lock(mutex_);
        return updates_;
    }

private:
    std::mutex mutex_;
    std::vector<ProgressUpdate> updates_;
};
