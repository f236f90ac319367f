#pragma once

#include <string>
#include <utility>
#include <optional>
#include <ostream>
#include <mutex>

// {progress: 0-100, operations: [completed, total] | false}
struct ProgressUpdate {
    int progress = 0;
    std::optional<std::pair<int, int>> operations;
};

bool operator==(const ProgressUpdate& a, const ProgressUpdate& b);

// One-way channel to whoever displays progress.
class ProgressSink {
public:
    virtual ~ProgressSink() = default;
    virtual void report(const ProgressUpdate& update) = 0;
};

class NullProgressSink : public ProgressSink {
public:
    void report(const ProgressUpdate&) override {}
};

// One JSON object per line, for a host process reading our stdout.
class JsonProgressSink : public ProgressSink {
public:
    explicit JsonProgressSink(std::ostream& out) : out_(out) {}
    void report(const ProgressUpdate& update) override;

private:
    std::ostream& out_;
    std::mutex mutex_;
};

std::string progress_to_json(const ProgressUpdate& update);
