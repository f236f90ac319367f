#pragma once

#include <mutex>
#include <ostream>
#include <deploy/progress.hpp>

// Single redrawn percentage line with an operation counter.
class TerminalProgressSink : public ProgressSink {
public:
    explicit TerminalProgressSink(std::ostream& out) : out_(out) {}
    void report(const ProgressUpdate& update) override;

    // Move past the progress line so later output starts on a fresh one.
    void finish();

private:
    std::ostream& out_;
    std::mutex mutex_;
    bool drawn_ = false;
};

// "[#########...........]" for a 0-100 value.
std::string render_progress_bar(int progress, int width = 30);
