#include "progress_view.hpp"
#include "theme.hpp"
#include <algorithm>
#include <fmt/format.h>

std::string render_progress_bar(int progress, int width) {
    int clamped = std::max(0, std::min(100, progress));
    int filled = clamped * width / 100;
    return "[" + std::string(filled, '#') + std::string(width - filled, '.') + "]";
}

void TerminalProgressSink::report(const ProgressUpdate& update) {
    std::lock_guard<std::mutex> lock(mutex_);

    std::string line = fmt::format("    {} {:>3}%", render_progress_bar(update.progress), update.progress);
    if (update.operations) {
        line += theme::dim(fmt::format("  {}/{} operations",
                                       update.operations->first, update.operations->second));
    }
    out_ << "\r\033[K" << line << std::flush;
    drawn_ = true;
}

void TerminalProgressSink::finish() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (drawn_) {
        out_ << "\n";
        drawn_ = false;
    }
}
