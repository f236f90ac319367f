#include "scheduler.hpp"
#include "binary_detect.hpp"
#include <core/constants.hpp>
#include <core/utils.hpp>
#include <core/log.hpp>
#include <fmt/format.h>
#include <algorithm>

OperationScheduler::OperationScheduler(BinaryClassifier is_binary)
    : is_binary_(std::move(is_binary)) {
}

OperationScheduler::BinaryClassifier
OperationScheduler::filesystem_classifier(const std::filesystem::path& input_dir) {
    return [input_dir](const Entry& e) {
        auto binary = is_binary_file(input_dir / e.path);
        if (binary.is_err()) {
            deploy_log("Scheduler: cannot classify " + e.path + ": " + binary.error);
            return false;
        }
        return binary.value;
    };
}

std::vector<Entry> OperationScheduler::order_removals(const std::vector<Entry>& entries) const {
    std::vector<Entry> dirs, files;
    for (const auto& e : entries) {
        (e.is_directory() ? dirs : files).push_back(e);
    }

    // Shallow first in the vector, so the deepest directory is popped first
    std::stable_sort(dirs.begin(), dirs.end(), [](const Entry& a, const Entry& b) {
        return a.path.length() < b.path.length();
    });

    std::vector<Entry> out;
    out.reserve(entries.size());
    out.insert(out.end(), dirs.begin(), dirs.end());
    out.insert(out.end(), files.begin(), files.end());
    return out;
}

std::vector<Entry> OperationScheduler::order_uploads(const std::vector<Entry>& entries) const {
    std::vector<Entry> dirs, text, binary;
    for (const auto& e : entries) {
        if (e.is_directory()) {
            dirs.push_back(e);
        } else if (is_binary_ && is_binary_(e)) {
            binary.push_back(e);
        } else {
            text.push_back(e);
        }
    }

    // Deep first in the vector, so parents are popped (created) first
    std::stable_sort(dirs.begin(), dirs.end(), [](const Entry& a, const Entry& b) {
        return a.path.length() > b.path.length();
    });

    std::vector<Entry> out;
    out.reserve(entries.size());
    out.insert(out.end(), binary.begin(), binary.end());
    out.insert(out.end(), text.begin(), text.end());
    out.insert(out.end(), dirs.begin(), dirs.end());
    return out;
}

Schedule OperationScheduler::schedule(const DiffResult& diff) const {
    Schedule s;
    s.removals = order_removals(diff.to_remove);
    s.uploads = order_uploads(diff.to_upload);
    return s;
}

std::vector<Entry> OperationScheduler::pop_order(const std::vector<Entry>& stack) {
    return std::vector<Entry>(stack.rbegin(), stack.rend());
}

Result<void> OperationScheduler::write_audit_logs(const Schedule& schedule,
                                                  const std::filesystem::path& app_dir) {
    std::error_code ec;
    std::filesystem::create_directories(app_dir, ec);
    if (ec) {
        return Result<void>::Err(fmt::format("Cannot create {}: {}", app_dir.string(), ec.message()));
    }

    auto upload_log = app_dir / fmt::format("{}-{}.txt", AUDIT_LOG_PREFIX, AUDIT_LOG_UPLOAD_SUFFIX);
    auto delete_log = app_dir / fmt::format("{}-{}.txt", AUDIT_LOG_PREFIX, AUDIT_LOG_DELETE_SUFFIX);

    auto r = write_file_atomic(upload_log, serialize_entry_list(schedule.uploads));
    if (r.is_err()) return r;
    return write_file_atomic(delete_log, serialize_entry_list(schedule.removals));
}
