#pragma once

#include <vector>
#include <functional>
#include <filesystem>
#include <core/types.hpp>
#include "entry.hpp"
#include "diff_engine.hpp"

// Two LIFO work queues: back() is the next operation.
struct Schedule {
    std::vector<Entry> removals;
    std::vector<Entry> uploads;
};

// Orders the diff so every operation is safe when the stacks are popped:
//   removals: files, then directories deepest first
//   uploads:  directories parents first, then text files, then binary files
// Ties keep discovery order in the stack vector.
class OperationScheduler {
public:
    using BinaryClassifier = std::function<bool(const Entry&)>;

    explicit OperationScheduler(BinaryClassifier is_binary);

    // Sniffs input_dir / entry.path.
    static BinaryClassifier filesystem_classifier(const std::filesystem::path& input_dir);

    Schedule schedule(const DiffResult& diff) const;

    std::vector<Entry> order_removals(const std::vector<Entry>& entries) const;
    std::vector<Entry> order_uploads(const std::vector<Entry>& entries) const;

    // Stack contents in the order they will be consumed.
    static std::vector<Entry> pop_order(const std::vector<Entry>& stack);

    // connection-files-log-to-upload.txt / -to-delete.txt in app_dir.
    // Diagnostic only, never read back.
    static Result<void> write_audit_logs(const Schedule& schedule,
                                         const std::filesystem::path& app_dir);

private:
    BinaryClassifier is_binary_;
};
