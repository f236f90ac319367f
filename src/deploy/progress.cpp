#include "progress.hpp"
#include <nlohmann/json.hpp>

using json = nlohmann::json;

bool operator==(const ProgressUpdate& a, const ProgressUpdate& b) {
    return a.progress == b.progress && a.operations == b.operations;
}

std::string progress_to_json(const ProgressUpdate& update) {
    json j;
    j["progress"] = update.progress;
    if (update.operations) {
        j["operations"] = {update.operations->first, update.operations->second};
    } else {
        j["operations"] = false;
    }
    return j.dump();
}

void JsonProgressSink::report(const ProgressUpdate& update) {
    std::lock_guard<std::mutex> lock(mutex_);
    out_ << progress_to_json(update) << std::endl;
}
