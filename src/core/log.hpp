#pragma once

#include <string>
#include <fstream>
#include <chrono>
#include <ctime>
#include <cstdio>
#include <mutex>
#include <platform/platform.hpp>

inline std::string& deploy_log_path_storage() {
    static std::string path = (platform::temp_dir() / "sitedeploy_debug.log").string();
    return path;
}

inline std::mutex& deploy_log_mutex() {
    static std::mutex m;
    return m;
}

inline std::string deploy_log_path() {
    std::lock_guard<std::mutex> lock(deploy_log_mutex());
    return deploy_log_path_storage();
}

// Redirect the debug log (from the log_file config key).
inline void set_deploy_log_path(const std::string& path) {
    std::lock_guard<std::mutex> lock(deploy_log_mutex());
    deploy_log_path_storage() = path;
}

inline void deploy_log(const std::string& msg) {
    std::lock_guard<std::mutex> lock(deploy_log_mutex());
    std::ofstream out(deploy_log_path_storage(), std::ios::app);
    if (!out) return;

    auto now = std::chrono::system_clock::now();
    auto t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;
    struct tm tm_buf;
#ifdef _WIN32
    localtime_s(&tm_buf, &t);
#else
    localtime_r(&t, &tm_buf);
#endif

    char ts[32];
    std::snprintf(ts, sizeof(ts), "%02d:%02d:%02d.%03d",
                  tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec,
                  static_cast<int>(ms.count()));
    out << "[" << ts << "] " << msg << "\n";
}
