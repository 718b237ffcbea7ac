#pragma once

#include <string>
#include <fstream>
#include <chrono>
#include <ctime>
#include <mutex>
#include <cstdlib>
#include <filesystem>
#include <platform/platform.hpp>
#include <fmt/format.h>

// Debug log path: $TRACESYNC_LOG, else {tmp}/tracesync_debug.log
inline std::string sync_log_path() {
    static std::string path = [] {
        const char* over = std::getenv("TRACESYNC_LOG");
        if (over && *over) return std::string(over);
        return (platform::temp_dir() / "tracesync_debug.log").string();
    }();
    return path;
}

// Append a timestamped line to the debug log. Safe to call from worker threads.
inline void sync_log(const std::string& msg) {
    static std::mutex log_mutex;

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

    std::string line = fmt::format("[{:02}:{:02}:{:02}.{:03}] {}\n",
                                   tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec,
                                   static_cast<int>(ms.count()), msg);

    std::lock_guard<std::mutex> lock(log_mutex);
    std::ofstream out(sync_log_path(), std::ios::app);
    if (!out) return;
    out << line;
}
