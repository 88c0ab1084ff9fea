#pragma once

#include <string>
#include <fstream>
#include <chrono>
#include <ctime>
#include <cstdlib>
#include <cstdio>
#include <core/types.hpp>
#include <core/constants.hpp>
#include <platform/platform.hpp>
#include <fmt/format.h>

// Debug log lives in the temp dir unless SSHMIRROR_LOG points elsewhere.
inline std::string sshmirror_log_path() {
    static std::string path = [] {
        const char* override_path = std::getenv("SSHMIRROR_LOG");
        if (override_path && *override_path) return std::string(override_path);
        return (platform::temp_dir() / "sshmirror_debug.log").string();
    }();
    return path;
}

inline void sshmirror_log(const char* level, const std::string& msg) {
    std::ofstream out(sshmirror_log_path(), std::ios::app);
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
    out << "[" << ts << "] " << level << " " << msg << "\n";
}

inline void log_info(const std::string& msg)  { sshmirror_log("INFO", msg); }
inline void log_warn(const std::string& msg)  { sshmirror_log("WARN", msg); }
inline void log_error(const std::string& msg) { sshmirror_log("ERROR", msg); }

inline void log_ssh(const std::string& label, const std::string& cmd,
                    const SSHResult& r) {
    log_info(fmt::format("{} CMD: {}", label, cmd));
    log_info(fmt::format("{} exit={} stdout({})={}", label, r.exit_code,
                         r.stdout_data.size(), r.stdout_data.substr(0, LOG_OUTPUT_LIMIT)));
    if (!r.stderr_data.empty())
        log_info(fmt::format("{} stderr={}", label, r.stderr_data.substr(0, LOG_OUTPUT_LIMIT)));
}
