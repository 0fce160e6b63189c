#pragma once

#include <string>
#include <chrono>
#include <ctime>
#include <cstdio>
#include <platform/platform.hpp>
#include <core/constants.hpp>
#include <core/paths.hpp>
#include <fmt/format.h>

// Debug log for the CLI, off unless config.yaml sets `debug_log: true`.
// Records commands, key names and error kinds. Never values.
// Lives beside config.yaml, owner read/write only.

inline bool& aisafe_log_enabled() {
    static bool enabled = false;
    return enabled;
}

inline fs::path aisafe_log_path() {
    return get_config_dir() / DEBUG_LOG_FILENAME;
}

inline void aisafe_log(const std::string& msg) {
    if (!aisafe_log_enabled()) return;

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
    std::snprintf(ts, sizeof(ts), "%04d-%02d-%02d %02d:%02d:%02d.%03d",
                  tm_buf.tm_year + 1900, tm_buf.tm_mon + 1, tm_buf.tm_mday,
                  tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec,
                  static_cast<int>(ms.count()));
    // Logging never fails a command
    (void)platform::append_owner_only(aisafe_log_path(), fmt::format("[{}] {}\n", ts, msg));
}
