#pragma once

#include <string>
#include <vector>
#include <fstream>
#include <chrono>
#include <ctime>
#include <cstdio>
#include <platform/platform.hpp>
#include <fmt/format.h>

inline std::string dipole_log_path() {
    static std::string path = (platform::temp_dir() / "dipole_debug.log").string();
    return path;
}

inline void dipole_log(const std::string& msg) {
    std::ofstream out(dipole_log_path(), std::ios::app);
    if (!out) return;

    auto now = std::chrono::system_clock::now();
    auto t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;
    struct tm tm_buf;
    localtime_r(&t, &tm_buf);

    char ts[32];
    std::snprintf(ts, sizeof(ts), "%02d:%02d:%02d.%03d",
                  tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec,
                  static_cast<int>(ms.count()));
    out << "[" << ts << "] " << msg << "\n";
}

// Log an argument vector, quoting elements that contain spaces.
inline void dipole_log_argv(const std::string& label, const std::vector<std::string>& argv) {
    std::string line;
    for (const auto& a : argv) {
        if (!line.empty()) line += ' ';
        if (a.empty() || a.find_first_of(" \t\"'") != std::string::npos) {
            line += fmt::format("'{}'", a);
        } else {
            line += a;
        }
    }
    dipole_log(fmt::format("{} CMD: {}", label, line));
}
