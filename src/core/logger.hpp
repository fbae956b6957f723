#pragma once
#include <atomic>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <string>

namespace pw {
enum class LogLevel { TRACE, DEBUG, INFO, WARN, ERROR };

inline const char* level_name(LogLevel lvl) {
    switch (lvl) {
        case LogLevel::TRACE: return "TRACE";
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO: return "INFO";
        case LogLevel::WARN: return "WARN";
        case LogLevel::ERROR: return "ERROR";
    }
    return "?";
}

inline std::atomic<int>& log_threshold() {
    static std::atomic<int> threshold{static_cast<int>(LogLevel::WARN)};
    return threshold;
}

inline void set_log_level(LogLevel lvl) { log_threshold().store(static_cast<int>(lvl)); }

inline bool log_enabled(LogLevel lvl) {
    return static_cast<int>(lvl) >= log_threshold().load(std::memory_order_relaxed);
}

// Maps -q/-v/-V style verbosity onto a threshold. quiet wins over verbose.
inline LogLevel level_for_verbosity(int verbose, bool quiet) {
    if (quiet) return LogLevel::ERROR;
    if (verbose >= 3) return LogLevel::TRACE;
    if (verbose == 2) return LogLevel::DEBUG;
    if (verbose == 1) return LogLevel::INFO;
    return LogLevel::WARN;
}

inline void log(LogLevel lvl, const std::string& msg) {
    if (!log_enabled(lvl)) return;
    auto now = std::chrono::system_clock::now();
    auto t = std::chrono::system_clock::to_time_t(now);
    std::tm tm{};
    gmtime_r(&t, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%FT%TZ", &tm);
    std::fprintf(stderr, "[%s] %s: %s\n", buf, level_name(lvl), msg.c_str());
}
}  // namespace pw
