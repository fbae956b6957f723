#pragma once
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <ctime>
#include <string>

namespace pw {
using WallClock = std::chrono::system_clock;

inline uint64_t monotonic_ns() {
    using namespace std::chrono;
    return duration_cast<nanoseconds>(steady_clock::now().time_since_epoch()).count();
}

inline std::string wall_time_iso8601(WallClock::time_point tp) {
    auto t = WallClock::to_time_t(tp);
    std::tm tm{};
    gmtime_r(&t, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%FT%TZ", &tm);
    return std::string(buf);
}

inline std::string wall_time_iso8601() { return wall_time_iso8601(WallClock::now()); }

inline double to_msec(std::chrono::nanoseconds d) { return d.count() / 1e6; }

// 3725 -> "1h02m05s", 125 -> "2m05s", 5 -> "5s"
inline std::string hhmmss(int64_t secs) {
    if (secs < 0) secs = 0;
    int64_t hr = secs / 3600;
    secs -= hr * 3600;
    int64_t min = secs / 60;
    secs -= min * 60;
    char buf[48];
    if (hr > 0)
        std::snprintf(buf, sizeof(buf), "%lldh%02lldm%02llds", static_cast<long long>(hr),
                      static_cast<long long>(min), static_cast<long long>(secs));
    else if (min > 0)
        std::snprintf(buf, sizeof(buf), "%lldm%02llds", static_cast<long long>(min),
                      static_cast<long long>(secs));
    else
        std::snprintf(buf, sizeof(buf), "%llds", static_cast<long long>(secs));
    return std::string(buf);
}
}  // namespace pw
