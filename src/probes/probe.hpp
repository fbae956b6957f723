#pragma once
#include <chrono>
#include <cstdint>
#include <string>

#include "../core/time_utils.hpp"

namespace pw {
constexpr int kNoResponse = -1;

// Timing of one successful request. Phases that did not happen (TLS on plain
// http) stay zero; total covers at least the sum of the phases.
struct Sample {
    std::string url;
    std::string location;
    std::string remote;
    WallClock::time_point start{};
    std::chrono::nanoseconds dns{0};
    std::chrono::nanoseconds tcp{0};
    std::chrono::nanoseconds tls{0};
    std::chrono::nanoseconds reply{0};
    std::chrono::nanoseconds close{0};
    std::chrono::nanoseconds total{0};
    int resp_code{kNoResponse};
    int64_t size{0};

    std::chrono::nanoseconds resp_time() const { return total; }
};

// One request against one target. Implementations must be safe to call from
// several probe loops at once and must bound their own run time.
class Probe {
   public:
    virtual ~Probe() = default;
    virtual bool fetch(const std::string& url, Sample& out, std::string& err) = 0;
};
}  // namespace pw
