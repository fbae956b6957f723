#pragma once
#include <chrono>
#include <cstdint>
#include <string>

#include "../probes/probe.hpp"

namespace pw {
struct SummaryReport {
    std::string url;
    std::string location;
    std::string remote;
    int resp_code{kNoResponse};
    int64_t count{0};
    int64_t elapsed_s{0};
    double avg_dns_ms{0};
    double avg_tcp_ms{0};
    double avg_tls_ms{0};
    double avg_reply_ms{0};
    double avg_close_ms{0};
    double avg_resp_ms{0};
    int64_t avg_size{0};
};

// Running totals for one target. Owned by a single probe loop; not thread-safe.
// Durations are summed as integer nanoseconds so accumulation is exact and the
// only rounding happens in the one division done by finalize().
class RunningSummary {
   public:
    explicit RunningSummary(const Sample& first);

    void add(const Sample& s);
    int64_t count() const { return count_; }
    WallClock::time_point start() const { return start_; }

    SummaryReport finalize(WallClock::time_point now) const;

   private:
    std::string url_;
    std::string location_;
    std::string remote_;
    int resp_code_;
    WallClock::time_point start_;
    int64_t count_{0};
    std::chrono::nanoseconds dns_{0};
    std::chrono::nanoseconds tcp_{0};
    std::chrono::nanoseconds tls_{0};
    std::chrono::nanoseconds reply_{0};
    std::chrono::nanoseconds close_{0};
    std::chrono::nanoseconds total_{0};
    int64_t size_{0};
};
}  // namespace pw
