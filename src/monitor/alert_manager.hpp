#pragma once
#include <chrono>
#include <mutex>
#include <string>
#include <vector>

#include "../probes/probe.hpp"
#include "../sinks/sinks.hpp"

namespace pw {
enum class AlertDecision { Dispatched, Suppressed, Unconfigured };

// Process-wide alert rate limiter. One instance is shared by every probe loop;
// the debounce window is global, so breaches on different targets inside one
// window produce a single notification.
class AlertManager {
   public:
    // notifier may be null when no credentials are configured.
    AlertManager(std::chrono::milliseconds threshold, std::chrono::seconds debounce,
                 Notifier* notifier, std::vector<std::string> recipients);

    bool exceeds(const Sample& s) const { return s.resp_time() > threshold_; }

    // Decides on, and performs, notification for a sample that breached the
    // threshold. Elapsed time is measured between sample start timestamps.
    AlertDecision consider(const Sample& s, const std::string& url);

    std::string format_message(const Sample& s, const std::string& url) const;

   private:
    std::chrono::milliseconds threshold_;
    std::chrono::seconds debounce_;
    Notifier* notifier_;
    std::vector<std::string> recipients_;

    std::mutex mu_;
    bool has_last_{false};
    WallClock::time_point last_alert_{};
};

std::string format_duration(std::chrono::nanoseconds d);
}  // namespace pw
