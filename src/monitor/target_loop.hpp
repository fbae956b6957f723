#pragma once
#include <chrono>
#include <cstdint>
#include <limits>
#include <string>

#include "../core/stop_signal.hpp"
#include "../probes/probe.hpp"
#include "../report/console.hpp"
#include "../sinks/sinks.hpp"
#include "alert_manager.hpp"
#include "summary.hpp"

namespace pw {
// max_attempts == 0 runs until stopped, capped here to keep the counter finite.
constexpr int64_t kUnboundedAttempts = std::numeric_limits<int32_t>::max();

struct LoopOptions {
    int64_t max_attempts{0};  // successful samples before exiting, 0 = unbounded
    int max_failures{10};     // total, not consecutive
    std::chrono::milliseconds delay{10000};
    bool json{false};
};

// Optional collaborators; null members are skipped.
struct LoopSinks {
    MetricsPublisher* metrics{nullptr};
    SamplePublisher* webhook{nullptr};
    AlertManager* alerts{nullptr};
};

enum class LoopExit { AttemptLimit, FailureLimit, Stopped, Error };

const char* loop_exit_name(LoopExit e);

struct LoopResult {
    std::string url;
    int64_t attempts{0};
    int64_t successes{0};
    int failures{0};
    LoopExit exit{LoopExit::Stopped};
    bool has_summary{false};
    SummaryReport summary;
};

// Probes one target until a limit is hit or the stop signal closes. Samples are
// strictly sequential: every side effect of attempt N completes before N+1.
class TargetLoop {
   public:
    TargetLoop(Probe& probe, Console& console, const StopSignal& stop, const LoopOptions& opts,
               const LoopSinks& sinks);

    // Never throws; a failure escaping the loop body ends this loop with LoopExit::Error.
    LoopResult run(const std::string& url);

   private:
    Probe& probe_;
    Console& console_;
    const StopSignal& stop_;
    LoopOptions opts_;
    LoopSinks sinks_;

    void run_attempts(const std::string& url, LoopResult& res);
    void handle_sample(const std::string& url, const Sample& s, int64_t seq);
};
}  // namespace pw
