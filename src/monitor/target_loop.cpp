#include "target_loop.hpp"

#include <exception>
#include <memory>

#include "../core/logger.hpp"
#include "../report/sample_format.hpp"

namespace pw {
namespace {
// Prints the summary exactly once when the loop unwinds, whichever path it
// takes. Only created after the first success, so an all-failure run never
// reaches finalize().
class SummaryPrinter {
   public:
    SummaryPrinter(const RunningSummary& summary, Console& console, LoopResult& res)
        : summary_(summary), console_(console), res_(res) {}
    SummaryPrinter(const SummaryPrinter&) = delete;
    SummaryPrinter& operator=(const SummaryPrinter&) = delete;
    ~SummaryPrinter() {
        res_.summary = summary_.finalize(WallClock::now());
        res_.has_summary = true;
        console_.write(summary_text(res_.summary));
    }

   private:
    const RunningSummary& summary_;
    Console& console_;
    LoopResult& res_;
};
}  // namespace

const char* loop_exit_name(LoopExit e) {
    switch (e) {
        case LoopExit::AttemptLimit: return "attempt limit";
        case LoopExit::FailureLimit: return "failure limit";
        case LoopExit::Stopped: return "stopped";
        case LoopExit::Error: return "error";
    }
    return "?";
}

TargetLoop::TargetLoop(Probe& probe, Console& console, const StopSignal& stop,
                       const LoopOptions& opts, const LoopSinks& sinks)
    : probe_(probe), console_(console), stop_(stop), opts_(opts), sinks_(sinks) {}

LoopResult TargetLoop::run(const std::string& url) {
    LoopResult res;
    res.url = url;
    log(LogLevel::TRACE, "test " + url);
    try {
        run_attempts(url, res);
    } catch (const std::exception& e) {
        log(LogLevel::ERROR, "probe loop for " + url + " aborted: " + e.what());
        res.exit = LoopExit::Error;
    }
    log(LogLevel::DEBUG, url + " finished (" + loop_exit_name(res.exit) + ") after " +
                             std::to_string(res.successes) + " samples, " +
                             std::to_string(res.failures) + " failures");
    return res;
}

void TargetLoop::run_attempts(const std::string& url, LoopResult& res) {
    const int64_t limit = opts_.max_attempts > 0 ? opts_.max_attempts : kUnboundedAttempts;
    // Declaration order matters: the printer must be destroyed before the summary.
    std::unique_ptr<RunningSummary> summary;
    std::unique_ptr<SummaryPrinter> printer;

    for (;;) {
        Sample s;
        std::string err;
        ++res.attempts;
        if (!probe_.fetch(url, s, err)) {
            ++res.failures;
            log(LogLevel::DEBUG, "fetch of " + url + " failed: " + err);
            if (res.failures >= opts_.max_failures) {
                log(LogLevel::WARN, "fetch failure " + std::to_string(res.failures) + " of " +
                                        std::to_string(opts_.max_failures) + " on " + url);
                if (res.successes == 0)
                    console_.write_line("No valid samples received, no summary provided");
                res.exit = LoopExit::FailureLimit;
                return;
            }
        } else {
            ++res.successes;
            if (!summary) {
                summary = std::make_unique<RunningSummary>(s);
                printer = std::make_unique<SummaryPrinter>(*summary, console_, res);
            } else {
                summary->add(s);
            }
            handle_sample(url, s, res.successes);
        }

        if (res.successes >= limit) {
            res.exit = LoopExit::AttemptLimit;
            return;
        }
        if (stop_.wait_for(opts_.delay)) {
            res.exit = LoopExit::Stopped;
            return;
        }
    }
}

void TargetLoop::handle_sample(const std::string& url, const Sample& s, int64_t seq) {
    console_.write_line(opts_.json ? sample_json(s) : sample_tsv(seq, s));
    if (sinks_.metrics) sinks_.metrics->publish(s.location, url, s.resp_code, to_msec(s.resp_time()));
    if (sinks_.webhook) sinks_.webhook->publish(s);
    if (sinks_.alerts && sinks_.alerts->exceeds(s)) sinks_.alerts->consider(s, url);
}
}  // namespace pw
