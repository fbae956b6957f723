#include "orchestrator.hpp"

#include <system_error>
#include <thread>

#include "../core/logger.hpp"

namespace pw {
Orchestrator::Orchestrator(Probe& probe, Console& console, const StopSignal& stop,
                           const LoopOptions& opts, const LoopSinks& sinks)
    : probe_(probe), console_(console), stop_(stop), opts_(opts), sinks_(sinks) {}

bool Orchestrator::run(const std::vector<std::string>& targets, std::vector<LoopResult>& results) {
    if (targets.empty()) {
        log(LogLevel::ERROR, "no destinations to test");
        return false;
    }
    results.assign(targets.size(), LoopResult{});
    std::vector<std::thread> workers;
    workers.reserve(targets.size());
    for (size_t i = 0; i < targets.size(); ++i) {
        try {
            workers.emplace_back([this, &targets, &results, i]() {
                TargetLoop loop(probe_, console_, stop_, opts_, sinks_);
                results[i] = loop.run(targets[i]);
            });
        } catch (const std::system_error& e) {
            log(LogLevel::ERROR, "could not start probe loop for " + targets[i] + ": " + e.what());
            results[i].url = targets[i];
            results[i].exit = LoopExit::Error;
        }
    }
    log(LogLevel::DEBUG, "waiting for " + std::to_string(workers.size()) + " probe loops to exit");
    for (auto& w : workers) w.join();
    log(LogLevel::TRACE, "all probe loops exited");
    return true;
}
}  // namespace pw
