#pragma once
#include <string>
#include <vector>

#include "target_loop.hpp"

namespace pw {
// Runs one TargetLoop per target on its own thread, all sharing one stop
// signal, and returns once every loop has exited. Results come back in target
// order; their output has already been printed by the loops themselves.
class Orchestrator {
   public:
    Orchestrator(Probe& probe, Console& console, const StopSignal& stop, const LoopOptions& opts,
                 const LoopSinks& sinks);

    // Returns false without starting anything when targets is empty.
    bool run(const std::vector<std::string>& targets, std::vector<LoopResult>& results);

   private:
    Probe& probe_;
    Console& console_;
    const StopSignal& stop_;
    LoopOptions opts_;
    LoopSinks sinks_;
};
}  // namespace pw
