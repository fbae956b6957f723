#pragma once
#include <atomic>
#include <chrono>

#include "fd.hpp"

namespace pw {
// One-shot broadcast token shared by every probe loop. close() flips it exactly
// once; the backing eventfd is never drained, so it stays readable for all
// waiters (and for a Reactor watching fd()) from then on.
class StopSignal {
   public:
    StopSignal();
    StopSignal(const StopSignal&) = delete;
    StopSignal& operator=(const StopSignal&) = delete;

    // Returns true only for the call that performed the transition.
    bool close();
    bool is_closed() const { return closed_.load(std::memory_order_acquire); }

    // Blocks until closed or until `timeout` elapses. Returns is_closed().
    bool wait_for(std::chrono::milliseconds timeout) const;

    int fd() const { return efd_.get(); }

   private:
    std::atomic<bool> closed_{false};
    Fd efd_;
};
}  // namespace pw
