#pragma once
#include <signal.h>

#include <thread>

#include "../core/fd.hpp"
#include "../core/reactor.hpp"
#include "../core/stop_signal.hpp"
#include "../report/console.hpp"

namespace pw {
// Turns SIGINT/SIGTERM into a single close of the shared stop signal.
//
// The constructor blocks both signals for the calling thread, and threads
// created afterwards inherit that mask, so construct it before starting any
// probe loop. Delivery then happens only through a signalfd watched by a
// Reactor on the coordinator's own thread.
class ShutdownCoordinator {
   public:
    ShutdownCoordinator(StopSignal& stop, Console& console);
    ~ShutdownCoordinator();
    ShutdownCoordinator(const ShutdownCoordinator&) = delete;
    ShutdownCoordinator& operator=(const ShutdownCoordinator&) = delete;

    // Starts the listener thread. On failure the signal mask in effect before
    // construction is restored, so SIGINT/SIGTERM terminate the process again.
    bool start();
    // Releases the listener thread (closing the stop signal if still open) and joins it.
    void finish();

    // Handles one termination request. Only the request that actually closes
    // the stop signal prints the acknowledgement; later ones are no-ops.
    bool request(int signo);

   private:
    StopSignal& stop_;
    Console& console_;
    sigset_t mask_{};
    sigset_t prev_mask_{};
    Fd sfd_;
    Reactor reactor_;
    std::thread thread_;

    bool listen();
    void run();
    void drain_signals();
};

const char* termination_name(int signo);
}  // namespace pw
