#include <cassert>
#include <chrono>
#include <thread>
#include <vector>

#include "../src/core/stop_signal.hpp"

using namespace std::chrono_literals;

int main() {
    // Open until closed; times out without closing.
    {
        pw::StopSignal stop;
        assert(!stop.is_closed());
        auto t0 = std::chrono::steady_clock::now();
        if (stop.wait_for(50ms)) return 1;
        if (std::chrono::steady_clock::now() - t0 < 40ms) return 2;
        if (stop.wait_for(0ms)) return 3;
    }

    // Closing is one-shot and idempotent.
    {
        pw::StopSignal stop;
        if (!stop.close()) return 10;
        if (stop.close()) return 11;
        if (!stop.is_closed()) return 12;
        if (!stop.wait_for(0ms)) return 13;
        if (!stop.wait_for(10s)) return 14;
    }

    // One close wakes every waiter.
    {
        pw::StopSignal stop;
        std::vector<std::thread> waiters;
        std::vector<int> woke(4, 0);
        for (int i = 0; i < 4; ++i)
            waiters.emplace_back([&stop, &woke, i]() { woke[i] = stop.wait_for(30s) ? 1 : 0; });
        auto t0 = std::chrono::steady_clock::now();
        std::this_thread::sleep_for(50ms);
        stop.close();
        for (auto& w : waiters) w.join();
        for (int w : woke)
            if (!w) return 20;
        if (std::chrono::steady_clock::now() - t0 > 10s) return 21;
    }
    return 0;
}
