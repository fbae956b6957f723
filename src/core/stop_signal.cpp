#include "stop_signal.hpp"
#include <poll.h>
#include <sys/eventfd.h>
#include <algorithm>
#include <cerrno>
#include <thread>
#include "logger.hpp"

namespace pw {
StopSignal::StopSignal() {
    int fd = ::eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
    if (fd < 0) log(LogLevel::ERROR, "eventfd failed, stop signal falls back to sleeping");
    efd_.reset(fd);
}

bool StopSignal::close() {
    if (closed_.exchange(true, std::memory_order_acq_rel)) return false;
    if (efd_ && !efd_.write_u64(1)) log(LogLevel::ERROR, "stop signal eventfd write failed");
    return true;
}

bool StopSignal::wait_for(std::chrono::milliseconds timeout) const {
    using clock = std::chrono::steady_clock;
    auto deadline = clock::now() + timeout;
    while (!is_closed()) {
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - clock::now());
        if (left.count() <= 0) break;
        if (!efd_) {
            // No fd to wait on: sleep in short slices so closure is still noticed.
            std::this_thread::sleep_for(std::min(left, std::chrono::milliseconds(50)));
            continue;
        }
        // poll() takes an int timeout; long delays are waited out in slices.
        auto slice = std::min(left, std::chrono::milliseconds(std::chrono::hours(1)));
        pollfd p{efd_.get(), POLLIN, 0};
        int n = ::poll(&p, 1, static_cast<int>(slice.count()));
        if (n < 0 && errno != EINTR) {
            log(LogLevel::ERROR, "poll on stop signal failed");
            std::this_thread::sleep_for(std::min(left, std::chrono::milliseconds(50)));
        }
    }
    return is_closed();
}
}  // namespace pw
