#include "shutdown.hpp"

#include <sys/epoll.h>
#include <sys/signalfd.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <system_error>

#include "../core/logger.hpp"

namespace pw {
const char* termination_name(int signo) {
    switch (signo) {
        case SIGINT: return "interrupt";
        case SIGTERM: return "terminated";
        default: return "unknown";
    }
}

ShutdownCoordinator::ShutdownCoordinator(StopSignal& stop, Console& console)
    : stop_(stop), console_(console) {
    sigemptyset(&mask_);
    sigaddset(&mask_, SIGINT);
    sigaddset(&mask_, SIGTERM);
    sigemptyset(&prev_mask_);
    int rc = ::pthread_sigmask(SIG_BLOCK, &mask_, &prev_mask_);
    if (rc != 0) log(LogLevel::ERROR, std::string("pthread_sigmask failed: ") + std::strerror(rc));
    sfd_.reset(::signalfd(-1, &mask_, SFD_NONBLOCK | SFD_CLOEXEC));
    if (!sfd_) log(LogLevel::ERROR, std::string("signalfd failed: ") + std::strerror(errno));
}

ShutdownCoordinator::~ShutdownCoordinator() { finish(); }

bool ShutdownCoordinator::start() {
    if (thread_.joinable()) return false;
    if (!listen()) {
        // Nobody reads the signalfd, so hand the signals back to their default action.
        int rc = ::pthread_sigmask(SIG_SETMASK, &prev_mask_, nullptr);
        if (rc != 0) log(LogLevel::ERROR, std::string("pthread_sigmask restore failed: ") + std::strerror(rc));
        return false;
    }
    return true;
}

bool ShutdownCoordinator::listen() {
    if (!sfd_ || !reactor_.ok()) return false;
    if (!reactor_.add_fd(sfd_.get(), EPOLLIN, [this](uint32_t) { drain_signals(); })) return false;
    // Only there to wake the loop once the stop signal closes for any reason.
    if (stop_.fd() >= 0 && !reactor_.add_fd(stop_.fd(), EPOLLIN, [](uint32_t) {})) {
        reactor_.del_fd(sfd_.get());
        return false;
    }
    try {
        thread_ = std::thread([this]() { run(); });
    } catch (const std::system_error& e) {
        log(LogLevel::ERROR, std::string("cannot start signal listener: ") + e.what());
        return false;
    }
    return true;
}

void ShutdownCoordinator::finish() {
    if (stop_.close()) log(LogLevel::TRACE, "stop signal closed at shutdown");
    if (thread_.joinable()) thread_.join();
}

bool ShutdownCoordinator::request(int signo) {
    if (!stop_.close()) {
        log(LogLevel::DEBUG, std::string("ignoring repeated ") + termination_name(signo) + " signal");
        return false;
    }
    console_.write(std::string("\nreceived ") + termination_name(signo) + " signal, terminating\n");
    return true;
}

void ShutdownCoordinator::run() {
    // Without a stop eventfd the loop falls back to polling is_closed().
    const int timeout_ms = stop_.fd() >= 0 ? -1 : 200;
    while (!stop_.is_closed()) {
        if (reactor_.loop_once(timeout_ms) < 0) {
            log(LogLevel::ERROR, "signal listener epoll_wait failed");
            return;
        }
    }
}

void ShutdownCoordinator::drain_signals() {
    signalfd_siginfo si;
    for (;;) {
        ssize_t n = ::read(sfd_.get(), &si, sizeof(si));
        if (n != static_cast<ssize_t>(sizeof(si))) {
            if (n < 0 && errno == EINTR) continue;
            return;
        }
        request(static_cast<int>(si.ssi_signo));
    }
}
}  // namespace pw
