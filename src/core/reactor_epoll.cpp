#include "reactor.hpp"
#include <sys/epoll.h>
#include <cerrno>
#include "logger.hpp"

namespace pw {
Reactor::Reactor() {
    epoll_fd_.reset(::epoll_create1(EPOLL_CLOEXEC));
    if (!epoll_fd_) log(LogLevel::ERROR, "epoll_create1 failed");
}

bool Reactor::add_fd(int fd, uint32_t events, const FdHandler& cb) {
    struct epoll_event ev {};
    ev.events = events;
    ev.data.fd = fd;
    if (::epoll_ctl(epoll_fd_.get(), EPOLL_CTL_ADD, fd, &ev) < 0) {
        log(LogLevel::ERROR, "epoll_ctl add failed for fd " + std::to_string(fd));
        return false;
    }
    handlers_[fd] = cb;
    return true;
}

void Reactor::del_fd(int fd) {
    ::epoll_ctl(epoll_fd_.get(), EPOLL_CTL_DEL, fd, nullptr);
    handlers_.erase(fd);
}

int Reactor::loop_once(int timeout_ms) {
    struct epoll_event evs[16];
    int n = ::epoll_wait(epoll_fd_.get(), evs, 16, timeout_ms);
    if (n < 0) return errno == EINTR ? 0 : -1;
    for (int i = 0; i < n; ++i) {
        auto it = handlers_.find(evs[i].data.fd);
        if (it != handlers_.end()) {
            // Copy: the handler may del_fd() itself.
            FdHandler h = it->second;
            h(evs[i].events);
        }
    }
    return n;
}
}  // namespace pw
