#pragma once
#include <cstdint>
#include <functional>
#include <unordered_map>

#include "fd.hpp"

namespace pw {
using FdHandler = std::function<void(uint32_t)>;

// Single-threaded epoll dispatcher. Handlers run on the thread calling loop_once().
class Reactor {
   public:
    Reactor();
    bool ok() const { return static_cast<bool>(epoll_fd_); }
    bool add_fd(int fd, uint32_t events, const FdHandler& cb);
    void del_fd(int fd);
    // Returns the number of dispatched events, or -1 on a hard epoll error.
    int loop_once(int timeout_ms);

   private:
    Fd epoll_fd_;
    std::unordered_map<int, FdHandler> handlers_;
};
}  // namespace pw
