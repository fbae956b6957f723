#pragma once
#include <cerrno>
#include <cstdint>
#include <unistd.h>

namespace pw {
// Owning wrapper for eventfd/signalfd/epoll descriptors.
class Fd {
   public:
    Fd() = default;
    explicit Fd(int fd) : fd_(fd) {}
    ~Fd() { reset(); }
    Fd(const Fd&) = delete;
    Fd& operator=(const Fd&) = delete;
    Fd(Fd&& o) noexcept : fd_(o.fd_) { o.fd_ = -1; }
    Fd& operator=(Fd&& o) noexcept {
        if (this != &o) {
            reset(o.fd_);
            o.fd_ = -1;
        }
        return *this;
    }

    int get() const { return fd_; }
    void reset(int fd = -1) {
        if (fd_ >= 0) ::close(fd_);
        fd_ = fd;
    }
    explicit operator bool() const { return fd_ >= 0; }

    // eventfd counters are always exchanged as 8 byte values.
    bool write_u64(uint64_t v) const {
        ssize_t n;
        do {
            n = ::write(fd_, &v, sizeof(v));
        } while (n < 0 && errno == EINTR);
        return n == static_cast<ssize_t>(sizeof(v));
    }

   private:
    int fd_{-1};
};
}  // namespace pw
