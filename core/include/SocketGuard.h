#pragma once

/**
 * @file SocketGuard.h
 * @brief RAII owner for socket file descriptors
 *
 * Every probe and browse socket in LanScout is held by a SocketGuard so a
 * cancelled or timed-out operation can never leak a descriptor.
 */

#include <unistd.h>
#include <utility>

namespace LanScout {

class SocketGuard {
public:
    SocketGuard() noexcept : fd_(-1) {}

    explicit SocketGuard(int fd) noexcept : fd_(fd) {}

    SocketGuard(const SocketGuard&) = delete;
    SocketGuard& operator=(const SocketGuard&) = delete;

    SocketGuard(SocketGuard&& other) noexcept : fd_(other.fd_) {
        other.fd_ = -1;
    }

    SocketGuard& operator=(SocketGuard&& other) noexcept {
        if (this != &other) {
            reset();
            fd_ = other.fd_;
            other.fd_ = -1;
        }
        return *this;
    }

    ~SocketGuard() {
        reset();
    }

    int get() const noexcept { return fd_; }

    explicit operator bool() const noexcept { return fd_ >= 0; }

    bool valid() const noexcept { return fd_ >= 0; }

    /// Release ownership and return the fd
    int release() noexcept {
        int tmp = fd_;
        fd_ = -1;
        return tmp;
    }

    /// Close current socket (if any) and take ownership of new one
    void reset(int fd = -1) noexcept {
        if (fd_ >= 0) {
            ::close(fd_);
        }
        fd_ = fd;
    }

private:
    int fd_;
};

} // namespace LanScout
