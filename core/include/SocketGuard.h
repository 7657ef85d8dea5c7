#pragma once

/**
 * @file SocketGuard.h
 * @brief Owning handle for a socket descriptor
 *
 * Every TCP and UDP socket in NetLink is held by a SocketGuard, so an early
 * error return from a handshake or a beacon send never leaks the fd.
 */

#include <sys/socket.h>
#include <unistd.h>

namespace nlk {

class SocketGuard {
public:
    SocketGuard() noexcept = default;
    explicit SocketGuard(int fd) noexcept : fd_(fd) {}

    SocketGuard(const SocketGuard&) = delete;
    SocketGuard& operator=(const SocketGuard&) = delete;

    SocketGuard(SocketGuard&& other) noexcept : fd_(other.fd_) {
        other.fd_ = -1;
    }

    SocketGuard& operator=(SocketGuard&& other) noexcept {
        if (this != &other) {
            reset(other.fd_);
            other.fd_ = -1;
        }
        return *this;
    }

    ~SocketGuard() { reset(); }

    int get() const noexcept { return fd_; }
    explicit operator bool() const noexcept { return fd_ >= 0; }

    /// Close the owned descriptor (if any) and adopt fd
    void reset(int fd = -1) noexcept {
        if (fd_ >= 0) {
            ::close(fd_);
        }
        fd_ = fd;
    }

    /// Unblock readers and writers on another thread; the fd stays owned
    void shutdownBoth() const noexcept {
        if (fd_ >= 0) {
            ::shutdown(fd_, SHUT_RDWR);
        }
    }

private:
    int fd_{-1};
};

} // namespace nlk
