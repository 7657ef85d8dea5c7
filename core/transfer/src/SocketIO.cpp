#include "SocketIO.h"
#include <arpa/inet.h>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/time.h>

namespace NetLink {
namespace net {

namespace {

nlk::Error socketError(nlk::ErrorCode fallback, const std::string& what, int err) {
    if (err == EAGAIN || err == EWOULDBLOCK || err == ETIMEDOUT) {
        return nlk::Error{nlk::ErrorCode::ConnectionTimeout, what + ": timed out"};
    }
    if (err == EPIPE || err == ECONNRESET || err == ENOTCONN || err == ESHUTDOWN) {
        return nlk::Error{nlk::ErrorCode::ConnectionClosed, what + ": " + strerror(err)};
    }
    return nlk::Error{fallback, what + ": " + strerror(err)};
}

bool setBlocking(int fd, bool blocking) {
    int flags = fcntl(fd, F_GETFL, 0);
    if (flags < 0) return false;
    flags = blocking ? (flags & ~O_NONBLOCK) : (flags | O_NONBLOCK);
    return fcntl(fd, F_SETFL, flags) == 0;
}

} // namespace

nlk::Result<nlk::SocketGuard> connectTcp(const std::string& host, int port, int timeoutMs) {
    struct addrinfo hints;
    memset(&hints, 0, sizeof(hints));
    hints.ai_family = AF_INET;
    hints.ai_socktype = SOCK_STREAM;

    struct addrinfo* resolved = nullptr;
    int rc = getaddrinfo(host.c_str(), std::to_string(port).c_str(), &hints, &resolved);
    if (rc != 0 || !resolved) {
        return nlk::Err<nlk::SocketGuard>(nlk::ErrorCode::ConnectionFailed,
            "Cannot resolve " + host + ": " + gai_strerror(rc));
    }

    nlk::SocketGuard sock(socket(resolved->ai_family, resolved->ai_socktype, resolved->ai_protocol));
    if (!sock) {
        int err = errno;
        freeaddrinfo(resolved);
        return nlk::Err<nlk::SocketGuard>(nlk::ErrorCode::ConnectionFailed,
            std::string("socket() failed: ") + strerror(err));
    }

    setBlocking(sock.get(), false);
    rc = ::connect(sock.get(), resolved->ai_addr, resolved->ai_addrlen);
    int err = errno;
    freeaddrinfo(resolved);

    const std::string target = host + ":" + std::to_string(port);
    if (rc < 0 && err != EINPROGRESS) {
        return nlk::Err<nlk::SocketGuard>(nlk::ErrorCode::ConnectionFailed,
            "Connect to " + target + " failed: " + strerror(err));
    }

    if (rc < 0) {
        struct pollfd pfd;
        pfd.fd = sock.get();
        pfd.events = POLLOUT;
        pfd.revents = 0;
        int ready = poll(&pfd, 1, timeoutMs);
        if (ready == 0) {
            return nlk::Err<nlk::SocketGuard>(nlk::ErrorCode::ConnectionTimeout,
                "Connect to " + target + " timed out");
        }
        if (ready < 0) {
            return nlk::Err<nlk::SocketGuard>(nlk::ErrorCode::ConnectionFailed,
                "poll() failed: " + std::string(strerror(errno)));
        }
        int soError = 0;
        socklen_t len = sizeof(soError);
        getsockopt(sock.get(), SOL_SOCKET, SO_ERROR, &soError, &len);
        if (soError != 0) {
            return nlk::Err<nlk::SocketGuard>(nlk::ErrorCode::ConnectionFailed,
                "Connect to " + target + " failed: " + strerror(soError));
        }
    }

    setBlocking(sock.get(), true);
    int one = 1;
    setsockopt(sock.get(), IPPROTO_TCP, TCP_NODELAY, &one, sizeof(one));
    return nlk::Ok(std::move(sock));
}

nlk::Result<nlk::SocketGuard> listenTcp(const std::string& bindAddress, int port, int backlog) {
    nlk::SocketGuard sock(socket(AF_INET, SOCK_STREAM, 0));
    if (!sock) {
        return nlk::Err<nlk::SocketGuard>(nlk::ErrorCode::NetworkError,
            std::string("Failed to create TCP server socket: ") + strerror(errno));
    }

    int opt = 1;
    if (setsockopt(sock.get(), SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt)) < 0) {
        return nlk::Err<nlk::SocketGuard>(nlk::ErrorCode::NetworkError,
            std::string("Failed to set socket options: ") + strerror(errno));
    }

    struct sockaddr_in addr;
    memset(&addr, 0, sizeof(addr));
    addr.sin_family = AF_INET;
    addr.sin_port = htons(static_cast<uint16_t>(port));
    if (bindAddress.empty() || bindAddress == "0.0.0.0") {
        addr.sin_addr.s_addr = INADDR_ANY;
    } else if (inet_pton(AF_INET, bindAddress.c_str(), &addr.sin_addr) != 1) {
        return nlk::Err<nlk::SocketGuard>(nlk::ErrorCode::InvalidArgument,
            "Invalid bind address: " + bindAddress);
    }

    if (bind(sock.get(), reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) < 0) {
        return nlk::Err<nlk::SocketGuard>(nlk::ErrorCode::NetworkError,
            "Failed to bind TCP server socket to port " + std::to_string(port) + ": " + strerror(errno));
    }

    if (listen(sock.get(), backlog) < 0) {
        return nlk::Err<nlk::SocketGuard>(nlk::ErrorCode::NetworkError,
            std::string("Failed to listen on TCP server socket: ") + strerror(errno));
    }

    return nlk::Ok(std::move(sock));
}

bool setIoTimeouts(int fd, int timeoutMs) {
    struct timeval tv;
    tv.tv_sec = timeoutMs / 1000;
    tv.tv_usec = (timeoutMs % 1000) * 1000;
    bool ok = setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)) == 0;
    ok = setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv)) == 0 && ok;
    return ok;
}

nlk::Result<void> sendAll(int fd, const void* data, size_t length) {
    const auto* cursor = static_cast<const uint8_t*>(data);
    size_t remaining = length;
    while (remaining > 0) {
        ssize_t sent = ::send(fd, cursor, remaining, MSG_NOSIGNAL);
        if (sent < 0) {
            if (errno == EINTR) continue;
            return socketError(nlk::ErrorCode::SendFailed, "send", errno);
        }
        if (sent == 0) {
            return nlk::Err(nlk::ErrorCode::ConnectionClosed, "send: connection closed");
        }
        cursor += sent;
        remaining -= static_cast<size_t>(sent);
    }
    return nlk::Ok();
}

nlk::Result<void> recvExact(int fd, void* data, size_t length) {
    auto* cursor = static_cast<uint8_t*>(data);
    size_t remaining = length;
    while (remaining > 0) {
        auto got = recvSome(fd, cursor, remaining);
        if (!got) {
            return got.error();
        }
        cursor += *got;
        remaining -= *got;
    }
    return nlk::Ok();
}

nlk::Result<size_t> recvSome(int fd, void* data, size_t length) {
    while (true) {
        ssize_t received = ::recv(fd, data, length, 0);
        if (received > 0) {
            return nlk::Ok(static_cast<size_t>(received));
        }
        if (received == 0) {
            return nlk::Err<size_t>(nlk::ErrorCode::ConnectionClosed, "recv: connection closed by peer");
        }
        if (errno == EINTR) continue;
        return socketError(nlk::ErrorCode::ReceiveFailed, "recv", errno);
    }
}

std::string peerAddress(int fd) {
    struct sockaddr_in addr;
    socklen_t len = sizeof(addr);
    if (getpeername(fd, reinterpret_cast<struct sockaddr*>(&addr), &len) != 0) {
        return "unknown";
    }
    char ip[INET_ADDRSTRLEN];
    inet_ntop(AF_INET, &addr.sin_addr, ip, INET_ADDRSTRLEN);
    return std::string(ip) + ":" + std::to_string(ntohs(addr.sin_port));
}

int localPort(int fd) {
    struct sockaddr_in addr;
    socklen_t len = sizeof(addr);
    if (getsockname(fd, reinterpret_cast<struct sockaddr*>(&addr), &len) != 0) {
        return -1;
    }
    return ntohs(addr.sin_port);
}

} // namespace net
} // namespace NetLink
