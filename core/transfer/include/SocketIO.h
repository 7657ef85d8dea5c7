#pragma once

/**
 * @file SocketIO.h
 * @brief Blocking TCP helpers with bounded timeouts
 *
 * Every failure is mapped onto the connection range of ErrorCode so the
 * retry logic can treat it as transient.
 */

#include "Result.h"
#include "SocketGuard.h"
#include <cstddef>
#include <cstdint>
#include <string>

namespace NetLink {
namespace net {

/**
 * @brief Resolve host and connect, giving up after timeoutMs
 */
nlk::Result<nlk::SocketGuard> connectTcp(const std::string& host, int port, int timeoutMs);

/**
 * @brief Bind and listen on bindAddress:port (port 0 picks a free port)
 */
nlk::Result<nlk::SocketGuard> listenTcp(const std::string& bindAddress, int port, int backlog);

/// Apply SO_RCVTIMEO and SO_SNDTIMEO
bool setIoTimeouts(int fd, int timeoutMs);

/// Write the whole buffer or fail
nlk::Result<void> sendAll(int fd, const void* data, size_t length);

/// Read exactly length bytes or fail (ConnectionClosed on EOF)
nlk::Result<void> recvExact(int fd, void* data, size_t length);

/// Read at most length bytes, at least one (ConnectionClosed on EOF)
nlk::Result<size_t> recvSome(int fd, void* data, size_t length);

/// "ip:port" of the remote end, or "unknown"
std::string peerAddress(int fd);

/// Port the socket is bound to, -1 on error
int localPort(int fd);

} // namespace net
} // namespace NetLink
