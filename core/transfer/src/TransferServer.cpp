#include "TransferServer.h"
#include "SHA256.h"
#include "SocketIO.h"
#include <algorithm>
#include <arpa/inet.h>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <netinet/in.h>
#include <sys/select.h>
#include <sys/socket.h>

namespace fs = std::filesystem;

namespace NetLink {

TransferServer::TransferServer(ServerConfig config)
    : config_(std::move(config))
{
    if (config_.chunkSize == 0) {
        config_.chunkSize = nlk::config::NETWORK_CHUNK_SIZE;
    }
}

TransferServer::~TransferServer() {
    stop();
}

nlk::Result<void> TransferServer::start() {
    if (running_) {
        return nlk::Ok();
    }

    std::error_code ec;
    fs::create_directories(config_.outputRoot, ec);
    if (ec) {
        return nlk::Err(nlk::ErrorCode::DirectoryCreateFailed,
            "Cannot create output root " + config_.outputRoot + ": " + ec.message());
    }

    auto listener = net::listenTcp(config_.bindAddress, config_.port, nlk::config::TCP_BACKLOG);
    if (!listener) {
        logger_.log(LogLevel::ERROR, listener.error().message, "TransferServer");
        return listener.error();
    }
    listener_ = std::move(*listener);
    boundPort_ = net::localPort(listener_.get());

    running_ = true;
    acceptThread_ = std::thread(&TransferServer::acceptLoop, this);

    logger_.log(LogLevel::INFO, "Receiving on port " + std::to_string(boundPort_) +
                ", output root " + config_.outputRoot, "TransferServer");
    return nlk::Ok();
}

void TransferServer::stop() {
    bool wasRunning = running_.exchange(false);
    if (acceptThread_.joinable()) {
        acceptThread_.join();
    }
    listener_.reset();

    std::map<uint64_t, Connection> connections;
    {
        std::lock_guard<std::mutex> lock(connectionsMutex_);
        for (auto& [id, connection] : connections_) {
            if (connection.fd >= 0) {
                ::shutdown(connection.fd, SHUT_RDWR);
            }
        }
        connections.swap(connections_);
    }
    claimCv_.notify_all();

    for (auto& [id, connection] : connections) {
        if (connection.worker.joinable()) {
            connection.worker.join();
        }
    }

    if (wasRunning) {
        logger_.log(LogLevel::INFO, "Transfer server stopped", "TransferServer");
    }
}

void TransferServer::setCompletionCallback(CompletionCallback callback) {
    std::lock_guard<std::mutex> lock(callbackMutex_);
    completionCallback_ = std::move(callback);
}

void TransferServer::setProgressCallback(ProgressCallback callback) {
    std::lock_guard<std::mutex> lock(callbackMutex_);
    progressCallback_ = std::move(callback);
}

size_t TransferServer::activeConnections() const {
    std::lock_guard<std::mutex> lock(connectionsMutex_);
    return static_cast<size_t>(std::count_if(connections_.begin(), connections_.end(),
        [](const auto& item) { return !item.second.finished; }));
}

size_t TransferServer::cleanupPartialFiles(std::chrono::hours maxAge) const {
    std::error_code ec;
    if (!fs::is_directory(config_.outputRoot, ec)) {
        return 0;
    }

    const std::string suffix = nlk::config::PARTIAL_SUFFIX;
    const auto now = fs::file_time_type::clock::now();
    size_t removed = 0;

    fs::recursive_directory_iterator it(config_.outputRoot, ec);
    fs::recursive_directory_iterator end;
    for (; !ec && it != end; it.increment(ec)) {
        const auto& entry = *it;
        std::error_code entryError;
        if (!entry.is_regular_file(entryError)) continue;

        const std::string name = entry.path().filename().string();
        if (name.size() <= suffix.size() ||
            name.compare(name.size() - suffix.size(), suffix.size(), suffix) != 0) {
            continue;
        }

        auto modified = entry.last_write_time(entryError);
        if (entryError || now - modified < maxAge) continue;

        if (fs::remove(entry.path(), entryError)) {
            ++removed;
            logger_.log(LogLevel::INFO, "Removed stale partial file " + entry.path().string(), "TransferServer");
        }
    }
    return removed;
}

std::string TransferServer::destinationFor(const std::string& relativePath) const {
    return (fs::path(config_.outputRoot) / fs::path(relativePath)).string();
}

std::string TransferServer::partialPathFor(const std::string& destination) {
    return destination + nlk::config::PARTIAL_SUFFIX;
}

void TransferServer::acceptLoop() {
    while (running_) {
        reapFinished();

        fd_set readfds;
        FD_ZERO(&readfds);
        FD_SET(listener_.get(), &readfds);

        struct timeval tv;
        tv.tv_sec = nlk::config::ACCEPT_TICK_SEC;
        tv.tv_usec = 0;

        int activity = select(listener_.get() + 1, &readfds, NULL, NULL, &tv);
        if (activity <= 0) continue;

        struct sockaddr_in clientAddr;
        socklen_t len = sizeof(clientAddr);
        int clientSocket = accept(listener_.get(), (struct sockaddr*)&clientAddr, &len);
        if (clientSocket < 0) {
            if (running_) {
                logger_.log(LogLevel::WARN, "accept() failed: " + std::string(strerror(errno)), "TransferServer");
            }
            continue;
        }

        char clientIpBuf[INET_ADDRSTRLEN];
        inet_ntop(AF_INET, &(clientAddr.sin_addr), clientIpBuf, INET_ADDRSTRLEN);
        std::string peer = std::string(clientIpBuf) + ":" + std::to_string(ntohs(clientAddr.sin_port));

        logger_.log(LogLevel::INFO, "New connection from " + peer, "TransferServer");
        metrics_.incrementConnectionsAccepted();
        if (!net::setIoTimeouts(clientSocket, config_.ioTimeoutMs)) {
            logger_.log(LogLevel::WARN, "Cannot set timeouts for " + peer, "TransferServer");
        }

        std::lock_guard<std::mutex> lock(connectionsMutex_);
        uint64_t id = nextConnectionId_++;
        Connection& connection = connections_[id];
        connection.fd = clientSocket;
        connection.worker = std::thread(&TransferServer::handleConnection, this, id, clientSocket, peer);
    }
}

void TransferServer::reapFinished() {
    std::vector<std::thread> done;
    {
        std::lock_guard<std::mutex> lock(connectionsMutex_);
        for (auto it = connections_.begin(); it != connections_.end();) {
            if (it->second.finished) {
                done.push_back(std::move(it->second.worker));
                it = connections_.erase(it);
            } else {
                ++it;
            }
        }
    }
    for (auto& worker : done) {
        if (worker.joinable()) worker.join();
    }
}

void TransferServer::markFinished(uint64_t id) {
    std::lock_guard<std::mutex> lock(connectionsMutex_);
    auto it = connections_.find(id);
    if (it != connections_.end()) {
        it->second.fd = -1;
        it->second.finished = true;
    }
}

void TransferServer::handleConnection(uint64_t id, int fd, std::string peer) {
    nlk::SocketGuard sock(fd);

    CompletionRecord record;
    record.direction = TransferDirection::Receive;
    record.peerAddress = peer;
    record.startTime = std::chrono::system_clock::now();

    auto result = receiveSession(sock.get(), record);

    record.endTime = std::chrono::system_clock::now();
    record.success = result.ok();
    if (!result) {
        record.errorCode = result.error().code;
        record.errorMessage = result.error().message;
        if (result.error().category() == nlk::ErrorCategory::Protocol) {
            metrics_.incrementProtocolErrors();
        }
    }
    record.finalize();

    if (record.success) {
        metrics_.incrementTransfersCompleted();
        logger_.log(LogLevel::INFO, record.summary(), "TransferServer");
    } else {
        metrics_.incrementTransfersFailed();
        logger_.log(LogLevel::WARN, record.summary(), "TransferServer");
    }

    // Withdraw the fd before the guard closes it so stop() never touches a reused descriptor
    markFinished(id);
    sock.reset();

    emitCompletion(record);
}

nlk::Result<void> TransferServer::receiveSession(int fd, CompletionRecord& record) {
    auto reader = FrameCodec::socketReader(fd);

    auto decoded = FrameCodec::decodeRequest(reader);
    if (!decoded) {
        logger_.log(LogLevel::WARN, "Handshake from " + record.peerAddress + " failed: " +
                    decoded.error().message, "TransferServer");
        return decoded.error();
    }
    const HandshakeRequest& request = *decoded;
    record.protocol = request.variant;
    record.totalBytes = request.totalBytes();

    std::vector<std::string> destinations;
    destinations.reserve(request.entries.size());
    for (const auto& entry : request.entries) {
        record.files.push_back(entry.path);
        destinations.push_back(destinationFor(entry.path));
    }

    logger_.log(LogLevel::INFO, "Incoming " + std::string(protocolVariantToString(request.variant)) +
                " transfer from " + record.peerAddress + ": " + std::to_string(request.entries.size()) +
                " file(s), " + formatSize(record.totalBytes), "TransferServer");

    if (!claimPaths(destinations, std::chrono::milliseconds(config_.ioTimeoutMs))) {
        return nlk::Err(nlk::ErrorCode::ConnectionTimeout,
            "Destination still in use by another session");
    }
    struct ClaimRelease {
        TransferServer& server;
        const std::vector<std::string>& paths;
        ~ClaimRelease() { server.releasePaths(paths); }
    } release{*this, destinations};

    auto parents = prepareParents(destinations);
    std::vector<uint64_t> offsets(request.entries.size(), 0);

    if (request.variant == ProtocolVariant::Resumable) {
        nlk::Result<std::vector<uint64_t>> negotiated = parents.ok()
            ? negotiateOffsets(request, destinations)
            : nlk::Result<std::vector<uint64_t>>(parents.error());

        HandshakeReply reply;
        if (!negotiated) {
            reply.accepted = false;
            reply.reason = negotiated.error().message;
        } else {
            reply.offsets = *negotiated;
        }
        auto frame = FrameCodec::encodeReply(reply);
        auto sent = net::sendAll(fd, frame.data(), frame.size());
        if (!negotiated) return negotiated.error();
        if (!sent) return sent;
        offsets = *negotiated;
    } else if (!parents) {
        return parents;
    }

    SessionProgress progress;
    progress.total = record.totalBytes;
    for (uint64_t offset : offsets) {
        progress.done += offset;
        record.resumedBytes += offset;
    }
    if (record.resumedBytes > 0) {
        metrics_.addBytesResumed(record.resumedBytes);
    }

    for (size_t i = 0; i < request.entries.size(); ++i) {
        auto received = receiveFile(fd, request, i, destinations[i], offsets[i], progress, record);
        if (!received) return received;
    }
    return nlk::Ok();
}

nlk::Result<std::vector<uint64_t>> TransferServer::negotiateOffsets(const HandshakeRequest& request,
                                                                    const std::vector<std::string>& destinations) {
    std::vector<uint64_t> offsets;
    offsets.reserve(request.entries.size());

    for (size_t i = 0; i < request.entries.size(); ++i) {
        const ManifestEntry& entry = request.entries[i];
        const std::string partial = partialPathFor(destinations[i]);

        std::error_code ec;
        uint64_t existing = 0;
        if (fs::is_regular_file(partial, ec)) {
            existing = fs::file_size(partial, ec);
            if (ec) existing = 0;
        }

        // A zero request means the sender wants a fresh copy
        if (entry.offset == 0 || existing > entry.size) {
            if (existing > 0) {
                logger_.log(LogLevel::DEBUG, "Discarding partial " + partial, "TransferServer");
            }
            fs::remove(partial, ec);
            offsets.push_back(0);
            continue;
        }

        uint64_t acknowledged = std::min({existing, entry.offset, entry.size});
        if (acknowledged < existing) {
            fs::resize_file(partial, acknowledged, ec);
            if (ec) {
                return nlk::Err<std::vector<uint64_t>>(nlk::ErrorCode::FileWriteError,
                    "Cannot truncate " + partial + ": " + ec.message());
            }
        }
        if (acknowledged > 0) {
            logger_.log(LogLevel::INFO, "Resuming " + entry.path + " at " + formatSize(acknowledged),
                        "TransferServer");
        }
        offsets.push_back(acknowledged);
    }
    return nlk::Ok(std::move(offsets));
}

nlk::Result<void> TransferServer::prepareParents(const std::vector<std::string>& destinations) {
    for (const auto& destination : destinations) {
        fs::path parent = fs::path(destination).parent_path();
        if (parent.empty()) continue;
        std::error_code ec;
        fs::create_directories(parent, ec);
        if (ec) {
            logger_.log(LogLevel::ERROR, "Cannot create " + parent.string() + ": " + ec.message(), "TransferServer");
            return nlk::Err(nlk::ErrorCode::DirectoryCreateFailed,
                "Cannot create " + parent.string() + ": " + ec.message());
        }
    }
    return nlk::Ok();
}

nlk::Result<void> TransferServer::receiveFile(int fd, const HandshakeRequest& request, size_t index,
                                              const std::string& destination, uint64_t offset,
                                              SessionProgress& progress, CompletionRecord& record) {
    const ManifestEntry& entry = request.entries[index];
    const bool resumable = request.variant == ProtocolVariant::Resumable;
    const std::string target = resumable ? partialPathFor(destination) : destination;

    std::ios::openmode mode = std::ios::binary | std::ios::out;
    mode |= (resumable && offset > 0) ? std::ios::app : std::ios::trunc;
    std::ofstream out(target, mode);
    if (!out) {
        sendStatus(fd, false);
        return nlk::Err(nlk::ErrorCode::FileWriteError, "Cannot open " + target + " for writing");
    }

    std::vector<char> buffer(config_.chunkSize);
    uint64_t remaining = entry.size - offset;
    while (remaining > 0) {
        size_t want = static_cast<size_t>(std::min<uint64_t>(buffer.size(), remaining));
        auto got = net::recvSome(fd, buffer.data(), want);
        if (!got) {
            out.flush();
            logger_.log(LogLevel::WARN, "Connection lost in " + entry.path + " with " +
                        formatSize(remaining) + " missing", "TransferServer");
            return nlk::Error{got.error().code, got.error().message + " while receiving " + entry.path};
        }

        out.write(buffer.data(), static_cast<std::streamsize>(*got));
        if (!out) {
            sendStatus(fd, false);
            return nlk::Err(nlk::ErrorCode::FileWriteError, "Write to " + target + " failed");
        }

        remaining -= *got;
        progress.done += *got;
        record.bytesTransferred += *got;
        metrics_.addBytesReceived(*got);
    }

    out.close();
    if (!out) {
        sendStatus(fd, false);
        return nlk::Err(nlk::ErrorCode::FileWriteError, "Closing " + target + " failed");
    }

    if (resumable) {
        if (config_.verifyChecksums) {
            SHA256::Digest digest{};
            if (!SHA256::hashFile(target, digest)) {
                sendStatus(fd, false);
                return nlk::Err(nlk::ErrorCode::FileReadError, "Cannot hash " + target);
            }
            if (digest != entry.digest) {
                std::error_code ec;
                fs::remove(target, ec);
                sendStatus(fd, false);
                logger_.log(LogLevel::ERROR, "Checksum mismatch for " + entry.path + ": expected " +
                            SHA256::toHex(entry.digest) + ", got " + SHA256::toHex(digest), "TransferServer");
                return nlk::Err(nlk::ErrorCode::ChecksumMismatch, "Checksum mismatch for " + entry.path);
            }
        }

        std::error_code ec;
        fs::rename(target, destination, ec);
        if (ec) {
            sendStatus(fd, false);
            return nlk::Err(nlk::ErrorCode::FileWriteError,
                "Cannot rename " + target + ": " + ec.message());
        }
    }

    metrics_.incrementFilesReceived();
    logger_.log(LogLevel::DEBUG, "Received " + entry.path + " (" + formatSize(entry.size) + ")", "TransferServer");
    sendStatus(fd, true);
    emitProgress(progress.done, progress.total, entry.path);
    return nlk::Ok();
}

bool TransferServer::claimPaths(const std::vector<std::string>& paths, std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(claimMutex_);
    bool free = claimCv_.wait_for(lock, timeout, [&] {
        if (!running_) return true;
        return std::none_of(paths.begin(), paths.end(), [&](const std::string& path) {
            return claimedPaths_.count(path) > 0;
        });
    });
    if (!free || !running_) {
        return false;
    }
    claimedPaths_.insert(paths.begin(), paths.end());
    return true;
}

void TransferServer::releasePaths(const std::vector<std::string>& paths) {
    {
        std::lock_guard<std::mutex> lock(claimMutex_);
        for (const auto& path : paths) {
            claimedPaths_.erase(path);
        }
    }
    claimCv_.notify_all();
}

void TransferServer::sendStatus(int fd, bool ok) {
    auto status = FrameCodec::encodeStatus(ok);
    auto sent = net::sendAll(fd, status.data(), status.size());
    if (!sent) {
        logger_.log(LogLevel::DEBUG, "Status not delivered: " + sent.error().message, "TransferServer");
    }
}

void TransferServer::emitCompletion(const CompletionRecord& record) {
    CompletionCallback callback;
    {
        std::lock_guard<std::mutex> lock(callbackMutex_);
        callback = completionCallback_;
    }
    if (callback) {
        callback(record);
    }
}

void TransferServer::emitProgress(uint64_t done, uint64_t total, const std::string& file) {
    ProgressCallback callback;
    {
        std::lock_guard<std::mutex> lock(callbackMutex_);
        callback = progressCallback_;
    }
    if (callback) {
        callback(done, total, file);
    }
}

} // namespace NetLink
