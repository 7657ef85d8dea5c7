#pragma once

#include "Constants.h"
#include "FrameCodec.h"
#include "Logger.h"
#include "MetricsCollector.h"
#include "Result.h"
#include "SocketGuard.h"
#include "TransferTypes.h"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <map>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>

namespace NetLink {

struct ServerConfig {
    int port{nlk::config::DEFAULT_TCP_PORT};
    std::string bindAddress{"0.0.0.0"};
    std::string outputRoot{"received"};
    int ioTimeoutMs{nlk::config::IO_TIMEOUT_MS};
    size_t chunkSize{nlk::config::NETWORK_CHUNK_SIZE};
    /// Compare resumable files against the sender's SHA-256 before renaming them
    bool verifyChecksums{true};
};

/**
 * @brief Receiver side of the transfer protocol
 *
 * An accept thread polls the listener once per tick; each connection is
 * served by its own handler thread. Every session ends with exactly one
 * completion callback, successful or not.
 */
class TransferServer {
public:
    explicit TransferServer(ServerConfig config);
    ~TransferServer();

    TransferServer(const TransferServer&) = delete;
    TransferServer& operator=(const TransferServer&) = delete;

    nlk::Result<void> start();

    /// Close the listener and live connections, join every thread
    void stop();

    bool isRunning() const { return running_; }

    /// Port actually bound, useful when configured with port 0
    int port() const { return boundPort_; }

    void setCompletionCallback(CompletionCallback callback);
    void setProgressCallback(ProgressCallback callback);

    size_t activeConnections() const;

    /**
     * @brief Delete *.partial files under the output root older than maxAge
     * @return number of files removed
     */
    size_t cleanupPartialFiles(std::chrono::hours maxAge) const;

    const ServerConfig& config() const { return config_; }

    /// Final on-disk location of a relative manifest path
    std::string destinationFor(const std::string& relativePath) const;

    static std::string partialPathFor(const std::string& destination);

private:
    struct Connection {
        std::thread worker;
        int fd{-1};
        bool finished{false};
    };

    struct SessionProgress {
        uint64_t done{0};
        uint64_t total{0};
    };

    ServerConfig config_;
    nlk::SocketGuard listener_;
    std::atomic<bool> running_{false};
    int boundPort_{-1};
    std::thread acceptThread_;

    mutable std::mutex connectionsMutex_;
    std::map<uint64_t, Connection> connections_;
    uint64_t nextConnectionId_{1};

    std::mutex claimMutex_;
    std::condition_variable claimCv_;
    std::set<std::string> claimedPaths_;

    std::mutex callbackMutex_;
    CompletionCallback completionCallback_;
    ProgressCallback progressCallback_;

    Logger& logger_ = Logger::instance();
    MetricsCollector& metrics_ = MetricsCollector::instance();

    void acceptLoop();
    void reapFinished();
    void handleConnection(uint64_t id, int fd, std::string peer);
    void markFinished(uint64_t id);

    nlk::Result<void> receiveSession(int fd, CompletionRecord& record);

    nlk::Result<std::vector<uint64_t>> negotiateOffsets(const HandshakeRequest& request,
                                                        const std::vector<std::string>& destinations);

    nlk::Result<void> receiveFile(int fd, const HandshakeRequest& request, size_t index,
                                  const std::string& destination, uint64_t offset,
                                  SessionProgress& progress, CompletionRecord& record);

    nlk::Result<void> prepareParents(const std::vector<std::string>& destinations);

    /// Serialize sessions writing the same destination (e.g. a retry racing its dying predecessor)
    bool claimPaths(const std::vector<std::string>& paths, std::chrono::milliseconds timeout);
    void releasePaths(const std::vector<std::string>& paths);

    void sendStatus(int fd, bool ok);
    void emitCompletion(const CompletionRecord& record);
    void emitProgress(uint64_t done, uint64_t total, const std::string& file);
};

} // namespace NetLink
