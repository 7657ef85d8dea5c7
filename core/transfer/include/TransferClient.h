#pragma once

#include "Constants.h"
#include "FrameCodec.h"
#include "Logger.h"
#include "MetricsCollector.h"
#include "PauseGate.h"
#include "Result.h"
#include "RetryController.h"
#include "SocketGuard.h"
#include "TransferTypes.h"
#include <atomic>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

namespace NetLink {

struct ClientOptions {
    ProtocolVariant protocol{ProtocolVariant::Resumable};
    size_t chunkSize{nlk::config::NETWORK_CHUNK_SIZE};
    int connectTimeoutMs{nlk::config::CONNECT_TIMEOUT_MS};
    int ioTimeoutMs{nlk::config::IO_TIMEOUT_MS};
    RetryPolicy retry;
    /// Ask the receiver to continue from its partial files on the first attempt
    bool resumePartial{true};
};

/**
 * @brief Outcome of a successful logical transfer
 */
struct SendSummary {
    std::vector<std::string> files;
    uint64_t totalBytes{0};
    uint64_t bytesSent{0};      // file bytes written to sockets, every attempt
    uint64_t resumedBytes{0};   // acknowledged by the receiver on the last attempt
    int attempts{0};
};

/**
 * @brief Sender side of the transfer protocol
 *
 * Every send call builds a manifest, then runs one connection per attempt
 * under the RetryController. Chunks are written in manifest order and the
 * PauseGate is consulted before each write. The completion callback fires
 * exactly once per send call.
 */
class TransferClient {
public:
    TransferClient(std::string host, int port, ClientOptions options = ClientOptions{});
    ~TransferClient();

    TransferClient(const TransferClient&) = delete;
    TransferClient& operator=(const TransferClient&) = delete;

    nlk::Result<SendSummary> sendSingleFile(const std::string& path, ProgressCallback progress = nullptr);
    nlk::Result<SendSummary> sendMultipleFiles(const std::vector<std::string>& paths,
                                               ProgressCallback progress = nullptr);
    nlk::Result<SendSummary> sendDirectory(const std::string& root, ProgressCallback progress = nullptr);

    /// Dispatch to sendDirectory or sendSingleFile depending on what path is
    nlk::Result<SendSummary> sendPath(const std::string& path, ProgressCallback progress = nullptr);

    void pause();
    void resume();
    bool isPaused() const;
    PauseGate& pauseGate() { return gate_; }

    /**
     * @brief Close the live connection; the attempt fails with a connection error and is retried
     */
    void dropConnection();

    /// Stop for good: releases the pause gate and closes the live connection
    void cancel();

    TransferState state() const;
    TransferSession session() const;

    void setCompletionCallback(CompletionCallback callback);
    void setRetryObserver(RetryController::RetryObserver observer);

    /// Replace the backoff sleep (simulated time)
    void setSleeper(RetryController::Sleeper sleeper);

    const ClientOptions& options() const { return options_; }

    /**
     * @brief Regular files below root, paths relative to prefix, symlinks skipped, sorted
     */
    static nlk::Result<std::vector<FileEntry>> enumerateDirectory(const std::string& root,
                                                                  const std::string& prefix = "");

private:
    using ManifestBuilder = std::function<nlk::Result<std::vector<FileEntry>>()>;

    struct AttemptStats {
        uint64_t bytesSent{0};
        uint64_t resumedBytes{0};
    };

    std::string host_;
    int port_;
    ClientOptions options_;
    PauseGate gate_;
    std::atomic<bool> cancelled_{false};

    mutable std::mutex mutex_;
    TransferSession session_;
    int liveSocket_{-1};
    CompletionCallback completionCallback_;
    RetryController::RetryObserver retryObserver_;
    RetryController::Sleeper sleeper_;

    Logger& logger_ = Logger::instance();
    MetricsCollector& metrics_ = MetricsCollector::instance();

    nlk::Result<SendSummary> runTransfer(const std::string& label, const ManifestBuilder& builder,
                                         const ProgressCallback& progress);

    nlk::Result<void> attemptSession(const HandshakeRequest& request,
                                     const std::vector<FileEntry>& files,
                                     int attempt,
                                     const ProgressCallback& progress,
                                     AttemptStats& stats);

    nlk::Result<void> streamFile(int fd, const FileEntry& file, uint64_t offset,
                                 const ProgressCallback& progress, AttemptStats& stats);

    static nlk::Result<FileEntry> statRegularFile(const std::string& path, const std::string& relativePath);

    void setState(TransferState state);
    void setLiveSocket(int fd);
    void emitCompletion(const CompletionRecord& record);
};

} // namespace NetLink
