#include "TransferClient.h"
#include "SHA256.h"
#include "SocketIO.h"
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <set>
#include <sys/socket.h>

namespace fs = std::filesystem;

namespace NetLink {

TransferClient::TransferClient(std::string host, int port, ClientOptions options)
    : host_(std::move(host))
    , port_(port)
    , options_(options)
{
    if (options_.chunkSize == 0) {
        options_.chunkSize = nlk::config::NETWORK_CHUNK_SIZE;
    }
    session_.direction = TransferDirection::Send;
}

TransferClient::~TransferClient() {
    cancel();
}

nlk::Result<SendSummary> TransferClient::sendSingleFile(const std::string& path, ProgressCallback progress) {
    return runTransfer(path, [path]() -> nlk::Result<std::vector<FileEntry>> {
        auto entry = statRegularFile(path, fs::path(path).filename().string());
        if (!entry) return entry.error();
        return nlk::Ok(std::vector<FileEntry>{std::move(*entry)});
    }, progress);
}

nlk::Result<SendSummary> TransferClient::sendMultipleFiles(const std::vector<std::string>& paths,
                                                           ProgressCallback progress) {
    const std::string label = std::to_string(paths.size()) + " path(s)";
    return runTransfer(label, [paths]() -> nlk::Result<std::vector<FileEntry>> {
        std::vector<FileEntry> files;
        std::set<std::string> seen;
        for (const auto& path : paths) {
            std::error_code ec;
            fs::path source(path);
            std::vector<FileEntry> expanded;
            if (fs::is_directory(source, ec)) {
                fs::path trimmed = source.has_filename() ? source : source.parent_path();
                auto listing = enumerateDirectory(path, trimmed.filename().string());
                if (!listing) return listing.error();
                expanded = std::move(*listing);
            } else {
                auto entry = statRegularFile(path, source.filename().string());
                if (!entry) return entry.error();
                expanded.push_back(std::move(*entry));
            }
            for (auto& entry : expanded) {
                if (!seen.insert(entry.relativePath).second) {
                    return nlk::Err<std::vector<FileEntry>>(nlk::ErrorCode::InvalidArgument,
                        "Two sources map to the same name: " + entry.relativePath);
                }
                files.push_back(std::move(entry));
            }
        }
        return nlk::Ok(std::move(files));
    }, progress);
}

nlk::Result<SendSummary> TransferClient::sendDirectory(const std::string& root, ProgressCallback progress) {
    return runTransfer(root, [root]() {
        return enumerateDirectory(root);
    }, progress);
}

nlk::Result<SendSummary> TransferClient::sendPath(const std::string& path, ProgressCallback progress) {
    std::error_code ec;
    if (fs::is_directory(path, ec)) {
        return sendDirectory(path, std::move(progress));
    }
    return sendSingleFile(path, std::move(progress));
}

void TransferClient::pause() {
    gate_.pause();
    std::lock_guard<std::mutex> lock(mutex_);
    session_.pauseRequested = true;
}

void TransferClient::resume() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        session_.pauseRequested = false;
    }
    gate_.resume();
}

bool TransferClient::isPaused() const {
    return gate_.isPaused();
}

void TransferClient::dropConnection() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (liveSocket_ >= 0) {
        logger_.log(LogLevel::WARN, "Closing live connection to " + host_, "TransferClient");
        ::shutdown(liveSocket_, SHUT_RDWR);
    }
}

void TransferClient::cancel() {
    cancelled_ = true;
    gate_.close();
    dropConnection();
}

TransferState TransferClient::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return session_.state;
}

TransferSession TransferClient::session() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return session_;
}

void TransferClient::setCompletionCallback(CompletionCallback callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    completionCallback_ = std::move(callback);
}

void TransferClient::setRetryObserver(RetryController::RetryObserver observer) {
    std::lock_guard<std::mutex> lock(mutex_);
    retryObserver_ = std::move(observer);
}

void TransferClient::setSleeper(RetryController::Sleeper sleeper) {
    std::lock_guard<std::mutex> lock(mutex_);
    sleeper_ = std::move(sleeper);
}

nlk::Result<std::vector<FileEntry>> TransferClient::enumerateDirectory(const std::string& root,
                                                                       const std::string& prefix) {
    std::error_code ec;
    if (!fs::exists(root, ec)) {
        return nlk::Err<std::vector<FileEntry>>(nlk::ErrorCode::DirectoryNotFound,
            "Directory not found: " + root);
    }
    if (!fs::is_directory(root, ec)) {
        return nlk::Err<std::vector<FileEntry>>(nlk::ErrorCode::DirectoryNotFound,
            "Not a directory: " + root);
    }

    std::vector<FileEntry> files;
    fs::recursive_directory_iterator it(root, fs::directory_options::none, ec);
    if (ec) {
        return nlk::Err<std::vector<FileEntry>>(nlk::ErrorCode::FileAccessDenied,
            "Cannot list " + root + ": " + ec.message());
    }

    fs::recursive_directory_iterator end;
    for (; it != end; it.increment(ec)) {
        if (ec) {
            return nlk::Err<std::vector<FileEntry>>(nlk::ErrorCode::FileAccessDenied,
                "Cannot list " + root + ": " + ec.message());
        }
        const auto& entry = *it;
        std::error_code entryError;
        // Symlinks are never followed nor sent
        if (entry.is_symlink(entryError) || !entry.is_regular_file(entryError)) {
            continue;
        }

        std::string relative = fs::relative(entry.path(), root, entryError).generic_string();
        if (entryError || relative.empty()) {
            continue;
        }
        if (!prefix.empty()) {
            relative = prefix + "/" + relative;
        }

        FileEntry file;
        file.relativePath = relative;
        file.localPath = entry.path().string();
        file.size = entry.file_size(entryError);
        if (entryError) {
            return nlk::Err<std::vector<FileEntry>>(nlk::ErrorCode::FileReadError,
                "Cannot stat " + file.localPath + ": " + entryError.message());
        }
        files.push_back(std::move(file));
    }
    if (ec) {
        return nlk::Err<std::vector<FileEntry>>(nlk::ErrorCode::FileAccessDenied,
            "Cannot list " + root + ": " + ec.message());
    }

    std::sort(files.begin(), files.end(), [](const FileEntry& a, const FileEntry& b) {
        return a.relativePath < b.relativePath;
    });
    return nlk::Ok(std::move(files));
}

nlk::Result<FileEntry> TransferClient::statRegularFile(const std::string& path, const std::string& relativePath) {
    std::error_code ec;
    auto status = fs::status(path, ec);
    if (ec || !fs::exists(status)) {
        return nlk::Err<FileEntry>(nlk::ErrorCode::FileNotFound, "File not found: " + path);
    }
    if (!fs::is_regular_file(status)) {
        return nlk::Err<FileEntry>(nlk::ErrorCode::NotARegularFile, "Not a regular file: " + path);
    }

    std::ifstream probe(path, std::ios::binary);
    if (!probe) {
        return nlk::Err<FileEntry>(nlk::ErrorCode::FileAccessDenied, "Cannot open " + path);
    }

    FileEntry entry;
    entry.relativePath = relativePath;
    entry.localPath = path;
    entry.size = fs::file_size(path, ec);
    if (ec) {
        return nlk::Err<FileEntry>(nlk::ErrorCode::FileReadError, "Cannot stat " + path + ": " + ec.message());
    }
    return nlk::Ok(std::move(entry));
}

nlk::Result<SendSummary> TransferClient::runTransfer(const std::string& label, const ManifestBuilder& builder,
                                                     const ProgressCallback& progress) {
    CompletionRecord record;
    record.direction = TransferDirection::Send;
    record.protocol = options_.protocol;
    record.peerAddress = host_ + ":" + std::to_string(port_);
    record.startTime = std::chrono::system_clock::now();

    RetryController::Sleeper sleeper;
    RetryController::RetryObserver observer;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        session_ = TransferSession{};
        session_.direction = TransferDirection::Send;
        sleeper = sleeper_;
        observer = retryObserver_;
    }

    logger_.log(LogLevel::INFO, "Sending " + label + " to " + record.peerAddress +
                " [" + protocolVariantToString(options_.protocol) + "]", "TransferClient");

    HandshakeRequest request;
    request.variant = options_.protocol;
    std::vector<FileEntry> files;
    bool prepared = false;
    uint64_t bytesSent = 0;
    uint64_t resumedBytes = 0;

    // The manifest is built inside the first attempt so local failures count as one
    auto prepare = [&]() -> nlk::Result<void> {
        auto manifest = builder();
        if (!manifest) return manifest.error();
        files = std::move(*manifest);

        if (files.empty()) {
            return nlk::Err(nlk::ErrorCode::InvalidArgument, "Nothing to send in " + label);
        }
        if (files.size() > nlk::config::MAX_FILE_COUNT) {
            return nlk::Err(nlk::ErrorCode::InvalidArgument, "Too many files: " + std::to_string(files.size()));
        }
        if (options_.protocol == ProtocolVariant::LegacySingle && files.size() != 1) {
            return nlk::Err(nlk::ErrorCode::InvalidArgument,
                "Legacy protocol carries exactly one file, got " + std::to_string(files.size()));
        }

        for (const auto& file : files) {
            auto pathCheck = FrameCodec::validateRelativePath(file.relativePath);
            if (!pathCheck) return pathCheck;

            ManifestEntry entry;
            entry.path = file.relativePath;
            entry.size = file.size;
            if (options_.protocol == ProtocolVariant::Resumable &&
                !SHA256::hashFile(file.localPath, entry.digest)) {
                return nlk::Err(nlk::ErrorCode::FileReadError, "Cannot hash " + file.localPath);
            }
            request.entries.push_back(std::move(entry));
        }

        std::lock_guard<std::mutex> lock(mutex_);
        session_.files = files;
        session_.totalBytes = request.totalBytes();
        return nlk::Ok();
    };

    RetryController retry(options_.retry, sleeper);
    retry.setRetryObserver(observer);

    std::function<nlk::Result<void>(int)> attempt = [&](int number) -> nlk::Result<void> {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            session_.attemptCount = number;
        }
        if (cancelled_) {
            return nlk::Err(nlk::ErrorCode::Cancelled, "Transfer cancelled");
        }
        if (!prepared) {
            auto ready = prepare();
            if (!ready) return ready;
            prepared = true;
        }

        // Retries always ask the receiver to continue from what it holds
        const bool resume = number > 1 || options_.resumePartial;
        for (auto& entry : request.entries) {
            entry.offset = resume ? entry.size : 0;
        }

        AttemptStats stats;
        auto result = attemptSession(request, files, number, progress, stats);
        bytesSent += stats.bytesSent;
        resumedBytes = stats.resumedBytes;
        if (!result && cancelled_) {
            return nlk::Err(nlk::ErrorCode::Cancelled, "Transfer cancelled");
        }
        return result;
    };

    auto outcome = retry.run<void>(attempt);

    record.endTime = std::chrono::system_clock::now();
    for (const auto& file : files) {
        record.files.push_back(file.relativePath);
    }
    record.totalBytes = request.totalBytes();
    record.bytesTransferred = bytesSent;
    record.resumedBytes = resumedBytes;
    record.attempts = retry.attempts();
    record.success = outcome.ok();
    if (!outcome) {
        record.errorCode = outcome.error().code;
        record.errorMessage = outcome.error().message;
    }
    record.finalize();

    if (outcome) {
        setState(TransferState::Completed);
        metrics_.incrementTransfersCompleted();
        logger_.log(LogLevel::INFO, record.summary(), "TransferClient");
    } else {
        setState(TransferState::Failed);
        metrics_.incrementTransfersFailed();
        logger_.log(LogLevel::ERROR, record.summary(), "TransferClient");
    }

    emitCompletion(record);

    if (!outcome) {
        return outcome.error();
    }

    SendSummary summary;
    summary.files = record.files;
    summary.totalBytes = record.totalBytes;
    summary.bytesSent = bytesSent;
    summary.resumedBytes = resumedBytes;
    summary.attempts = record.attempts;
    return nlk::Ok(std::move(summary));
}

nlk::Result<void> TransferClient::attemptSession(const HandshakeRequest& request,
                                                 const std::vector<FileEntry>& files,
                                                 int attempt,
                                                 const ProgressCallback& progress,
                                                 AttemptStats& stats) {
    setState(TransferState::Connecting);
    logger_.log(LogLevel::DEBUG, "Attempt " + std::to_string(attempt) + ": connecting to " +
                host_ + ":" + std::to_string(port_), "TransferClient");

    auto connected = net::connectTcp(host_, port_, options_.connectTimeoutMs);
    if (!connected) {
        return connected.error();
    }
    nlk::SocketGuard sock = std::move(*connected);
    if (!net::setIoTimeouts(sock.get(), options_.ioTimeoutMs)) {
        logger_.log(LogLevel::WARN, "Cannot set socket timeouts", "TransferClient");
    }
    metrics_.incrementConnectionsOpened();

    // Publish the fd for dropConnection(), withdraw it before the guard closes it
    struct LiveSocket {
        TransferClient& client;
        LiveSocket(TransferClient& c, int fd) : client(c) { client.setLiveSocket(fd); }
        ~LiveSocket() { client.setLiveSocket(-1); }
    } live(*this, sock.get());

    if (cancelled_) {
        return nlk::Err(nlk::ErrorCode::Cancelled, "Transfer cancelled");
    }

    setState(TransferState::Handshake);
    auto frame = FrameCodec::encodeRequest(request);
    auto sent = net::sendAll(sock.get(), frame.data(), frame.size());
    if (!sent) return sent;

    auto reader = FrameCodec::socketReader(sock.get());
    std::vector<uint64_t> offsets(files.size(), 0);
    if (request.variant == ProtocolVariant::Resumable) {
        auto reply = FrameCodec::decodeReply(reader);
        if (!reply) return reply.error();
        auto valid = FrameCodec::validateReply(request, *reply);
        if (!valid) {
            metrics_.incrementProtocolErrors();
            return valid;
        }
        offsets = reply->offsets;
    }

    uint64_t resumed = 0;
    for (uint64_t offset : offsets) {
        resumed += offset;
    }
    stats.resumedBytes = resumed;
    if (resumed > 0) {
        metrics_.addBytesResumed(resumed);
        logger_.log(LogLevel::INFO, "Receiver already holds " + formatSize(resumed) + ", resuming",
                    "TransferClient");
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        session_.bytesTransferred = resumed;
    }

    setState(TransferState::Sending);
    for (size_t i = 0; i < files.size(); ++i) {
        auto streamed = streamFile(sock.get(), files[i], offsets[i], progress, stats);
        if (!streamed) return streamed;

        auto status = FrameCodec::decodeStatus(reader);
        if (!status) {
            if (status.error().code == nlk::ErrorCode::TransferRejected) {
                return nlk::Err(nlk::ErrorCode::TransferRejected,
                    "Receiver rejected " + files[i].relativePath);
            }
            return status;
        }
        logger_.log(LogLevel::DEBUG, "Receiver confirmed " + files[i].relativePath, "TransferClient");
    }

    return nlk::Ok();
}

nlk::Result<void> TransferClient::streamFile(int fd, const FileEntry& file, uint64_t offset,
                                             const ProgressCallback& progress, AttemptStats& stats) {
    std::ifstream in(file.localPath, std::ios::binary);
    if (!in) {
        return nlk::Err(nlk::ErrorCode::FileReadError, "Cannot open " + file.localPath);
    }
    if (offset > 0) {
        in.seekg(static_cast<std::streamoff>(offset));
        if (!in) {
            return nlk::Err(nlk::ErrorCode::FileReadError, "Cannot seek in " + file.localPath);
        }
    }

    std::vector<char> buffer(options_.chunkSize);
    uint64_t remaining = file.size - offset;
    while (remaining > 0) {
        size_t want = static_cast<size_t>(std::min<uint64_t>(buffer.size(), remaining));
        in.read(buffer.data(), static_cast<std::streamsize>(want));
        if (static_cast<size_t>(in.gcount()) != want) {
            return nlk::Err(nlk::ErrorCode::FileReadError,
                "Short read from " + file.localPath + " (file changed while sending?)");
        }

        if (gate_.isPaused()) {
            setState(TransferState::Paused);
            logger_.log(LogLevel::INFO, "Paused in " + file.relativePath, "TransferClient");
            if (!gate_.waitIfPaused()) {
                return nlk::Err(nlk::ErrorCode::Cancelled, "Transfer cancelled while paused");
            }
            logger_.log(LogLevel::INFO, "Resumed in " + file.relativePath, "TransferClient");
            setState(TransferState::Sending);
        }

        auto sent = net::sendAll(fd, buffer.data(), want);
        if (!sent) return sent;

        remaining -= want;
        stats.bytesSent += want;
        metrics_.addBytesSent(want);

        uint64_t done;
        uint64_t total;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            session_.bytesTransferred += want;
            done = session_.bytesTransferred;
            total = session_.totalBytes;
        }
        if (progress) {
            progress(done, total, file.relativePath);
        }
    }
    return nlk::Ok();
}

void TransferClient::setState(TransferState state) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (session_.state != state) {
        logger_.log(LogLevel::DEBUG, std::string(transferStateToString(session_.state)) + " -> " +
                    transferStateToString(state), "TransferClient");
        session_.state = state;
    }
}

void TransferClient::setLiveSocket(int fd) {
    std::lock_guard<std::mutex> lock(mutex_);
    liveSocket_ = fd;
}

void TransferClient::emitCompletion(const CompletionRecord& record) {
    CompletionCallback callback;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        callback = completionCallback_;
    }
    if (callback) {
        callback(record);
    }
}

} // namespace NetLink
