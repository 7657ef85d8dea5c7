#pragma once

#include "Result.h"
#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace NetLink {

/**
 * @brief Wire variants, selected by the leading magic of a request
 */
enum class ProtocolVariant {
    LegacySingle,
    Multi,
    Resumable
};

enum class TransferDirection {
    Send,
    Receive
};

/**
 * @brief Sender state machine
 *
 * IDLE -> CONNECTING -> HANDSHAKE -> SENDING <-> PAUSED -> COMPLETED | FAILED
 */
enum class TransferState {
    Idle,
    Connecting,
    Handshake,
    Sending,
    Paused,
    Completed,
    Failed
};

const char* protocolVariantToString(ProtocolVariant variant);
const char* transferStateToString(TransferState state);
const char* transferDirectionToString(TransferDirection direction);

uint32_t magicForVariant(ProtocolVariant variant);
std::optional<ProtocolVariant> variantFromMagic(uint32_t magic);

/**
 * @brief One file of a transfer
 *
 * relativePath always uses '/' separators. localPath is the source on the
 * sender and the final destination on the receiver.
 */
struct FileEntry {
    std::string relativePath;
    std::string localPath;
    uint64_t size{0};
};

/**
 * @brief Live state of one connection, owned by its client or handler
 */
struct TransferSession {
    TransferDirection direction{TransferDirection::Send};
    std::vector<FileEntry> files;
    uint64_t totalBytes{0};
    uint64_t bytesTransferred{0};
    TransferState state{TransferState::Idle};
    bool pauseRequested{false};
    int attemptCount{0};
};

/**
 * @brief Called by the sender after each chunk and by the receiver after each file
 */
using ProgressCallback = std::function<void(uint64_t bytesDone,
                                            uint64_t bytesTotal,
                                            const std::string& currentFile)>;

/**
 * @brief Emitted exactly once per session, consumed by history/notification code
 */
struct CompletionRecord {
    TransferDirection direction{TransferDirection::Send};
    ProtocolVariant protocol{ProtocolVariant::Resumable};
    std::string peerAddress;
    std::vector<std::string> files;
    uint64_t totalBytes{0};
    uint64_t bytesTransferred{0};   // bytes moved over the wire by this session
    uint64_t resumedBytes{0};       // bytes skipped thanks to acknowledged offsets
    std::chrono::system_clock::time_point startTime;
    std::chrono::system_clock::time_point endTime;
    double durationSeconds{0.0};
    double averageThroughput{0.0};  // bytes per second
    bool success{false};
    nlk::ErrorCode errorCode{nlk::ErrorCode::Success};
    std::string errorMessage;
    int attempts{1};

    /// Fill durationSeconds and averageThroughput from the timestamps
    void finalize();

    std::string summary() const;
};

using CompletionCallback = std::function<void(const CompletionRecord&)>;

std::string formatSize(uint64_t bytes);

} // namespace NetLink
