#include "TransferTypes.h"
#include "Constants.h"
#include <iomanip>
#include <sstream>

namespace NetLink {

const char* protocolVariantToString(ProtocolVariant variant) {
    switch (variant) {
        case ProtocolVariant::LegacySingle: return "legacy-single";
        case ProtocolVariant::Multi: return "multi";
        case ProtocolVariant::Resumable: return "resumable";
    }
    return "unknown";
}

const char* transferStateToString(TransferState state) {
    switch (state) {
        case TransferState::Idle: return "IDLE";
        case TransferState::Connecting: return "CONNECTING";
        case TransferState::Handshake: return "HANDSHAKE";
        case TransferState::Sending: return "SENDING";
        case TransferState::Paused: return "PAUSED";
        case TransferState::Completed: return "COMPLETED";
        case TransferState::Failed: return "FAILED";
    }
    return "UNKNOWN";
}

const char* transferDirectionToString(TransferDirection direction) {
    return direction == TransferDirection::Send ? "send" : "receive";
}

uint32_t magicForVariant(ProtocolVariant variant) {
    switch (variant) {
        case ProtocolVariant::LegacySingle: return nlk::config::MAGIC_LEGACY_SINGLE;
        case ProtocolVariant::Multi: return nlk::config::MAGIC_MULTI;
        case ProtocolVariant::Resumable: return nlk::config::MAGIC_RESUMABLE;
    }
    return 0;
}

std::optional<ProtocolVariant> variantFromMagic(uint32_t magic) {
    switch (magic) {
        case nlk::config::MAGIC_LEGACY_SINGLE: return ProtocolVariant::LegacySingle;
        case nlk::config::MAGIC_MULTI: return ProtocolVariant::Multi;
        case nlk::config::MAGIC_RESUMABLE: return ProtocolVariant::Resumable;
        default: return std::nullopt;
    }
}

void CompletionRecord::finalize() {
    auto elapsed = std::chrono::duration_cast<std::chrono::microseconds>(endTime - startTime);
    durationSeconds = elapsed.count() > 0 ? static_cast<double>(elapsed.count()) / 1e6 : 0.0;
    averageThroughput = durationSeconds > 0.0
        ? static_cast<double>(bytesTransferred) / durationSeconds
        : 0.0;
}

std::string CompletionRecord::summary() const {
    std::ostringstream ss;
    ss << (direction == TransferDirection::Send ? "Sent " : "Received ")
       << files.size() << " file(s), " << formatSize(totalBytes);
    if (!peerAddress.empty()) {
        ss << (direction == TransferDirection::Send ? " to " : " from ") << peerAddress;
    }
    ss << " [" << protocolVariantToString(protocol) << "]";
    ss << std::fixed << std::setprecision(2) << " in " << durationSeconds << "s";
    ss << " (" << formatSize(static_cast<uint64_t>(averageThroughput)) << "/s)";
    if (resumedBytes > 0) {
        ss << ", resumed " << formatSize(resumedBytes);
    }
    if (attempts > 1) {
        ss << ", " << attempts << " attempts";
    }
    if (!success) {
        ss << " FAILED: " << errorMessage;
    }
    return ss.str();
}

std::string formatSize(uint64_t bytes) {
    static const char* units[] = {"B", "KB", "MB", "GB", "TB"};
    double size = static_cast<double>(bytes);
    int unit = 0;
    while (size >= 1024.0 && unit < 4) {
        size /= 1024.0;
        ++unit;
    }
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(2) << size << " " << units[unit];
    return ss.str();
}

} // namespace NetLink
