#include "FrameCodec.h"
#include "Constants.h"
#include "SocketIO.h"
#include <cstdio>
#include <cstring>
#include <memory>
#include <set>

namespace NetLink {

uint64_t HandshakeRequest::totalBytes() const {
    uint64_t total = 0;
    for (const auto& entry : entries) {
        total += entry.size;
    }
    return total;
}

void ByteWriter::putU32(uint32_t value) {
    for (int shift = 24; shift >= 0; shift -= 8) {
        buffer_.push_back(static_cast<uint8_t>((value >> shift) & 0xFF));
    }
}

void ByteWriter::putU64(uint64_t value) {
    for (int shift = 56; shift >= 0; shift -= 8) {
        buffer_.push_back(static_cast<uint8_t>((value >> shift) & 0xFF));
    }
}

void ByteWriter::putString(const std::string& value) {
    putU32(static_cast<uint32_t>(value.size()));
    buffer_.insert(buffer_.end(), value.begin(), value.end());
}

void ByteWriter::putBytes(const uint8_t* data, size_t length) {
    buffer_.insert(buffer_.end(), data, data + length);
}

std::vector<uint8_t> FrameCodec::encodeRequest(const HandshakeRequest& request) {
    ByteWriter writer;
    writer.putU32(magicForVariant(request.variant));

    if (request.variant == ProtocolVariant::LegacySingle) {
        // Legacy frames carry exactly one file and no count
        const ManifestEntry empty;
        const ManifestEntry& entry = request.entries.empty() ? empty : request.entries.front();
        writer.putString(entry.path);
        writer.putU64(entry.size);
        return writer.take();
    }

    writer.putU32(static_cast<uint32_t>(request.entries.size()));
    for (const auto& entry : request.entries) {
        writer.putString(entry.path);
        writer.putU64(entry.size);
        if (request.variant == ProtocolVariant::Resumable) {
            writer.putU64(entry.offset);
            writer.putBytes(entry.digest.data(), entry.digest.size());
        }
    }
    return writer.take();
}

nlk::Result<HandshakeRequest> FrameCodec::decodeRequest(const ReadFn& read) {
    auto magic = readU32(read);
    if (!magic) return magic.error();

    auto variant = variantFromMagic(*magic);
    if (!variant) {
        char hex[16];
        snprintf(hex, sizeof(hex), "0x%08X", *magic);
        return nlk::Err<HandshakeRequest>(nlk::ErrorCode::BadMagic,
            std::string("Unrecognized magic ") + hex);
    }

    HandshakeRequest request;
    request.variant = *variant;

    uint32_t count = 1;
    if (request.variant != ProtocolVariant::LegacySingle) {
        auto announced = readU32(read);
        if (!announced) return announced.error();
        count = *announced;
        if (count == 0 || count > nlk::config::MAX_FILE_COUNT) {
            return nlk::Err<HandshakeRequest>(nlk::ErrorCode::MalformedFrame,
                "File count out of range: " + std::to_string(count));
        }
    }

    std::set<std::string> seen;
    request.entries.reserve(count);
    for (uint32_t i = 0; i < count; ++i) {
        ManifestEntry entry;

        auto path = readString(read, nlk::config::MAX_PATH_LENGTH);
        if (!path) return path.error();
        entry.path = std::move(*path);

        auto pathCheck = validateRelativePath(entry.path);
        if (!pathCheck) return pathCheck.error();
        if (!seen.insert(entry.path).second) {
            return nlk::Err<HandshakeRequest>(nlk::ErrorCode::MalformedFrame,
                "Duplicate path in manifest: " + entry.path);
        }

        auto size = readU64(read);
        if (!size) return size.error();
        entry.size = *size;

        if (request.variant == ProtocolVariant::Resumable) {
            auto offset = readU64(read);
            if (!offset) return offset.error();
            entry.offset = *offset;
            if (entry.offset > entry.size) {
                return nlk::Err<HandshakeRequest>(nlk::ErrorCode::InvalidOffset,
                    "Requested offset beyond file size for " + entry.path);
            }
            auto digest = read(entry.digest.data(), entry.digest.size());
            if (!digest) return digest.error();
        }

        request.entries.push_back(std::move(entry));
    }

    return nlk::Ok(std::move(request));
}

std::vector<uint8_t> FrameCodec::encodeReply(const HandshakeReply& reply) {
    ByteWriter writer;
    auto status = encodeStatus(reply.accepted);
    writer.putBytes(status.data(), status.size());
    if (!reply.accepted) {
        writer.putString(reply.reason);
        return writer.take();
    }
    writer.putU32(static_cast<uint32_t>(reply.offsets.size()));
    for (uint64_t offset : reply.offsets) {
        writer.putU64(offset);
    }
    return writer.take();
}

nlk::Result<HandshakeReply> FrameCodec::decodeReply(const ReadFn& read) {
    HandshakeReply reply;

    auto status = decodeStatus(read);
    if (!status) {
        if (status.error().code != nlk::ErrorCode::TransferRejected) {
            return status.error();
        }
        auto reason = readString(read, nlk::config::MAX_PATH_LENGTH);
        if (!reason) return reason.error();
        return nlk::Err<HandshakeReply>(nlk::ErrorCode::TransferRejected,
            "Receiver rejected transfer: " + *reason);
    }

    auto count = readU32(read);
    if (!count) return count.error();
    if (*count > nlk::config::MAX_FILE_COUNT) {
        return nlk::Err<HandshakeReply>(nlk::ErrorCode::MalformedFrame,
            "Reply count out of range: " + std::to_string(*count));
    }

    reply.offsets.reserve(*count);
    for (uint32_t i = 0; i < *count; ++i) {
        auto offset = readU64(read);
        if (!offset) return offset.error();
        reply.offsets.push_back(*offset);
    }
    return nlk::Ok(std::move(reply));
}

nlk::Result<void> FrameCodec::validateReply(const HandshakeRequest& request, const HandshakeReply& reply) {
    if (reply.offsets.size() != request.entries.size()) {
        return nlk::Err(nlk::ErrorCode::MalformedFrame,
            "Reply carries " + std::to_string(reply.offsets.size()) + " offsets for " +
            std::to_string(request.entries.size()) + " files");
    }
    for (size_t i = 0; i < reply.offsets.size(); ++i) {
        const auto& entry = request.entries[i];
        if (reply.offsets[i] > entry.offset || reply.offsets[i] > entry.size) {
            return nlk::Err(nlk::ErrorCode::InvalidOffset,
                "Acknowledged offset " + std::to_string(reply.offsets[i]) +
                " out of range for " + entry.path);
        }
    }
    return nlk::Ok();
}

std::array<uint8_t, 2> FrameCodec::encodeStatus(bool ok) {
    const char* text = ok ? nlk::config::STATUS_OK : nlk::config::STATUS_ERROR;
    return {static_cast<uint8_t>(text[0]), static_cast<uint8_t>(text[1])};
}

nlk::Result<void> FrameCodec::decodeStatus(const ReadFn& read) {
    char status[nlk::config::STATUS_SIZE];
    auto result = read(status, sizeof(status));
    if (!result) return result;

    if (memcmp(status, nlk::config::STATUS_OK, sizeof(status)) == 0) {
        return nlk::Ok();
    }
    if (memcmp(status, nlk::config::STATUS_ERROR, sizeof(status)) == 0) {
        return nlk::Err(nlk::ErrorCode::TransferRejected, "Receiver reported failure");
    }
    return nlk::Err(nlk::ErrorCode::MalformedFrame, "Unexpected status bytes");
}

nlk::Result<void> FrameCodec::validateRelativePath(const std::string& path) {
    if (path.empty()) {
        return nlk::Err(nlk::ErrorCode::UnsafePath, "Empty path");
    }
    if (path.front() == '/') {
        return nlk::Err(nlk::ErrorCode::UnsafePath, "Absolute path: " + path);
    }
    if (path.find('\\') != std::string::npos || path.find('\0') != std::string::npos) {
        return nlk::Err(nlk::ErrorCode::UnsafePath, "Invalid characters in path: " + path);
    }
    if (path.size() >= 2 && path[1] == ':') {
        return nlk::Err(nlk::ErrorCode::UnsafePath, "Drive-qualified path: " + path);
    }

    size_t start = 0;
    while (start <= path.size()) {
        size_t end = path.find('/', start);
        if (end == std::string::npos) end = path.size();
        const std::string segment = path.substr(start, end - start);
        if (segment.empty() || segment == "." || segment == "..") {
            return nlk::Err(nlk::ErrorCode::UnsafePath, "Unsafe path segment in: " + path);
        }
        start = end + 1;
    }
    return nlk::Ok();
}

FrameCodec::ReadFn FrameCodec::socketReader(int fd) {
    return [fd](void* dst, size_t n) {
        return net::recvExact(fd, dst, n);
    };
}

FrameCodec::ReadFn FrameCodec::bufferReader(std::vector<uint8_t> data) {
    auto buffer = std::make_shared<std::vector<uint8_t>>(std::move(data));
    auto cursor = std::make_shared<size_t>(0);
    return [buffer, cursor](void* dst, size_t n) -> nlk::Result<void> {
        if (buffer->size() - *cursor < n) {
            *cursor = buffer->size();
            return nlk::Err(nlk::ErrorCode::ConnectionClosed, "Unexpected end of stream");
        }
        memcpy(dst, buffer->data() + *cursor, n);
        *cursor += n;
        return nlk::Ok();
    };
}

nlk::Result<uint32_t> FrameCodec::readU32(const ReadFn& read) {
    uint8_t raw[4];
    auto result = read(raw, sizeof(raw));
    if (!result) return result.error();
    uint32_t value = 0;
    for (uint8_t byte : raw) {
        value = (value << 8) | byte;
    }
    return nlk::Ok(value);
}

nlk::Result<uint64_t> FrameCodec::readU64(const ReadFn& read) {
    uint8_t raw[8];
    auto result = read(raw, sizeof(raw));
    if (!result) return result.error();
    uint64_t value = 0;
    for (uint8_t byte : raw) {
        value = (value << 8) | byte;
    }
    return nlk::Ok(value);
}

nlk::Result<std::string> FrameCodec::readString(const ReadFn& read, uint32_t maxLength) {
    auto length = readU32(read);
    if (!length) return length.error();
    if (*length > maxLength) {
        return nlk::Err<std::string>(nlk::ErrorCode::MalformedFrame,
            "String length " + std::to_string(*length) + " exceeds limit");
    }
    std::string value(*length, '\0');
    if (*length > 0) {
        auto result = read(&value[0], *length);
        if (!result) return result.error();
    }
    return nlk::Ok(std::move(value));
}

} // namespace NetLink
