#pragma once

/**
 * @file FrameCodec.h
 * @brief Handshake frames of the transfer connection
 *
 * All integers are big-endian, strings are prefixed by a uint32 length.
 *
 *   legacy    : magic | path | u64 size
 *   multi     : magic | u32 count | { path | u64 size }*
 *   resumable : magic | u32 count | { path | u64 size | u64 offset | digest[32] }*
 *   reply     : "OK" | u32 count | { u64 acknowledged }*   or   "ER" | reason
 *
 * File data follows the handshake in manifest order and each file is
 * answered by a 2-byte status.
 */

#include "Result.h"
#include "SHA256.h"
#include "TransferTypes.h"
#include <array>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace NetLink {

/**
 * @brief One manifest line. offset and digest are only carried by the resumable variant
 */
struct ManifestEntry {
    std::string path;
    uint64_t size{0};
    uint64_t offset{0};
    SHA256::Digest digest{};
};

struct HandshakeRequest {
    ProtocolVariant variant{ProtocolVariant::Resumable};
    std::vector<ManifestEntry> entries;

    uint64_t totalBytes() const;
};

struct HandshakeReply {
    bool accepted{true};
    std::string reason;
    std::vector<uint64_t> offsets;
};

/**
 * @brief Append-only big-endian encoder
 */
class ByteWriter {
public:
    void putU32(uint32_t value);
    void putU64(uint64_t value);
    void putString(const std::string& value);
    void putBytes(const uint8_t* data, size_t length);

    const std::vector<uint8_t>& bytes() const { return buffer_; }
    std::vector<uint8_t> take() { return std::move(buffer_); }

private:
    std::vector<uint8_t> buffer_;
};

class FrameCodec {
public:
    /// Reads exactly n bytes into dst, from a socket or a buffer
    using ReadFn = std::function<nlk::Result<void>(void* dst, size_t n)>;

    static std::vector<uint8_t> encodeRequest(const HandshakeRequest& request);

    /**
     * @brief Read and validate a request, magic included
     *
     * Unknown magic, oversized counts or paths, duplicate or unsafe paths
     * fail with a protocol error code.
     */
    static nlk::Result<HandshakeRequest> decodeRequest(const ReadFn& read);

    static std::vector<uint8_t> encodeReply(const HandshakeReply& reply);
    static nlk::Result<HandshakeReply> decodeReply(const ReadFn& read);

    /**
     * @brief Check a reply against the request it answers
     *
     * The count must match and every acknowledged offset must be <= the
     * requested offset and <= the file size.
     */
    static nlk::Result<void> validateReply(const HandshakeRequest& request, const HandshakeReply& reply);

    static std::array<uint8_t, 2> encodeStatus(bool ok);

    /// "OK" succeeds, "ER" is TransferRejected, anything else MalformedFrame
    static nlk::Result<void> decodeStatus(const ReadFn& read);

    /**
     * @brief Relative paths must be non-empty, '/'-separated and stay inside the root
     */
    static nlk::Result<void> validateRelativePath(const std::string& path);

    static ReadFn socketReader(int fd);
    static ReadFn bufferReader(std::vector<uint8_t> data);

private:
    static nlk::Result<uint32_t> readU32(const ReadFn& read);
    static nlk::Result<uint64_t> readU64(const ReadFn& read);
    static nlk::Result<std::string> readString(const ReadFn& read, uint32_t maxLength);
};

} // namespace NetLink
