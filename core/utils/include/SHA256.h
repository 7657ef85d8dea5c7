#pragma once

#include <array>
#include <cstdint>
#include <string>
#include <vector>

namespace NetLink {

/**
 * @brief SHA-256 hashing utility backed by OpenSSL EVP
 */
class SHA256 {
public:
    using Digest = std::array<uint8_t, 32>;

    /**
     * @brief Hash a string to hex-encoded SHA256
     */
    static std::string hash(const std::string& input);
    
    /**
     * @brief Hash binary data to hex-encoded SHA256
     */
    static std::string hashBytes(const std::vector<uint8_t>& data);

    /**
     * @brief Stream a file through SHA256
     * @param path File to hash
     * @param digest Receives the raw 32-byte digest
     * @return false if the file cannot be read or OpenSSL fails
     */
    static bool hashFile(const std::string& path, Digest& digest);

    static std::string toHex(const uint8_t* data, size_t length);
    static std::string toHex(const Digest& digest) { return toHex(digest.data(), digest.size()); }
};

} // namespace NetLink
