#include "SHA256.h"
#include <fstream>
#include <iomanip>
#include <memory>
#include <sstream>
#include <openssl/evp.h>

namespace NetLink {

namespace {

struct MdCtxDeleter {
    void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};

using MdCtxPtr = std::unique_ptr<EVP_MD_CTX, MdCtxDeleter>;

bool digestBuffer(const void* data, size_t size, SHA256::Digest& out) {
    MdCtxPtr ctx(EVP_MD_CTX_new());
    if (!ctx) return false;
    if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) return false;
    if (EVP_DigestUpdate(ctx.get(), data, size) != 1) return false;
    unsigned int hashLen = 0;
    if (EVP_DigestFinal_ex(ctx.get(), out.data(), &hashLen) != 1) return false;
    return hashLen == out.size();
}

} // namespace

std::string SHA256::hash(const std::string& input) {
    return hashBytes(std::vector<uint8_t>(input.begin(), input.end()));
}

std::string SHA256::hashBytes(const std::vector<uint8_t>& data) {
    Digest digest{};
    if (!digestBuffer(data.data(), data.size(), digest)) {
        return "";
    }
    return toHex(digest);
}

bool SHA256::hashFile(const std::string& path, Digest& digest) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        return false;
    }

    MdCtxPtr ctx(EVP_MD_CTX_new());
    if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
        return false;
    }

    std::vector<char> buffer(64 * 1024);
    while (file) {
        file.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        std::streamsize got = file.gcount();
        if (got > 0 && EVP_DigestUpdate(ctx.get(), buffer.data(), static_cast<size_t>(got)) != 1) {
            return false;
        }
    }
    if (file.bad()) {
        return false;
    }

    unsigned int hashLen = 0;
    if (EVP_DigestFinal_ex(ctx.get(), digest.data(), &hashLen) != 1) {
        return false;
    }
    return hashLen == digest.size();
}

std::string SHA256::toHex(const uint8_t* data, size_t length) {
    std::stringstream ss;
    for (size_t i = 0; i < length; ++i) {
        ss << std::hex << std::setfill('0') << std::setw(2) << static_cast<int>(data[i]);
    }
    return ss.str();
}

} // namespace NetLink
