/**
 * @file Md5ContentHasher.cpp
 * @brief Implementation of Md5ContentHasher.
 */

#include "infrastructure/Md5ContentHasher.hpp"
#include <cerrno>
#include <cstring>
#include <fstream>
#include <memory>
#include <vector>
#include <openssl/evp.h>

namespace stablecopy::infrastructure {

namespace {

struct EvpMdCtxDeleter {
    void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};

std::string ToHex(const unsigned char* data, unsigned int len) {
    static const char kHex[] = "0123456789abcdef";
    std::string out;
    out.reserve(static_cast<std::size_t>(len) * 2);
    for (unsigned int i = 0; i < len; ++i) {
        out.push_back(kHex[data[i] >> 4]);
        out.push_back(kHex[data[i] & 0x0F]);
    }
    return out;
}

domain::HashResult Failed(const std::string& error) {
    domain::HashResult result;
    result.ok = false;
    result.error = error;
    return result;
}

} // namespace

Md5ContentHasher::Md5ContentHasher(std::size_t chunkSize)
    : m_chunkSize(chunkSize == 0 ? kDefaultChunkSize : chunkSize) {}

domain::HashResult Md5ContentHasher::hash(const std::string& path) const {
    errno = 0;
    std::ifstream f(path, std::ios::binary);
    if (!f) {
        return Failed("open failed: " + std::string(errno != 0 ? std::strerror(errno) : "unknown error"));
    }

    std::unique_ptr<EVP_MD_CTX, EvpMdCtxDeleter> ctx(EVP_MD_CTX_new());
    if (!ctx) return Failed("EVP_MD_CTX_new failed");
    if (EVP_DigestInit_ex(ctx.get(), EVP_md5(), nullptr) != 1) {
        return Failed("EVP_DigestInit_ex failed");
    }

    std::vector<char> buf(m_chunkSize);
    while (f) {
        f.read(buf.data(), static_cast<std::streamsize>(buf.size()));
        std::streamsize n = f.gcount();
        if (n > 0 && EVP_DigestUpdate(ctx.get(), buf.data(), static_cast<std::size_t>(n)) != 1) {
            return Failed("EVP_DigestUpdate failed");
        }
    }
    if (f.bad()) {
        return Failed("read failed: " + std::string(errno != 0 ? std::strerror(errno) : "I/O error"));
    }

    unsigned char out[EVP_MAX_MD_SIZE];
    unsigned int outLen = 0;
    if (EVP_DigestFinal_ex(ctx.get(), out, &outLen) != 1) {
        return Failed("EVP_DigestFinal_ex failed");
    }

    domain::HashResult result;
    result.ok = true;
    result.digest = ToHex(out, outLen);
    return result;
}

} // namespace stablecopy::infrastructure
