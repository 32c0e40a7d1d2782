/**
 * @file Md5ContentHasher.hpp
 * @brief OpenSSL-backed streaming MD5 digests.
 */

#pragma once
#include <cstddef>
#include "domain/ContentHasher.hpp"

namespace stablecopy::infrastructure {

/**
 * @class Md5ContentHasher
 * @brief Streams files through EVP_md5 in fixed-size chunks.
 *
 * MD5 is used for change detection only; collisions are not a security concern here.
 */
class Md5ContentHasher : public domain::ContentHasher {
public:
    static constexpr std::size_t kDefaultChunkSize = 8192;

    explicit Md5ContentHasher(std::size_t chunkSize = kDefaultChunkSize);

    domain::HashResult hash(const std::string& path) const override;
    std::string algorithm() const override { return "md5"; }

private:
    std::size_t m_chunkSize;
};

} // namespace stablecopy::infrastructure
