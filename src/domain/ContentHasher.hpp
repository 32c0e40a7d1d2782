/**
 * @file ContentHasher.hpp
 * @brief Interface for computing content digests of files.
 */

#pragma once
#include <string>

namespace stablecopy::domain {

/**
 * @struct HashResult
 * @brief Digest of a file, or the reason it could not be computed.
 */
struct HashResult {
    bool ok = false;
    std::string digest; ///< Lowercase hex, set when ok.
    std::string error;  ///< Underlying cause, set when !ok.
};

/**
 * @class ContentHasher
 * @brief Abstract digest provider used as the dedup key source.
 *
 * Implementations must stream the file so memory use does not grow with file size.
 */
class ContentHasher {
public:
    virtual ~ContentHasher() = default;

    /**
     * @brief Computes the digest of the file at @p path.
     * @return HashResult with ok=false on any open or read failure.
     */
    virtual HashResult hash(const std::string& path) const = 0;

    /** @brief Short algorithm name for log records (e.g. "md5"). */
    virtual std::string algorithm() const = 0;
};

} // namespace stablecopy::domain
