/**
 * @file LedgerEntry.hpp
 * @brief Value types for the backup ledger.
 */

#pragma once
#include <chrono>
#include <string>
#include <tuple>

namespace stablecopy::domain {

/**
 * @struct LedgerKey
 * @brief Composite identity of a backed-up fact: relative path plus content digest.
 *
 * The same path with a different digest is a different key.
 */
struct LedgerKey {
    std::string relativePath; ///< Path relative to the monitored root.
    std::string contentHash;  ///< Lowercase hex digest.

    bool operator<(const LedgerKey& other) const {
        return std::tie(relativePath, contentHash) < std::tie(other.relativePath, other.contentHash);
    }

    bool operator==(const LedgerKey& other) const {
        return relativePath == other.relativePath && contentHash == other.contentHash;
    }
};

/**
 * @struct LedgerEntry
 * @brief A ledger record as exposed to callers.
 */
struct LedgerEntry {
    LedgerKey key;
    std::chrono::system_clock::time_point recordedAt;
};

} // namespace stablecopy::domain
