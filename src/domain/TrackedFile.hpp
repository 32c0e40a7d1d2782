/**
 * @file TrackedFile.hpp
 * @brief Domain entity for a candidate file under stability observation.
 */

#pragma once
#include <cstdint>
#include <string>

namespace stablecopy::domain {

/**
 * @struct TrackedFile
 * @brief Size history of one candidate file, keyed by its absolute path.
 */
struct TrackedFile {
    std::string path;             ///< Absolute path, the identity of the entry.
    std::uint64_t lastSize = 0;   ///< Size seen on the most recent scan.
    std::uint32_t stableCount = 0; ///< Consecutive scans without a size change.
};

} // namespace stablecopy::domain
