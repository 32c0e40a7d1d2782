/**
 * @file CandidateFile.hpp
 * @brief A file seen by one directory scan.
 */

#pragma once
#include <cstdint>
#include <optional>
#include <string>

namespace stablecopy::domain {

/**
 * @struct CandidateFile
 * @brief Path matched by the scan, with its size if it could be read.
 */
struct CandidateFile {
    std::string path;                  ///< Absolute path.
    std::optional<std::uint64_t> size; ///< nullopt when stat failed.
};

} // namespace stablecopy::domain
