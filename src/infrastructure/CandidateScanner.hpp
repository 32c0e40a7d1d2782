/**
 * @file CandidateScanner.hpp
 * @brief Lists candidate files in the monitored directory.
 */

#pragma once
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include "domain/CandidateFile.hpp"

namespace stablecopy::infrastructure {

/**
 * @struct ScanResult
 * @brief Outcome of one directory listing.
 */
struct ScanResult {
    bool listed = true;                      ///< False if the directory itself could not be listed.
    std::string error;                       ///< Listing error, when !listed.
    std::vector<domain::CandidateFile> files; ///< Matches, in path order.
};

/**
 * @class CandidateScanner
 * @brief Non-recursive scan for regular files whose suffix is in the allow-list.
 *
 * Never throws for filesystem errors: a listing failure yields an empty result,
 * a per-entry stat failure yields a candidate without a size.
 */
class CandidateScanner {
public:
    CandidateScanner(std::filesystem::path monitorDir, std::vector<std::string> extensions);

    ScanResult scan() const;

    /** @brief Size of @p path, or nullopt (with @p error set) if it cannot be read. */
    static std::optional<std::uint64_t> ReadFileSize(const std::filesystem::path& path, std::string& error);

private:
    std::filesystem::path m_monitorDir;
    std::vector<std::string> m_extensions;

    bool matchesExtension(const std::filesystem::path& path) const;
};

} // namespace stablecopy::infrastructure
