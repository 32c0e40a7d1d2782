/**
 * @file MonitorConfig.hpp
 * @brief Resolved, immutable configuration for one monitoring run.
 */

#pragma once
#include <cstdint>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <vector>

namespace stablecopy::domain {

/**
 * @class ConfigError
 * @brief Raised when settings cannot be read or fail validation.
 */
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& what) : std::runtime_error(what) {}
};

/**
 * @struct MonitorConfig
 * @brief Everything the orchestrator needs to know about where and how to watch.
 */
struct MonitorConfig {
    /// Largest accepted poll interval (about 31 years); keeps chrono deadline arithmetic in range.
    static constexpr std::int64_t kMaxCheckIntervalSeconds = 1000000000;

    std::filesystem::path monitorDir = "/tmp";
    std::filesystem::path destBaseDir = "/opt/stor0";
    std::string destSubdirName = "SavedCachedFiles";
    std::vector<std::string> fileExtensions{".tgz", ".tbz", ".tlz", ".txz"};
    std::int64_t checkIntervalSeconds = 300;
    std::int64_t stableThresholdSeconds = 120;

    std::filesystem::path ledgerPath;   ///< Durable ledger store.
    bool saveAfterEachCopy = true;      ///< Flush the ledger after cycles that recorded copies.
    std::string logLevel = "info";

    /** @brief Destination directory: destBaseDir / destSubdirName. */
    std::filesystem::path destDir() const { return destBaseDir / destSubdirName; }

    /** @brief True if @p extension is in the allow-list (exact, case-sensitive). */
    bool matchesExtension(const std::string& extension) const;

    /**
     * @brief Checks the invariants a run depends on.
     * @throws ConfigError naming the first violated constraint.
     */
    void validate() const;
};

} // namespace stablecopy::domain
