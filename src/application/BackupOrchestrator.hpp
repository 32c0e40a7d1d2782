/**
 * @file BackupOrchestrator.hpp
 * @brief Poll loop that turns stable candidate files into deduplicated backups.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include "application/ShutdownSignal.hpp"
#include "domain/ContentHasher.hpp"
#include "domain/MonitorConfig.hpp"
#include "domain/StabilityTracker.hpp"
#include "infrastructure/BackupLedger.hpp"
#include "infrastructure/CandidateScanner.hpp"

namespace stablecopy::application {

/**
 * @enum CopyOutcome
 * @brief Result of the copy protocol for one promoted file.
 */
enum class CopyOutcome {
    Copied,       ///< Bytes and metadata copied, ledger updated.
    DedupSkipped, ///< Same (path, hash) already in the ledger; nothing copied.
    HashFailed,   ///< Digest could not be computed; nothing copied.
    CopyFailed    ///< Copy step failed; ledger untouched.
};

/**
 * @struct CycleReport
 * @brief Counters for one scan cycle.
 */
struct CycleReport {
    std::uint64_t cycle = 0;
    bool listed = true;
    std::size_t candidates = 0;
    std::size_t admitted = 0;
    std::size_t reset = 0;
    std::size_t dropped = 0;
    std::size_t promoted = 0;
    std::size_t copied = 0;
    std::size_t dedupSkipped = 0;
    std::size_t hashFailures = 0;
    std::size_t copyFailures = 0;
    std::size_t deferred = 0; ///< Promoted but not attempted because shutdown was requested.
};

/**
 * @class BackupOrchestrator
 * @brief Drives scan -> track -> hash/dedup/copy -> sleep on a single thread.
 *
 * The tracker and the ledger are only touched from the thread calling
 * runOnce()/run(), so neither needs locking.
 */
class BackupOrchestrator {
public:
    BackupOrchestrator(domain::MonitorConfig config,
                       std::shared_ptr<infrastructure::BackupLedger> ledger,
                       std::shared_ptr<const domain::ContentHasher> hasher);

    /**
     * @brief Creates the destination directory and loads the ledger.
     * Ledger load failures are logged and tolerated.
     * @throws std::runtime_error if the destination cannot be created.
     */
    void initialize();

    /**
     * @brief Performs one scan cycle without sleeping.
     * @param signal Checked between copies; remaining promoted files are deferred once set.
     */
    CycleReport runOnce(const ShutdownSignal* signal = nullptr);

    /**
     * @brief Loops until @p signal fires, then saves the ledger before returning.
     */
    void run(ShutdownSignal& signal);

    /** @brief Hash, dedup check, copy and record for one file. Does not touch tracking. */
    CopyOutcome copyStableFile(const std::string& path);

    const domain::StabilityTracker& tracker() const { return m_tracker; }
    const std::filesystem::path& destDir() const { return m_destDir; }
    const domain::MonitorConfig& config() const { return m_config; }

private:
    void logTrackerEvents(const domain::TrackerCycleResult& result) const;
    std::string relativePathOf(const std::string& path) const;
    bool copyWithMetadata(const std::filesystem::path& source, const std::filesystem::path& dest, std::string& error) const;

    domain::MonitorConfig m_config;
    std::shared_ptr<infrastructure::BackupLedger> m_ledger;
    std::shared_ptr<const domain::ContentHasher> m_hasher;
    infrastructure::CandidateScanner m_scanner;
    domain::StabilityTracker m_tracker;
    std::filesystem::path m_destDir;
    std::uint64_t m_cycle = 0;
    bool m_initialized = false;
};

} // namespace stablecopy::application
