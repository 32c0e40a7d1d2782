/**
 * @file BackupOrchestrator.cpp
 * @brief Implementation of BackupOrchestrator.
 */

#include "application/BackupOrchestrator.hpp"
#include <algorithm>
#include <chrono>
#include <sstream>
#include <stdexcept>
#include <system_error>
#include <utility>
#include "infrastructure/Logger.hpp"

namespace fs = std::filesystem;

namespace stablecopy::application {

using infrastructure::Logger;

namespace {

const char* kComponent = "BackupOrchestrator";

std::string JoinExtensions(const std::vector<std::string>& extensions) {
    std::string out;
    for (const auto& ext : extensions) {
        if (!out.empty()) out += ", ";
        out += ext;
    }
    return out;
}

void RemoveQuietly(const fs::path& path) {
    std::error_code ec;
    fs::remove(path, ec);
}

} // namespace

BackupOrchestrator::BackupOrchestrator(domain::MonitorConfig config,
                                       std::shared_ptr<infrastructure::BackupLedger> ledger,
                                       std::shared_ptr<const domain::ContentHasher> hasher)
    : m_config(std::move(config)),
      m_ledger(std::move(ledger)),
      m_hasher(std::move(hasher)),
      m_scanner(m_config.monitorDir, m_config.fileExtensions),
      m_tracker(m_config.checkIntervalSeconds, m_config.stableThresholdSeconds),
      m_destDir(m_config.destDir()) {
    if (!m_ledger || !m_hasher) {
        throw std::invalid_argument("BackupOrchestrator requires a ledger and a hasher");
    }
}

void BackupOrchestrator::initialize() {
    std::error_code ec;
    fs::create_directories(m_destDir, ec);
    if (ec || !fs::is_directory(m_destDir)) {
        const std::string cause = ec ? ec.message() : "not a directory";
        Logger::Error(kComponent, Logger::Failure("Could not create destination directory.",
                                                  m_destDir.string(), "mkdir", cause));
        throw std::runtime_error("cannot create destination directory " + m_destDir.string() + ": " + cause);
    }
    Logger::Info(kComponent, "Ensured destination directory exists: " + m_destDir.string());

    // Non-fatal: a failed load leaves an empty ledger.
    (void)m_ledger->loadFromDisk();
    m_initialized = true;
}

std::string BackupOrchestrator::relativePathOf(const std::string& path) const {
    fs::path rel = fs::path(path).lexically_relative(m_config.monitorDir);
    if (rel.empty() || *rel.begin() == "..") {
        return fs::path(path).filename().generic_string();
    }
    return rel.generic_string();
}

bool BackupOrchestrator::copyWithMetadata(const fs::path& source, const fs::path& dest, std::string& error) const {
    // Copy into a sibling ".part" file so the destination name never holds a partial copy.
    fs::path partPath = dest;
    partPath += ".part";

    std::error_code ec;
    fs::copy_file(source, partPath, fs::copy_options::overwrite_existing, ec);
    if (ec) {
        error = "copy: " + ec.message();
        RemoveQuietly(partPath);
        return false;
    }

    const fs::file_status status = fs::status(source, ec);
    if (!ec) fs::permissions(partPath, status.permissions(), fs::perm_options::replace, ec);
    if (ec) {
        error = "permissions: " + ec.message();
        RemoveQuietly(partPath);
        return false;
    }

    const fs::file_time_type mtime = fs::last_write_time(source, ec);
    if (!ec) fs::last_write_time(partPath, mtime, ec);
    if (ec) {
        error = "mtime: " + ec.message();
        RemoveQuietly(partPath);
        return false;
    }

    fs::rename(partPath, dest, ec);
    if (ec) {
        error = "rename: " + ec.message();
        RemoveQuietly(partPath);
        return false;
    }
    return true;
}

CopyOutcome BackupOrchestrator::copyStableFile(const std::string& path) {
    const domain::HashResult digest = m_hasher->hash(path);
    if (!digest.ok) {
        Logger::Error(kComponent, Logger::Failure("Failed to compute " + m_hasher->algorithm() + ", not copying.",
                                                  path, "hash", digest.error));
        return CopyOutcome::HashFailed;
    }

    const std::string relPath = relativePathOf(path);
    const fs::path destPath = m_destDir / fs::path(path).filename();

    if (m_ledger->isAlreadyBackedUp(relPath, digest.digest)) {
        Logger::Info(kComponent, "Skipped " + path + "; already backed up with same content.");
        return CopyOutcome::DedupSkipped;
    }

    std::string error;
    if (!copyWithMetadata(path, destPath, error)) {
        Logger::Error(kComponent, Logger::Failure("Error copying file.", path, "copy", error));
        return CopyOutcome::CopyFailed;
    }

    m_ledger->record(relPath, digest.digest);
    Logger::Info(kComponent, "Copied " + path + " to " + destPath.string());
    return CopyOutcome::Copied;
}

void BackupOrchestrator::logTrackerEvents(const domain::TrackerCycleResult& result) const {
    using domain::TrackerEventKind;
    for (const auto& e : result.events) {
        switch (e.kind) {
            case TrackerEventKind::Admitted:
                Logger::Info(kComponent, "Detected new file: " + e.path + " (Size: " +
                             std::to_string(e.currentSize) + "). Starting monitoring.");
                break;
            case TrackerEventKind::Reset:
                Logger::Info(kComponent, e.path + " size changed from " + std::to_string(e.previousSize) +
                             " to " + std::to_string(e.currentSize) + ". Resetting checks.");
                break;
            case TrackerEventKind::Incremented:
                Logger::Debug(kComponent, e.path + " size stable at " + std::to_string(e.currentSize) +
                              ". Checks: " + std::to_string(e.stableCount) + "/" +
                              std::to_string(m_tracker.requiredStableChecks()));
                break;
            case TrackerEventKind::Promoted:
                Logger::Info(kComponent, e.path + " stable for " + std::to_string(e.stableCount) +
                             " checks. Copying.");
                break;
            case TrackerEventKind::DroppedMissing:
                Logger::Warning(kComponent, "Tracked file disappeared: " + e.path + ". Removing from tracking.");
                break;
            case TrackerEventKind::DroppedUnreadable:
                Logger::Warning(kComponent, "Could not get size for " + e.path + ". Removing from tracking.");
                break;
            case TrackerEventKind::SkippedUnreadable:
                Logger::Warning(kComponent, "Detected new file " + e.path + ", but could not get size. Skipping for now.");
                break;
        }
    }
}

CycleReport BackupOrchestrator::runOnce(const ShutdownSignal* signal) {
    using domain::TrackerEventKind;

    CycleReport report;
    report.cycle = ++m_cycle;

    Logger::Debug(kComponent, "Scanning directory...");
    const infrastructure::ScanResult scan = m_scanner.scan();
    report.listed = scan.listed;
    report.candidates = scan.files.size();

    const domain::TrackerCycleResult transitions = m_tracker.advance(scan.files);
    logTrackerEvents(transitions);
    report.admitted = transitions.count(TrackerEventKind::Admitted);
    report.reset = transitions.count(TrackerEventKind::Reset);
    report.dropped = transitions.count(TrackerEventKind::DroppedMissing) +
                     transitions.count(TrackerEventKind::DroppedUnreadable);
    report.promoted = transitions.promoted.size();

    for (const auto& path : transitions.promoted) {
        if (signal && signal->stopRequested()) {
            ++report.deferred;
            continue;
        }
        switch (copyStableFile(path)) {
            case CopyOutcome::Copied: ++report.copied; break;
            case CopyOutcome::DedupSkipped: ++report.dedupSkipped; break;
            case CopyOutcome::HashFailed: ++report.hashFailures; break;
            case CopyOutcome::CopyFailed: ++report.copyFailures; break;
        }
    }
    if (report.deferred > 0) {
        Logger::Info(kComponent, "Shutdown requested; deferred " + std::to_string(report.deferred) +
                     " stable file(s) to the next run.");
    }

    if (m_config.saveAfterEachCopy && report.copied > 0 && m_ledger->isDirty()) {
        (void)m_ledger->saveToDisk();
    }

    std::ostringstream summary;
    summary << "Cycle " << report.cycle << ": candidates=" << report.candidates
            << " admitted=" << report.admitted << " reset=" << report.reset
            << " dropped=" << report.dropped << " promoted=" << report.promoted
            << " copied=" << report.copied << " dedup=" << report.dedupSkipped
            << " hash_failures=" << report.hashFailures << " copy_failures=" << report.copyFailures
            << " tracked=" << m_tracker.trackedCount();
    Logger::Debug(kComponent, summary.str());
    return report;
}

void BackupOrchestrator::run(ShutdownSignal& signal) {
    if (!m_initialized) {
        initialize();
    }

    Logger::Info(kComponent, "Monitoring directory: " + m_config.monitorDir.string() + " for " +
                 JoinExtensions(m_config.fileExtensions) + " files.");
    Logger::Info(kComponent, "Check interval: " + std::to_string(m_config.checkIntervalSeconds) +
                 " seconds. Stability threshold: " + std::to_string(m_config.stableThresholdSeconds) + " seconds.");
    Logger::Info(kComponent, "Stable files will be copied to: " + m_destDir.string());

    const std::chrono::milliseconds interval = std::chrono::seconds(
        std::min(m_config.checkIntervalSeconds, domain::MonitorConfig::kMaxCheckIntervalSeconds));
    while (!signal.stopRequested()) {
        try {
            runOnce(&signal);
        } catch (const std::exception& e) {
            Logger::Error(kComponent, "Unexpected error in cycle " + std::to_string(m_cycle) + ": " + e.what());
        }

        Logger::Debug(kComponent, "Sleeping for " + std::to_string(m_config.checkIntervalSeconds) + " seconds...");
        if (signal.waitFor(interval)) break;
    }

    Logger::Info(kComponent, "Monitoring stopped, saving ledger.");
    if (!m_ledger->saveToDisk().ok) {
        Logger::Warning(kComponent, "Ledger not saved; entries recorded this run may be copied again next run.");
    }
    Logger::Info(kComponent, "BackupOrchestrator shutting down.");
}

} // namespace stablecopy::application
