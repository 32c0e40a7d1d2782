/**
 * @file BackupLedger.hpp
 * @brief Durable record of which (path, content hash) pairs were already copied.
 */

#pragma once
#include <chrono>
#include <cstddef>
#include <filesystem>
#include <map>
#include <string>
#include <vector>
#include "domain/LedgerEntry.hpp"
#include "domain/OperationResult.hpp"

namespace stablecopy::infrastructure {

/**
 * @class BackupLedger
 * @brief In-memory table of backed-up facts with an explicit JSON persistence step.
 *
 * Queries and records touch memory only. saveToDisk() replaces the store through
 * AtomicFileWriter, so an interrupted save leaves the previous store intact.
 * Not thread-safe; the orchestrator is its only writer.
 */
class BackupLedger {
public:
    static constexpr int kFormatVersion = 1;

    explicit BackupLedger(std::filesystem::path storePath);

    /** @brief True if this exact (path, hash) pair has been recorded. No I/O. */
    bool isAlreadyBackedUp(const std::string& relativePath, const std::string& contentHash) const;

    /** @brief Inserts or refreshes the entry with the current time. Does not flush. */
    void record(const std::string& relativePath, const std::string& contentHash);

    /**
     * @brief Replaces the in-memory table with the store's content.
     * A missing store is success with an empty table. Any parse error leaves the
     * table empty and returns failure.
     */
    domain::OperationResult loadFromDisk();

    /**
     * @brief Writes the whole table to the store (temp file + rename).
     * On failure the in-memory table is kept and stays dirty.
     */
    domain::OperationResult saveToDisk();

    std::size_t size() const { return m_entries.size(); }
    bool isDirty() const { return m_dirty; }
    const std::filesystem::path& storePath() const { return m_storePath; }

    /** @brief Snapshot of all entries in key order. */
    std::vector<domain::LedgerEntry> entries() const;

    /** @brief Serialized form of the table, as written by saveToDisk(). */
    std::string serialize() const;

private:
    std::filesystem::path m_storePath;
    std::map<domain::LedgerKey, std::chrono::system_clock::time_point> m_entries;
    bool m_dirty = false;
};

} // namespace stablecopy::infrastructure
