/**
 * @file StabilityTracker.hpp
 * @brief Per-file state machine deciding when a file has stopped growing.
 */

#pragma once
#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include "domain/CandidateFile.hpp"
#include "domain/TrackedFile.hpp"

namespace stablecopy::domain {

/**
 * @enum TrackerEventKind
 * @brief Transition applied to one path during a cycle.
 */
enum class TrackerEventKind {
    Admitted,          ///< Absent -> Tracked.
    Reset,             ///< Size changed, count restarted.
    Incremented,       ///< Size unchanged, not yet stable long enough.
    Promoted,          ///< Stable long enough, handed to the copy path and untracked.
    DroppedMissing,    ///< No longer in the candidate scan.
    DroppedUnreadable, ///< Tracked, but its size could not be read.
    SkippedUnreadable  ///< New candidate whose size could not be read; not admitted.
};

struct TrackerEvent {
    TrackerEventKind kind;
    std::string path;
    std::uint64_t previousSize = 0;
    std::uint64_t currentSize = 0;
    std::uint32_t stableCount = 0;
};

/**
 * @struct TrackerCycleResult
 * @brief Everything that happened to the tracking table in one cycle.
 */
struct TrackerCycleResult {
    std::vector<std::string> promoted; ///< Paths now eligible for copy, in path order.
    std::vector<TrackerEvent> events;

    std::size_t count(TrackerEventKind kind) const;
};

/**
 * @class StabilityTracker
 * @brief Owns the tracking table and applies one scan's observations to it.
 *
 * A file becomes eligible once stableCount * interval >= threshold, evaluated
 * only after an increment, so at least one confirming scan is always needed.
 * Promoted files leave the table immediately and are not re-admitted by the
 * cycle that promoted them.
 */
class StabilityTracker {
public:
    StabilityTracker(std::int64_t checkIntervalSeconds, std::int64_t stableThresholdSeconds);

    /**
     * @brief Applies one scan cycle.
     * @param candidates Every candidate listed by this scan. Paths absent here are dropped.
     */
    TrackerCycleResult advance(const std::vector<CandidateFile>& candidates);

    bool isTracked(const std::string& path) const;
    std::optional<TrackedFile> find(const std::string& path) const;
    std::size_t trackedCount() const { return m_tracked.size(); }

    /** @brief Number of consecutive stable scans required for promotion. */
    std::uint32_t requiredStableChecks() const { return m_requiredChecks; }

private:
    std::int64_t m_checkIntervalSeconds;
    std::int64_t m_stableThresholdSeconds;
    std::uint32_t m_requiredChecks;
    std::map<std::string, TrackedFile> m_tracked;
};

} // namespace stablecopy::domain
