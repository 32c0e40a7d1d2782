/**
 * @file StabilityTracker.cpp
 * @brief Implementation of the StabilityTracker state machine.
 */

#include "domain/StabilityTracker.hpp"
#include <algorithm>
#include <limits>
#include <set>
#include <stdexcept>

namespace stablecopy::domain {

namespace {

// ceil(threshold / interval), without forming stableCount * interval.
std::uint32_t RequiredChecks(std::int64_t interval, std::int64_t threshold) {
    if (threshold <= 0) return 0;
    const std::int64_t checks = (threshold + interval - 1) / interval;
    if (checks > std::numeric_limits<std::uint32_t>::max()) {
        return std::numeric_limits<std::uint32_t>::max();
    }
    return static_cast<std::uint32_t>(checks);
}

} // namespace

std::size_t TrackerCycleResult::count(TrackerEventKind kind) const {
    return static_cast<std::size_t>(std::count_if(events.begin(), events.end(),
        [kind](const TrackerEvent& e) { return e.kind == kind; }));
}

StabilityTracker::StabilityTracker(std::int64_t checkIntervalSeconds, std::int64_t stableThresholdSeconds)
    : m_checkIntervalSeconds(checkIntervalSeconds),
      m_stableThresholdSeconds(stableThresholdSeconds) {
    if (m_checkIntervalSeconds <= 0) {
        throw std::invalid_argument("StabilityTracker: check interval must be positive");
    }
    if (m_stableThresholdSeconds < 0) {
        throw std::invalid_argument("StabilityTracker: stable threshold must not be negative");
    }
    m_requiredChecks = RequiredChecks(m_checkIntervalSeconds, m_stableThresholdSeconds);
}

TrackerCycleResult StabilityTracker::advance(const std::vector<CandidateFile>& candidates) {
    TrackerCycleResult result;

    std::map<std::string, const CandidateFile*> current;
    for (const auto& candidate : candidates) {
        current[candidate.path] = &candidate;
    }

    // 1. Existing entries.
    // Paths leaving tracking this cycle; the admission pass must not see them again.
    std::set<std::string> settledThisCycle;
    for (auto it = m_tracked.begin(); it != m_tracked.end();) {
        TrackedFile& tracked = it->second;
        auto found = current.find(tracked.path);

        if (found == current.end()) {
            result.events.push_back({TrackerEventKind::DroppedMissing, tracked.path,
                                     tracked.lastSize, 0, tracked.stableCount});
            it = m_tracked.erase(it);
            continue;
        }

        const auto& size = found->second->size;
        if (!size) {
            result.events.push_back({TrackerEventKind::DroppedUnreadable, tracked.path,
                                     tracked.lastSize, 0, tracked.stableCount});
            settledThisCycle.insert(tracked.path);
            it = m_tracked.erase(it);
            continue;
        }

        if (*size != tracked.lastSize) {
            result.events.push_back({TrackerEventKind::Reset, tracked.path,
                                     tracked.lastSize, *size, 0});
            tracked.lastSize = *size;
            tracked.stableCount = 0;
            ++it;
            continue;
        }

        if (tracked.stableCount < std::numeric_limits<std::uint32_t>::max()) {
            ++tracked.stableCount;
        }
        if (tracked.stableCount >= m_requiredChecks) {
            result.events.push_back({TrackerEventKind::Promoted, tracked.path,
                                     tracked.lastSize, *size, tracked.stableCount});
            result.promoted.push_back(tracked.path);
            settledThisCycle.insert(tracked.path);
            it = m_tracked.erase(it);
            continue;
        }

        result.events.push_back({TrackerEventKind::Incremented, tracked.path,
                                 tracked.lastSize, *size, tracked.stableCount});
        ++it;
    }

    // 2. New candidates.
    for (const auto& [path, candidate] : current) {
        if (m_tracked.count(path) != 0 || settledThisCycle.count(path) != 0) {
            continue;
        }
        if (!candidate->size) {
            result.events.push_back({TrackerEventKind::SkippedUnreadable, path, 0, 0, 0});
            continue;
        }
        m_tracked[path] = TrackedFile{path, *candidate->size, 0};
        result.events.push_back({TrackerEventKind::Admitted, path, 0, *candidate->size, 0});
    }

    return result;
}

bool StabilityTracker::isTracked(const std::string& path) const {
    return m_tracked.count(path) != 0;
}

std::optional<TrackedFile> StabilityTracker::find(const std::string& path) const {
    auto it = m_tracked.find(path);
    if (it == m_tracked.end()) return std::nullopt;
    return it->second;
}

} // namespace stablecopy::domain
