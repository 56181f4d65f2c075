#pragma once
/**
 * @file lag_poller.hpp
 * @brief Pulls replication lag from the storage backend into the tracker.
 */

#include <cstddef>
#include <string>
#include <vector>

#include "drguard/backend/storage_backend.hpp"
#include "drguard/core/types.hpp"
#include "drguard/replication/lag_tracker.hpp"

namespace drguard::replication {

class LagPoller {
public:
    LagPoller(backend::StorageBackend& storage, ReplicationLagTracker& tracker)
        : storage_(storage), tracker_(tracker) {}

    /**
     * @brief Read the lag of every tracked store into @p replica and record it.
     * @return Number of stores whose lag could not be read or recorded. Those
     *         series age toward STALE; nothing is recorded in their place.
     */
    std::size_t poll_once(RegionId replica, TimestampMs now);

    /// poll_once() for each region in @p replicas.
    std::size_t poll_once(const std::vector<RegionId>& replicas, TimestampMs now);

private:
    backend::StorageBackend& storage_;
    ReplicationLagTracker&   tracker_;
};

} // namespace drguard::replication
