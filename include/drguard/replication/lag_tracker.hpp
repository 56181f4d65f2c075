#pragma once
/**
 * @file lag_tracker.hpp
 * @brief Rolling replication-lag estimates per (store, replica region).
 *
 * The effective RPO of the deployment is bounded by its slowest store, so every
 * aggregate here is a maximum. A series with no recent report is STALE, which is
 * distinct from zero lag and violates every bound.
 *
 * Thread-safety: all member functions may be called concurrently (internal mutex).
 */

#include <cstddef>
#include <cstdint>
#include <deque>
#include <map>
#include <mutex>
#include <set>
#include <string>
#include <utility>
#include <vector>

#include "drguard/config/constants.hpp"
#include "drguard/core/error.hpp"
#include "drguard/core/types.hpp"

namespace drguard::replication {

/** @struct LagTrackerConfig
 *  @brief Freshness and smoothing parameters.
 */
struct LagTrackerConfig {
    std::uint32_t report_interval_ms{drguard::config::constants::LAG_REPORT_INTERVAL_MS}; ///< Expected reporting cadence
    std::uint32_t stale_factor{drguard::config::constants::LAG_STALE_FACTOR};             ///< Stale after factor * interval
    std::uint32_t smoothing_window_ms{drguard::config::constants::LAG_SMOOTHING_WINDOW_MS};
    std::size_t   history_max{drguard::config::constants::LAG_HISTORY_MAX};               ///< Samples kept per series
};

/// One row of the tracker report used by the status view.
struct LagSeriesReport {
    std::string   store;
    RegionId      region{kSecondaryRegion};
    LagReading    reading;
    TimestampMs   last_sample_ms{0};
};

class ReplicationLagTracker {
public:
    explicit ReplicationLagTracker(LagTrackerConfig cfg = {});

    /// Declare a store. A registered store with no samples reads STALE.
    void register_store(const std::string& store);

    /**
     * @brief Accept one lag observation.
     * @return UnknownStore for an unregistered store, OutOfOrder when @p ts_ms is
     *         older than the newest accepted sample of the same series.
     */
    Result<void> record(const std::string& store, RegionId region,
                        std::uint64_t lag_ms, TimestampMs ts_ms);

    Result<void> record(const ReplicationLagSample& s) {
        return record(s.store, s.region, s.lag_ms, s.timestamp_ms);
    }

    /// Worst estimate of @p store over all its replica regions.
    [[nodiscard]] LagReading current_lag(const std::string& store, TimestampMs now) const;

    /// Estimate of @p store into @p region.
    [[nodiscard]] LagReading current_lag(const std::string& store, RegionId region, TimestampMs now) const;

    /// Worst estimate across all stores and regions. FRESH 0 when nothing is registered.
    [[nodiscard]] LagReading worst_lag(TimestampMs now) const;

    /// Worst estimate across all stores replicating into @p region.
    [[nodiscard]] LagReading worst_lag_into(RegionId region, TimestampMs now) const;

    [[nodiscard]] std::vector<std::string> stores() const;

    /// Per-series readings for operator status output.
    [[nodiscard]] std::vector<LagSeriesReport> report(TimestampMs now) const;

    [[nodiscard]] const LagTrackerConfig& config() const noexcept { return cfg_; }

private:
    using SeriesKey = std::pair<std::string, RegionId>;
    using Series    = std::deque<std::pair<TimestampMs, std::uint64_t>>;

    LagReading estimate(const Series& s, TimestampMs now) const noexcept;
    static LagReading worse(const LagReading& a, const LagReading& b) noexcept;

private:
    LagTrackerConfig cfg_;

    mutable std::mutex mu_;
    std::set<std::string> stores_;
    std::map<SeriesKey, Series> series_;
};

} // namespace drguard::replication
