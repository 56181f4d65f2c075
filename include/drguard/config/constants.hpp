#pragma once
/**
 * @file constants.hpp
 * @brief Centralized named defaults for the monitoring and failover core.
 * @details These values eliminate magic numbers from the codebase. Override via the
 *          config loader (JSON) in production deployments.
 */

#include <cstddef>
#include <cstdint>

namespace drguard::config::constants {

// =====================
// Probing
// Units: milliseconds
// =====================
inline constexpr uint32_t PROBE_INTERVAL_MS        = 10000;  ///< One sample per probe every 10 s
inline constexpr uint32_t PROBE_TIMEOUT_MS         = 2000;   ///< Latency above this is a failed sample
inline constexpr std::size_t PROBES_PER_REGION_MIN = 2;      ///< Quorum needs independent network paths
inline constexpr std::size_t PROBE_RING_CAPACITY   = 256;    ///< Per-probe SPSC ring (power-of-two)
inline constexpr uint32_t INGEST_IDLE_SLEEP_MS     = 5;      ///< Ingestion thread back-off when all rings are empty

// =====================
// Hysteresis (HealthAggregator)
// =====================
inline constexpr uint32_t HYSTERESIS_K             = 3;      ///< Majority failures HEALTHY -> DEGRADED
inline constexpr uint32_t HYSTERESIS_K2            = 3;      ///< Additional failures DEGRADED -> UNHEALTHY
inline constexpr uint32_t HYSTERESIS_D             = 3;      ///< Majority successes DEGRADED -> HEALTHY
inline constexpr uint32_t HYSTERESIS_R             = 12;     ///< Majority successes UNHEALTHY -> HEALTHY (> K + K2)
inline constexpr uint32_t HEALTH_WINDOW_MS         = 180000; ///< Trailing window W (sample retention)
inline constexpr uint32_t ROUND_GRACE_MS           = 5000;   ///< Extra wait before an incomplete round is closed

// =====================
// Replication
// =====================
inline constexpr uint32_t LAG_REPORT_INTERVAL_MS   = 10000;  ///< Expected lag reporting period
inline constexpr uint32_t LAG_STALE_FACTOR         = 2;      ///< Stale after 2x the reporting period
inline constexpr uint32_t LAG_SMOOTHING_WINDOW_MS  = 30000;  ///< Rolling max window for the estimate
inline constexpr std::size_t LAG_HISTORY_MAX       = 64;     ///< Samples retained per (store, region)
inline constexpr uint64_t RPO_BOUND_MS             = 5000;   ///< Max tolerable replication lag at failover

// =====================
// Failover / cutover
// =====================
inline constexpr uint64_t RTO_DEADLINE_MS          = 15ULL * 60ULL * 1000ULL; ///< FAILOVER_PENDING escalation deadline
inline constexpr bool     AUTO_FAILBACK            = false;  ///< Fail-back requires operator confirmation
inline constexpr uint32_t DRAIN_TIMEOUT_MS         = 120000; ///< Max wait for lag to drain
inline constexpr uint32_t DRAIN_POLL_MS            = 1000;   ///< Lag poll period while draining
inline constexpr uint64_t ACCEPTED_LOSS_WINDOW_MS  = 0;      ///< 0 = no data-loss window accepted
inline constexpr uint32_t DECISION_TICK_MS         = 1000;   ///< Engine decision cycle period

// =====================
// Persistence / audit / alerts
// =====================
inline constexpr uint64_t PLAN_RETENTION_MS        = 30ULL * 24ULL * 3600ULL * 1000ULL; ///< 30 days
inline constexpr std::size_t ALERT_QUEUE_CAPACITY  = 1024;   ///< Pending alerts before oldest is dropped

// =====================
// Logging
// =====================
inline constexpr std::size_t LOG_MAX_BYTES         = 10U * 1024U * 1024U; ///< Rotate at 10 MiB
inline constexpr std::size_t LOG_MAX_FILES         = 5;

} // namespace drguard::config::constants
