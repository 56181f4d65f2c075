/**
 * @file types.hpp
 * @brief Common data model shared across probing, aggregation and failover components.
 *
 * Region and probe identifiers are small integers so that samples stay trivially
 * copyable and can travel through the per-probe SPSC rings without allocation.
 * Human-readable region names ("us-east-1") live in configuration.
 */
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace drguard {

/// Region identifier. Two regions in the reference deployment, extensible to N.
using RegionId = std::uint16_t;

/// Probe identifier, unique within a region.
using ProbeId = std::uint16_t;

/// Milliseconds since the Unix epoch.
using TimestampMs = std::uint64_t;

inline constexpr RegionId kPrimaryRegion   = 0;
inline constexpr RegionId kSecondaryRegion = 1;

/// @return Current wall-clock time in milliseconds.
TimestampMs now_ms() noexcept;

/**
 * @brief Per-region health classification produced by the HealthAggregator.
 */
enum class HealthStatus : std::uint8_t {
    Healthy = 0,
    Degraded,
    Unhealthy
};

/**
 * @brief Process-wide operating mode owned by the FailoverEngine.
 */
enum class OperatingMode : std::uint8_t {
    PrimaryActive = 0,
    Degraded,
    FailoverPending,
    SecondaryActive,
    Recovering
};

/// Alert severities understood by the alerting sink.
enum class Severity : std::uint8_t { Info, Warning, Critical };

/**
 * @struct HealthSample
 * @brief One probe observation. Immutable once created.
 */
struct HealthSample {
    RegionId    region{kPrimaryRegion}; ///< Region probed
    ProbeId     probe{0};               ///< Probe that produced the sample
    TimestampMs timestamp_ms{0};        ///< When the probe completed
    bool        success{false};         ///< False on error, timeout or unhealthy answer
    std::optional<std::uint32_t> latency_ms; ///< Measured latency if the check completed
};

/**
 * @struct HealthVerdict
 * @brief Live verdict for one region. Mutated only by the HealthAggregator.
 */
struct HealthVerdict {
    RegionId     region{kPrimaryRegion};
    HealthStatus status{HealthStatus::Healthy};
    std::uint32_t consecutive_failures{0};  ///< Current run of majority-failing rounds
    std::uint32_t consecutive_successes{0}; ///< Current run of majority-successful rounds
    TimestampMs  last_transition_ms{0};     ///< Time of the last status change (0 = never)
    std::uint64_t rounds_evaluated{0};      ///< Closed rounds since start
};

/**
 * @struct ReplicationLagSample
 * @brief Replication lag observed for one store into one replica region.
 */
struct ReplicationLagSample {
    std::string   store;
    RegionId      region{kSecondaryRegion}; ///< Replica (destination) region
    std::uint64_t lag_ms{0};
    TimestampMs   timestamp_ms{0};
};

/// Freshness of a lag estimate. Stale is never reported as zero.
enum class LagState : std::uint8_t { Fresh, Stale };

/**
 * @struct LagReading
 * @brief Lag estimate as consumed by the decision engine and the coordinator.
 */
struct LagReading {
    LagState      state{LagState::Stale};
    std::uint64_t lag_ms{0}; ///< Meaningful only when state == Fresh

    [[nodiscard]] bool stale() const noexcept { return state == LagState::Stale; }

    /// Stale readings violate every bound.
    [[nodiscard]] bool within(std::uint64_t bound_ms) const noexcept {
        return state == LagState::Fresh && lag_ms < bound_ms;
    }
};

/**
 * @struct WorkflowExecutionRecord
 * @brief Progress of one multi-step workflow as tracked by the consistency guard.
 */
struct WorkflowExecutionRecord {
    std::string workflow_id;
    RegionId    region{kPrimaryRegion};
    int         last_completed_step{-1}; ///< -1 = no step committed yet
    std::string idempotency_token;       ///< Token of the in-progress step; empty if it has no side effect
    bool        resumable{true};         ///< False for workflows pinned to their origin region
    bool        terminal{false};

    bool operator==(const WorkflowExecutionRecord&) const = default;
};

std::string_view to_string(HealthStatus s) noexcept;
std::string_view to_string(OperatingMode m) noexcept;
std::string_view to_string(Severity s) noexcept;
std::string_view to_string(LagState s) noexcept;

std::optional<OperatingMode> operating_mode_from_string(std::string_view s) noexcept;

} // namespace drguard
