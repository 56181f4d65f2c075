#pragma once
/**
 * @file health_aggregator.hpp
 * @brief Quorum voting over independent probes with asymmetric hysteresis.
 *
 * Concurrency model: single writer, many readers.
 *   - ingest()/close_overdue_rounds() are called from one ingestion thread only.
 *   - Readers take an immutable snapshot (shared_ptr copy, ACQUIRE); the writer
 *     publishes a fresh copy after every closed round (RELEASE). Readers never block
 *     the writer and always see a consistent set of verdicts.
 *
 * Rounds: samples are bucketed by timestamp into rounds of one probe interval. A
 * round closes when every configured probe of the region reported, or once it is
 * older than interval + grace. Probes missing from a closed round count as failing.
 */

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <map>
#include <memory>
#include <optional>
#include <string_view>
#include <vector>

#include "drguard/config/constants.hpp"
#include "drguard/core/error.hpp"
#include "drguard/core/types.hpp"

namespace drguard::obs { class AlertDispatcher; }

namespace drguard::health {

/** @struct AggregatorConfig
 *  @brief Hysteresis thresholds. They encode the RTO/false-positive tradeoff.
 */
struct AggregatorConfig {
    std::uint32_t probe_interval_ms{drguard::config::constants::PROBE_INTERVAL_MS}; ///< Round length
    std::uint32_t k{drguard::config::constants::HYSTERESIS_K};   ///< HEALTHY -> DEGRADED
    std::uint32_t k2{drguard::config::constants::HYSTERESIS_K2}; ///< DEGRADED -> UNHEALTHY (additional)
    std::uint32_t d{drguard::config::constants::HYSTERESIS_D};   ///< DEGRADED -> HEALTHY
    std::uint32_t r{drguard::config::constants::HYSTERESIS_R};   ///< UNHEALTHY -> HEALTHY, must exceed k + k2
    std::uint32_t window_ms{drguard::config::constants::HEALTH_WINDOW_MS};     ///< Trailing window W
    std::uint32_t round_grace_ms{drguard::config::constants::ROUND_GRACE_MS};  ///< Late-sample allowance
};

/// Reject inconsistent thresholds (R > K + K2, non-zero counts, window covers K rounds).
Result<void> validate(const AggregatorConfig& cfg);

/// Outcome of one closed voting round.
enum class RoundOutcome : std::uint8_t {
    MajorityFail,     ///< Strict majority of probes failed (missing probes fail)
    MajoritySuccess,  ///< Strict majority of probes succeeded
    Inconclusive      ///< Neither side has a strict majority
};

/** @struct VerdictSnapshot
 *  @brief Immutable view published to readers.
 */
struct VerdictSnapshot {
    std::map<RegionId, HealthVerdict> verdicts;
    RegionId      active_region{kPrimaryRegion};
    std::uint64_t version{0}; ///< Increments on every publication
};

/** @class HealthAggregator
 *  @brief Maintains one HealthVerdict per region from the probe sample stream.
 */
class HealthAggregator {
public:
    explicit HealthAggregator(AggregatorConfig cfg, obs::AlertDispatcher* alerts = nullptr);

    HealthAggregator(const HealthAggregator&)            = delete;
    HealthAggregator& operator=(const HealthAggregator&) = delete;

    /**
     * @brief Declare a region and the probes expected to vote for it.
     * @return InvalidArgument if @p probes is empty or contains duplicates.
     * @note Call before ingestion starts.
     */
    Result<void> register_region(RegionId region, std::vector<ProbeId> probes);

    /// Ingest one sample (writer thread only). Samples for unknown regions/probes are ignored.
    void ingest(const HealthSample& sample);

    /// Close rounds whose deadline passed by @p now (writer thread only).
    void close_overdue_rounds(TimestampMs now);

    /// Consistent view of all verdicts (any thread).
    [[nodiscard]] std::shared_ptr<const VerdictSnapshot> snapshot() const noexcept;

    /// Verdict for one region from the latest snapshot.
    [[nodiscard]] std::optional<HealthVerdict> verdict(RegionId region) const;

    /// Record the region currently serving traffic; monitoring is re-armed on the next round.
    void set_active_region(RegionId region) noexcept;
    [[nodiscard]] RegionId active_region() const noexcept {
        return active_region_.load(std::memory_order_acquire);
    }

    /// Samples retained in the trailing window for (region, probe). Writer thread only.
    [[nodiscard]] std::size_t retained_samples(RegionId region, ProbeId probe) const;

    [[nodiscard]] const AggregatorConfig& config() const noexcept { return cfg_; }

private:
    struct RegionState {
        std::vector<ProbeId> probes;
        std::map<ProbeId, std::deque<HealthSample>> window;    ///< Trailing W per probe
        std::map<std::uint64_t, std::map<ProbeId, bool>> open; ///< round -> probe -> success
        std::optional<std::uint64_t> last_closed;              ///< Highest closed round
        std::optional<std::uint64_t> last_counted;             ///< Last round that extended a streak
        std::uint32_t degraded_fail_run{0};                    ///< Failures counted while DEGRADED
        HealthVerdict verdict;
    };

    std::uint64_t round_of(TimestampMs ts) const noexcept { return ts / cfg_.probe_interval_ms; }
    TimestampMs   round_deadline(std::uint64_t round) const noexcept;

    void prune_window(RegionState& st, TimestampMs now) const;
    void close_ready_rounds(RegionState& st, TimestampMs now);
    RoundOutcome tally(const RegionState& st, const std::map<ProbeId, bool>& votes) const noexcept;
    void apply_round(RegionState& st, std::uint64_t round, RoundOutcome outcome, TimestampMs now);
    void transition(RegionState& st, HealthStatus next, TimestampMs now);
    void publish();

private:
    AggregatorConfig cfg_;
    obs::AlertDispatcher* alerts_{nullptr};

    std::map<RegionId, RegionState> regions_; ///< Writer-owned state

    std::shared_ptr<const VerdictSnapshot> snap_{std::make_shared<VerdictSnapshot>()};
    std::atomic<RegionId> active_region_{kPrimaryRegion};
    RegionId              armed_region_{kPrimaryRegion}; ///< Active region last seen by the writer
    std::uint64_t         version_{0};
};

std::string_view to_string(RoundOutcome o) noexcept;

} // namespace drguard::health
