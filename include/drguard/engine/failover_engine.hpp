#pragma once
/**
 * @file failover_engine.hpp
 * @brief Operating-mode state machine that decides when to fail over and fail back.
 *
 *   PRIMARY_ACTIVE --primary not HEALTHY--> DEGRADED
 *   DEGRADED --primary HEALTHY--> PRIMARY_ACTIVE
 *   DEGRADED --primary UNHEALTHY, secondary HEALTHY, lag fresh < RPO--> FAILOVER_PENDING
 *   FAILOVER_PENDING --plan SUCCEEDED--> SECONDARY_ACTIVE
 *   FAILOVER_PENDING --plan FAILED/PARTIAL/CANCELLED--> DEGRADED
 *   SECONDARY_ACTIVE --primary HEALTHY (R rounds), lag back fresh < RPO--> RECOVERING
 *   RECOVERING --confirmed, no unresolved workflows, fail-back SUCCEEDED--> PRIMARY_ACTIVE
 *   RECOVERING --withdrawn or fail-back failed--> SECONDARY_ACTIVE
 *
 * Concurrency model:
 *   - Every public operation runs under one mutex, which also guards the mode and
 *     the current plan reference; decision cycles never overlap.
 *   - Durable state has its own lock, taken after the engine lock. The coordinator's
 *     progress listener takes only the durable-state lock.
 *   - Mode changes are persisted before they are announced. A mode change that
 *     cannot be persisted does not happen.
 */

#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "drguard/config/constants.hpp"
#include "drguard/core/error.hpp"
#include "drguard/core/types.hpp"
#include "drguard/cutover/coordinator.hpp"
#include "drguard/cutover/cutover_plan.hpp"
#include "drguard/health/health_aggregator.hpp"
#include "drguard/obs/alert_dispatcher.hpp"
#include "drguard/obs/observability.hpp"
#include "drguard/persist/plan_journal.hpp"
#include "drguard/persist/state_store.hpp"
#include "drguard/replication/lag_tracker.hpp"
#include "drguard/workflow/consistency_guard.hpp"

namespace drguard::engine {

/** @struct EngineConfig
 *  @brief Safety bounds and region roles.
 */
struct EngineConfig {
    std::uint64_t rpo_bound_ms{drguard::config::constants::RPO_BOUND_MS};
    std::uint64_t rto_deadline_ms{drguard::config::constants::RTO_DEADLINE_MS};
    bool          auto_failback{drguard::config::constants::AUTO_FAILBACK}; ///< Skip operator confirmation
    RegionId      primary{kPrimaryRegion};
    RegionId      secondary{kSecondaryRegion};
};

struct ModeTransition {
    OperatingMode from{OperatingMode::PrimaryActive};
    OperatingMode to{OperatingMode::PrimaryActive};
    TimestampMs   at_ms{0};
    std::string   reason;
};

/// Result of one evaluate() call.
struct DecisionCycle {
    OperatingMode before{OperatingMode::PrimaryActive};
    OperatingMode after{OperatingMode::PrimaryActive};
    std::vector<ModeTransition> transitions;
};

/** @struct EngineStatus
 *  @brief Operator view: mode, active plan with per-step progress, pending manual work.
 */
struct EngineStatus {
    OperatingMode mode{OperatingMode::PrimaryActive};
    TimestampMs   mode_since_ms{0};
    RegionId      active_region{kPrimaryRegion};
    std::optional<cutover::CutoverPlan>  plan;
    std::optional<cutover::PlanProgress> progress;
    bool failback_proposed{false};  ///< RECOVERING and no fail-back plan started yet
    bool failback_confirmed{false};
    bool automation_halted{false};
    bool rto_escalated{false};
    std::vector<WorkflowExecutionRecord> unresolved_workflows;
};

class FailoverEngine {
public:
    FailoverEngine(EngineConfig cfg,
                   health::HealthAggregator& health,
                   replication::ReplicationLagTracker& lag,
                   cutover::CutoverCoordinator& coordinator,
                   workflow::WorkflowConsistencyGuard& guard,
                   persist::StateStore& store,
                   obs::AlertDispatcher& alerts,
                   persist::PlanJournal* journal = nullptr,
                   obs::Observer* observer = nullptr);
    ~FailoverEngine();

    FailoverEngine(const FailoverEngine&)            = delete;
    FailoverEngine& operator=(const FailoverEngine&) = delete;

    /**
     * @brief Load persisted state. A non-terminal persisted plan is resumed from
     *        its first unfinished step. Nothing persisted means PRIMARY_ACTIVE.
     * @return Io/Parse if the store cannot be read; the engine then refuses to act.
     */
    Result<void> restore(TimestampMs now);

    /// One decision cycle: apply transition rules until the mode settles.
    DecisionCycle evaluate(TimestampMs now);

    /// Operator-initiated failover, still gated by the target safety checks. @return plan id.
    Result<std::string> request_failover(TimestampMs now);

    /// Operator-initiated fail-back (implies confirmation). @return plan id.
    Result<std::string> request_failback(TimestampMs now);

    /// Allow the pending fail-back proposal to proceed.
    Result<void> confirm_failback();

    /// Re-enable automation after a FAILED, PARTIAL or cancelled plan was reviewed.
    Result<void> acknowledge_failure();

    /// Cancel the in-flight plan if it has not committed. Automation stays halted afterwards.
    Result<void> cancel_active_plan();

    [[nodiscard]] OperatingMode mode() const;
    [[nodiscard]] EngineStatus status() const;
    [[nodiscard]] const EngineConfig& config() const noexcept { return cfg_; }

private:
    struct Verdicts {
        HealthStatus primary{HealthStatus::Degraded};
        HealthStatus secondary{HealthStatus::Degraded};
    };

    Verdicts read_verdicts() const;
    bool step(TimestampMs now, const Verdicts& v, DecisionCycle& cycle);
    bool step_pending(TimestampMs now, DecisionCycle& cycle);
    bool step_recovering(TimestampMs now, const Verdicts& v, DecisionCycle& cycle);
    void settle(TimestampMs now, DecisionCycle& cycle);

    bool transition(OperatingMode to, TimestampMs now, const std::string& reason, DecisionCycle& cycle);
    bool start_plan(cutover::PlanKind kind, TimestampMs now, const std::string& reason, DecisionCycle& cycle);
    void finish_plan(const cutover::PlanProgress& p, TimestampMs now);

    /// True when @p region is HEALTHY and lag into it is fresh and below the RPO bound.
    bool safe_target(RegionId region, HealthStatus verdict, TimestampMs now, std::string& why) const;
    bool failback_started() const;
    bool plan_in_flight();
    std::optional<cutover::PlanProgress> refresh_progress();
    void save_progress();

    /// A halted failover left writes on the primary blocked.
    bool primary_writes_held() const;
    bool release_primary_writes();

    persist::PersistedState durable_view(OperatingMode mode, TimestampMs since) const;
    Result<void> persist(const persist::PersistedState& next);

    void alert(Severity sev, const std::string& msg);
    void observe(obs::EventKind kind, TimestampMs now, OperatingMode from, OperatingMode to,
                 const std::string& reason);

private:
    EngineConfig cfg_;
    health::HealthAggregator&           health_;
    replication::ReplicationLagTracker& lag_;
    cutover::CutoverCoordinator&        coordinator_;
    workflow::WorkflowConsistencyGuard& guard_;
    persist::StateStore&                store_;
    obs::AlertDispatcher&               alerts_;
    persist::PlanJournal*               journal_{nullptr};
    obs::Observer*                      observer_{nullptr};

    mutable std::mutex mu_; ///< Decision cycle, mode and plan reference
    bool          restored_{false};
    OperatingMode mode_{OperatingMode::PrimaryActive};
    TimestampMs   mode_since_ms_{0};
    RegionId      active_region_{kPrimaryRegion};
    std::optional<cutover::CutoverPlan>  plan_;
    std::optional<cutover::PlanProgress> progress_;
    bool          plan_closed_{true};      ///< Outcome of plan_ already handled
    bool          failback_confirmed_{false};
    bool          automation_halted_{false};
    bool          no_target_alerted_{false};
    bool          rto_escalated_{false};
    bool          unresolved_alerted_{false};
    bool          writes_held_alerted_{false};
    std::uint64_t plan_seq_{0};

    std::mutex              persist_mu_; ///< Taken after mu_
    persist::PersistedState persisted_;
};

} // namespace drguard::engine
