#pragma once
/**
 * @file cutover_plan.hpp
 * @brief Immutable cutover plans and their mutable progress records.
 */

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "drguard/core/types.hpp"

namespace drguard::cutover {

enum class PlanKind : std::uint8_t { Failover, Failback };

/**
 * @enum StepKind
 * @brief Ordered cutover steps. Fail-back runs the same sequence toward the primary.
 */
enum class StepKind : std::uint8_t {
    StopWrites,          ///< Block new writes on the source region
    DrainReplication,    ///< Wait for lag into the target to fall below the RPO bound
    PromoteStorage,      ///< Make every store in the target region writable
    RedirectTraffic,     ///< Point routing at the target region
    ReconcileWorkflows,  ///< Resume or abort in-flight workflows
    MarkSucceeded        ///< Terminal bookkeeping
};

/// Steps with an external side effect that cannot be cancelled once completed.
[[nodiscard]] constexpr bool is_committing(StepKind k) noexcept {
    return k == StepKind::PromoteStorage || k == StepKind::RedirectTraffic ||
           k == StepKind::ReconcileWorkflows;
}

/** @struct CutoverPlan
 *  @brief Built once by the engine; never mutated afterwards.
 */
struct CutoverPlan {
    std::string   id;
    PlanKind      kind{PlanKind::Failover};
    OperatingMode from_mode{OperatingMode::FailoverPending};
    OperatingMode to_mode{OperatingMode::SecondaryActive};
    RegionId      source{kPrimaryRegion};
    RegionId      target{kSecondaryRegion};
    TimestampMs   created_at_ms{0};
    std::vector<StepKind> steps;
};

enum class StepState : std::uint8_t { Pending, Running, Succeeded, Failed, Skipped };

struct StepProgress {
    StepKind      kind{StepKind::StopWrites};
    StepState     state{StepState::Pending};
    std::uint32_t attempts{0};
    TimestampMs   started_ms{0};
    TimestampMs   finished_ms{0};
    std::string   detail;
};

enum class PlanStatus : std::uint8_t { Pending, Running, Succeeded, Failed, Partial, Cancelled };

/** @struct PlanProgress
 *  @brief Execution record of one plan. FAILED = nothing succeeded; PARTIAL = halted after a success.
 */
struct PlanProgress {
    std::string  plan_id;
    PlanStatus   status{PlanStatus::Pending};
    std::size_t  last_successful_step{0}; ///< 1-based; 0 = none
    bool         committed{false};        ///< A committing step completed; cancellation refused
    bool         source_writes_blocked{false}; ///< STOP_WRITES holds the source and nothing re-enabled it
    std::vector<StepProgress> steps;
    std::string  error;
    TimestampMs  finished_ms{0};

    [[nodiscard]] bool terminal() const noexcept {
        return status == PlanStatus::Succeeded || status == PlanStatus::Failed ||
               status == PlanStatus::Partial   || status == PlanStatus::Cancelled;
    }
};

/// Fresh progress record with one Pending entry per step of @p plan.
PlanProgress make_progress(const CutoverPlan& plan);

/// Standard six-step plan from @p source to @p target. @p seq disambiguates ids created in the same millisecond.
CutoverPlan make_cutover_plan(PlanKind kind, RegionId source, RegionId target,
                              TimestampMs now, std::uint64_t seq);

std::string_view to_string(PlanKind k) noexcept;
std::string_view to_string(StepKind k) noexcept;
std::string_view to_string(StepState s) noexcept;
std::string_view to_string(PlanStatus s) noexcept;

std::optional<PlanKind>   plan_kind_from_string(std::string_view s) noexcept;
std::optional<StepKind>   step_kind_from_string(std::string_view s) noexcept;
std::optional<StepState>  step_state_from_string(std::string_view s) noexcept;
std::optional<PlanStatus> plan_status_from_string(std::string_view s) noexcept;

} // namespace drguard::cutover
