#include "drguard/cutover/cutover_plan.hpp"

#include <array>
#include <utility>

namespace drguard::cutover {

PlanProgress make_progress(const CutoverPlan& plan) {
    PlanProgress p;
    p.plan_id = plan.id;
    p.steps.reserve(plan.steps.size());
    for (StepKind k : plan.steps) p.steps.push_back(StepProgress{.kind = k});
    return p;
}

CutoverPlan make_cutover_plan(PlanKind kind, RegionId source, RegionId target,
                              TimestampMs now, std::uint64_t seq) {
    CutoverPlan plan;
    const bool failover = kind == PlanKind::Failover;
    plan.id = std::string(failover ? "fo-" : "fb-") + std::to_string(now) + "-" + std::to_string(seq);
    plan.kind = kind;
    plan.from_mode = failover ? OperatingMode::FailoverPending : OperatingMode::Recovering;
    plan.to_mode   = failover ? OperatingMode::SecondaryActive : OperatingMode::PrimaryActive;
    plan.source = source;
    plan.target = target;
    plan.created_at_ms = now;
    plan.steps = {StepKind::StopWrites, StepKind::DrainReplication, StepKind::PromoteStorage,
                  StepKind::RedirectTraffic, StepKind::ReconcileWorkflows, StepKind::MarkSucceeded};
    return plan;
}

namespace {

constexpr std::array<std::pair<PlanKind, std::string_view>, 2> kPlanKinds{{
    {PlanKind::Failover, "failover"}, {PlanKind::Failback, "failback"}}};

constexpr std::array<std::pair<StepKind, std::string_view>, 6> kStepKinds{{
    {StepKind::StopWrites, "stop_writes"},
    {StepKind::DrainReplication, "drain_replication"},
    {StepKind::PromoteStorage, "promote_storage"},
    {StepKind::RedirectTraffic, "redirect_traffic"},
    {StepKind::ReconcileWorkflows, "reconcile_workflows"},
    {StepKind::MarkSucceeded, "mark_succeeded"}}};

constexpr std::array<std::pair<StepState, std::string_view>, 5> kStepStates{{
    {StepState::Pending, "pending"}, {StepState::Running, "running"},
    {StepState::Succeeded, "succeeded"}, {StepState::Failed, "failed"},
    {StepState::Skipped, "skipped"}}};

constexpr std::array<std::pair<PlanStatus, std::string_view>, 6> kPlanStatuses{{
    {PlanStatus::Pending, "pending"}, {PlanStatus::Running, "running"},
    {PlanStatus::Succeeded, "succeeded"}, {PlanStatus::Failed, "failed"},
    {PlanStatus::Partial, "partial"}, {PlanStatus::Cancelled, "cancelled"}}};

template <class E, std::size_t N>
std::string_view name_of(const std::array<std::pair<E, std::string_view>, N>& table, E v) noexcept {
    for (const auto& [e, name] : table) if (e == v) return name;
    return "unknown";
}

template <class E, std::size_t N>
std::optional<E> parse(const std::array<std::pair<E, std::string_view>, N>& table, std::string_view s) noexcept {
    for (const auto& [e, name] : table) if (name == s) return e;
    return std::nullopt;
}

} // namespace

std::string_view to_string(PlanKind k) noexcept   { return name_of(kPlanKinds, k); }
std::string_view to_string(StepKind k) noexcept   { return name_of(kStepKinds, k); }
std::string_view to_string(StepState s) noexcept  { return name_of(kStepStates, s); }
std::string_view to_string(PlanStatus s) noexcept { return name_of(kPlanStatuses, s); }

std::optional<PlanKind>   plan_kind_from_string(std::string_view s) noexcept   { return parse(kPlanKinds, s); }
std::optional<StepKind>   step_kind_from_string(std::string_view s) noexcept   { return parse(kStepKinds, s); }
std::optional<StepState>  step_state_from_string(std::string_view s) noexcept  { return parse(kStepStates, s); }
std::optional<PlanStatus> plan_status_from_string(std::string_view s) noexcept { return parse(kPlanStatuses, s); }

} // namespace drguard::cutover
