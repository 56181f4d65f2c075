/**
 * @file failover_engine.cpp
 * @brief Transition rules, plan lifecycle and durable state of the failover engine.
 */
#include "drguard/engine/failover_engine.hpp"

#include <string>
#include <utility>

#include <spdlog/spdlog.h>

namespace drguard::engine {

namespace {

/// Upper bound on transitions applied in one cycle (DEGRADED -> PENDING -> SECONDARY needs three).
constexpr int kMaxPasses = 5;

std::string region_str(RegionId r) { return "region " + std::to_string(r); }

Severity severity_for(OperatingMode from, OperatingMode to) noexcept {
    switch (to) {
        case OperatingMode::PrimaryActive:   return Severity::Info;
        case OperatingMode::Recovering:      return Severity::Info;
        case OperatingMode::Degraded:
            return from == OperatingMode::FailoverPending ? Severity::Critical : Severity::Warning;
        case OperatingMode::FailoverPending: return Severity::Warning;
        case OperatingMode::SecondaryActive: return Severity::Warning;
    }
    return Severity::Warning;
}

} // namespace

FailoverEngine::FailoverEngine(EngineConfig cfg,
                               health::HealthAggregator& health,
                               replication::ReplicationLagTracker& lag,
                               cutover::CutoverCoordinator& coordinator,
                               workflow::WorkflowConsistencyGuard& guard,
                               persist::StateStore& store,
                               obs::AlertDispatcher& alerts,
                               persist::PlanJournal* journal,
                               obs::Observer* observer)
    : cfg_(cfg), health_(health), lag_(lag), coordinator_(coordinator), guard_(guard),
      store_(store), alerts_(alerts), journal_(journal), observer_(observer) {
    coordinator_.set_progress_listener([this](const cutover::CutoverPlan& plan, const cutover::PlanProgress& p) {
        std::lock_guard pk(persist_mu_);
        if (!persisted_.plan || persisted_.plan->id != plan.id) return;
        persist::PersistedState next = persisted_;
        next.progress = p;
        if (auto r = store_.save(next); !r) {
            spdlog::error("engine: cannot persist progress of plan {}: {}", plan.id, r.error().message);
            alerts_.notify(Severity::Critical, "cannot persist progress of plan " + plan.id + ": " + r.error().message);
            return;
        }
        persisted_ = std::move(next);
    });
}

FailoverEngine::~FailoverEngine() {
    coordinator_.join();
    coordinator_.set_progress_listener({});
}

// ---------------------------------------------------------------------------
// Durable state
// ---------------------------------------------------------------------------

persist::PersistedState FailoverEngine::durable_view(OperatingMode mode, TimestampMs since) const {
    persist::PersistedState s;
    s.mode = mode;
    s.mode_since_ms = since;
    s.active_region = active_region_;
    s.plan = plan_;
    s.progress = progress_;
    s.failback_confirmed = failback_confirmed_;
    s.automation_halted = automation_halted_;
    s.plan_seq = plan_seq_;
    return s;
}

Result<void> FailoverEngine::persist(const persist::PersistedState& next) {
    std::lock_guard pk(persist_mu_);
    persist::PersistedState merged = next;
    // The progress listener owns progress of an existing plan.
    if (merged.plan && persisted_.plan && persisted_.plan->id == merged.plan->id && persisted_.progress) {
        merged.progress = persisted_.progress;
    }
    if (auto r = store_.save(merged); !r) return r;
    persisted_ = std::move(merged);
    return {};
}

Result<void> FailoverEngine::restore(TimestampMs now) {
    std::lock_guard lk(mu_);
    auto loaded = store_.load();
    if (!loaded) {
        spdlog::critical("engine: cannot load persisted state: {}", loaded.error().message);
        alert(Severity::Critical, "cannot load persisted engine state: " + loaded.error().message);
        return drguard_detail::unexpected<Error>(loaded.error());
    }

    if (!*loaded) {
        mode_ = OperatingMode::PrimaryActive;
        mode_since_ms_ = now;
        active_region_ = cfg_.primary;
        if (auto r = persist(durable_view(mode_, now)); !r) {
            spdlog::critical("engine: cannot persist initial state: {}", r.error().message);
            alert(Severity::Critical, "cannot persist initial engine state: " + r.error().message);
            return r;
        }
        health_.set_active_region(active_region_);
        restored_ = true;
        spdlog::info("engine: no persisted state; starting in {}", to_string(mode_));
        return {};
    }

    const persist::PersistedState& st = **loaded;
    {
        std::lock_guard pk(persist_mu_);
        persisted_ = st;
    }
    mode_ = st.mode;
    mode_since_ms_ = st.mode_since_ms;
    active_region_ = st.active_region;
    plan_ = st.plan;
    progress_ = st.progress;
    failback_confirmed_ = st.failback_confirmed;
    automation_halted_ = st.automation_halted;
    plan_seq_ = st.plan_seq;
    plan_closed_ = !plan_ || !progress_ ||
                   (progress_->terminal() && mode_ != OperatingMode::FailoverPending &&
                    !(mode_ == OperatingMode::Recovering && failback_started()));
    health_.set_active_region(active_region_);
    restored_ = true;
    spdlog::info("engine: restored mode {} (since {}) with traffic on {}",
                 to_string(mode_), mode_since_ms_, region_str(active_region_));

    if (plan_ && progress_ && !progress_->terminal()) {
        spdlog::warn("engine: resuming plan {} from step {}", plan_->id, progress_->last_successful_step + 1);
        alert(Severity::Warning, "resuming cutover plan " + plan_->id + " after restart from step " +
                                 std::to_string(progress_->last_successful_step + 1));
        if (auto r = coordinator_.submit(*plan_, progress_); !r) {
            spdlog::error("engine: cannot resume plan {}: {}", plan_->id, r.error().message);
            alert(Severity::Critical, "cannot resume plan " + plan_->id + ": " + r.error().message);
        }
    }
    return {};
}

// ---------------------------------------------------------------------------
// Decision cycle
// ---------------------------------------------------------------------------

FailoverEngine::Verdicts FailoverEngine::read_verdicts() const {
    Verdicts v;
    auto snap = health_.snapshot();
    if (auto it = snap->verdicts.find(cfg_.primary); it != snap->verdicts.end()) v.primary = it->second.status;
    if (auto it = snap->verdicts.find(cfg_.secondary); it != snap->verdicts.end()) v.secondary = it->second.status;
    return v;
}

DecisionCycle FailoverEngine::evaluate(TimestampMs now) {
    std::lock_guard lk(mu_);
    DecisionCycle cycle{mode_, mode_, {}};
    if (!restored_) {
        spdlog::warn("engine: state not restored; decision cycle skipped");
        return cycle;
    }
    settle(now, cycle);
    cycle.after = mode_;
    observe(obs::EventKind::Cycle, now, cycle.before, cycle.after, {});
    return cycle;
}

void FailoverEngine::settle(TimestampMs now, DecisionCycle& cycle) {
    const Verdicts v = read_verdicts();
    for (int pass = 0; pass < kMaxPasses; ++pass) {
        if (!step(now, v, cycle)) break;
    }
}

bool FailoverEngine::step(TimestampMs now, const Verdicts& v, DecisionCycle& cycle) {
    switch (mode_) {
        case OperatingMode::PrimaryActive:
            if (v.primary != HealthStatus::Healthy) {
                return transition(OperatingMode::Degraded, now,
                                  "primary verdict " + std::string(to_string(v.primary)), cycle);
            }
            return false;

        case OperatingMode::Degraded: {
            if (v.primary == HealthStatus::Healthy) {
                if (primary_writes_held() && !release_primary_writes()) return false;
                no_target_alerted_ = false;
                return transition(OperatingMode::PrimaryActive, now, "primary verdict healthy", cycle);
            }
            if (v.primary != HealthStatus::Unhealthy || automation_halted_) return false;

            std::string why;
            if (!safe_target(cfg_.secondary, v.secondary, now, why)) {
                if (!no_target_alerted_) {
                    no_target_alerted_ = true;
                    spdlog::critical("engine: primary unhealthy and no safe failover target: {}", why);
                    alert(Severity::Critical, "primary region unhealthy and no safe failover target: " + why);
                    observe(obs::EventKind::NoSafeTarget, now, mode_, mode_, why);
                }
                return false;
            }
            return start_plan(cutover::PlanKind::Failover, now, "primary unhealthy; " + why, cycle);
        }

        case OperatingMode::FailoverPending:
            return step_pending(now, cycle);

        case OperatingMode::SecondaryActive: {
            if (v.primary != HealthStatus::Healthy) return false;
            if (!lag_.worst_lag_into(cfg_.primary, now).within(cfg_.rpo_bound_ms)) return false;
            unresolved_alerted_ = false;
            if (!transition(OperatingMode::Recovering, now, "primary stable; fail-back proposed", cycle)) return false;
            if (!failback_confirmed_ && !cfg_.auto_failback) {
                alert(Severity::Info, "fail-back to primary proposed; awaiting operator confirmation");
            }
            return true;
        }

        case OperatingMode::Recovering:
            return step_recovering(now, v, cycle);
    }
    return false;
}

bool FailoverEngine::step_pending(TimestampMs now, DecisionCycle& cycle) {
    auto p = refresh_progress();
    if (!plan_ || !p) {
        alert(Severity::Critical, "FAILOVER_PENDING without a cutover plan");
        return transition(OperatingMode::Degraded, now, "no cutover plan on record", cycle);
    }
    if (!p->terminal()) {
        if (!rto_escalated_ && now >= mode_since_ms_ + cfg_.rto_deadline_ms) {
            rto_escalated_ = true;
            const std::string msg = "failover plan " + plan_->id + " exceeded the RTO deadline of " +
                                    std::to_string(cfg_.rto_deadline_ms) + " ms (last successful step " +
                                    std::to_string(p->last_successful_step) + "/" +
                                    std::to_string(p->steps.size()) + ")";
            spdlog::critical("engine: {}", msg);
            alert(Severity::Critical, msg);
            observe(obs::EventKind::RtoEscalation, now, mode_, mode_, msg);
        }
        return false;
    }
    if (plan_closed_) return false;

    const RegionId prev_active = active_region_;
    const bool prev_halted = automation_halted_;
    const bool prev_confirmed = failback_confirmed_;
    OperatingMode next = OperatingMode::Degraded;
    std::string reason;

    switch (p->status) {
        case cutover::PlanStatus::Succeeded:
            active_region_ = plan_->target;
            failback_confirmed_ = false;
            next = OperatingMode::SecondaryActive;
            reason = "failover plan " + plan_->id + " succeeded";
            break;
        case cutover::PlanStatus::Cancelled:
            automation_halted_ = true;
            reason = "failover plan " + plan_->id + " cancelled";
            break;
        default:
            automation_halted_ = true;
            reason = "failover plan " + plan_->id + " " + std::string(to_string(p->status)) + ": " + p->error;
            break;
    }
    if (!transition(next, now, reason, cycle)) {
        active_region_ = prev_active;
        automation_halted_ = prev_halted;
        failback_confirmed_ = prev_confirmed;
        return false;
    }
    if (p->status == cutover::PlanStatus::Succeeded) health_.set_active_region(active_region_);
    plan_closed_ = true;
    finish_plan(*p, now);
    return true;
}

bool FailoverEngine::step_recovering(TimestampMs now, const Verdicts& v, DecisionCycle& cycle) {
    if (!failback_started()) {
        if (v.primary != HealthStatus::Healthy) {
            return transition(OperatingMode::SecondaryActive, now,
                              "fail-back proposal withdrawn: primary verdict " + std::string(to_string(v.primary)),
                              cycle);
        }
        if (automation_halted_ || (!failback_confirmed_ && !cfg_.auto_failback)) return false;

        std::string why;
        if (!safe_target(cfg_.primary, v.primary, now, why)) return false;
        if (guard_.has_unresolved()) {
            if (!unresolved_alerted_) {
                unresolved_alerted_ = true;
                alert(Severity::Warning, "fail-back held: " + std::to_string(guard_.unresolved().size()) +
                                         " workflow(s) await manual reconciliation");
            }
            return false;
        }
        return start_plan(cutover::PlanKind::Failback, now, "fail-back confirmed; " + why, cycle);
    }

    auto p = refresh_progress();
    if (!p || !p->terminal() || plan_closed_) return false;

    const RegionId prev_active = active_region_;
    const bool prev_halted = automation_halted_;
    const bool prev_confirmed = failback_confirmed_;
    OperatingMode next = OperatingMode::SecondaryActive;
    std::string reason;

    failback_confirmed_ = false;
    switch (p->status) {
        case cutover::PlanStatus::Succeeded:
            active_region_ = plan_->target;
            next = OperatingMode::PrimaryActive;
            reason = "fail-back plan " + plan_->id + " succeeded";
            break;
        case cutover::PlanStatus::Cancelled:
            automation_halted_ = true;
            reason = "fail-back plan " + plan_->id + " cancelled";
            break;
        default:
            automation_halted_ = true;
            reason = "fail-back plan " + plan_->id + " " + std::string(to_string(p->status)) + ": " + p->error;
            break;
    }
    if (!transition(next, now, reason, cycle)) {
        active_region_ = prev_active;
        automation_halted_ = prev_halted;
        failback_confirmed_ = prev_confirmed;
        return false;
    }
    if (p->status == cutover::PlanStatus::Succeeded) health_.set_active_region(active_region_);
    plan_closed_ = true;
    finish_plan(*p, now);
    return true;
}

bool FailoverEngine::transition(OperatingMode to, TimestampMs now, const std::string& reason,
                                DecisionCycle& cycle) {
    const OperatingMode from = mode_;
    if (from == to) return false;

    if (auto r = persist(durable_view(to, now)); !r) {
        spdlog::error("engine: cannot persist {} -> {}: {}; staying in {}",
                      to_string(from), to_string(to), r.error().message, to_string(from));
        alert(Severity::Critical, "cannot persist mode change " + std::string(to_string(from)) + " -> " +
                                  std::string(to_string(to)) + ": " + r.error().message);
        return false;
    }
    mode_ = to;
    mode_since_ms_ = now;
    cycle.transitions.push_back(ModeTransition{from, to, now, reason});

    const Severity sev = severity_for(from, to);
    if (sev == Severity::Info) {
        spdlog::info("engine: mode {} -> {} ({})", to_string(from), to_string(to), reason);
    } else {
        spdlog::warn("engine: mode {} -> {} ({})", to_string(from), to_string(to), reason);
    }
    alert(sev, "mode " + std::string(to_string(from)) + " -> " + std::string(to_string(to)) + ": " + reason);
    observe(obs::EventKind::ModeChange, now, from, to, reason);
    return true;
}

bool FailoverEngine::start_plan(cutover::PlanKind kind, TimestampMs now, const std::string& reason,
                                DecisionCycle& cycle) {
    if (coordinator_.busy()) {
        spdlog::warn("engine: coordinator busy; {} plan not started", to_string(kind));
        return false;
    }
    const bool failover = kind == cutover::PlanKind::Failover;
    const RegionId source = failover ? cfg_.primary : cfg_.secondary;
    const RegionId target = failover ? cfg_.secondary : cfg_.primary;
    const auto plan = cutover::make_cutover_plan(kind, source, target, now, plan_seq_ + 1);

    const OperatingMode from = mode_;
    const OperatingMode to = failover ? OperatingMode::FailoverPending : mode_;
    persist::PersistedState next = durable_view(to, failover ? now : mode_since_ms_);
    next.plan = plan;
    next.progress = cutover::make_progress(plan);
    next.plan_seq = plan_seq_ + 1;
    if (auto r = persist(next); !r) {
        spdlog::error("engine: cannot persist plan {}: {}; {} withheld", plan.id, r.error().message, to_string(kind));
        alert(Severity::Critical, "cannot persist cutover plan; " + std::string(to_string(kind)) +
                                  " withheld: " + r.error().message);
        return false;
    }

    plan_seq_++;
    plan_ = plan;
    progress_ = next.progress;
    plan_closed_ = false;
    rto_escalated_ = false;
    if (failover) {
        mode_ = to;
        mode_since_ms_ = now;
        cycle.transitions.push_back(ModeTransition{from, to, now, reason});
        spdlog::warn("engine: mode {} -> {} ({})", to_string(from), to_string(to), reason);
        observe(obs::EventKind::ModeChange, now, from, to, reason);
    }
    alert(Severity::Warning, std::string(failover ? "failover" : "fail-back") + " to " + region_str(target) +
                             " started (plan " + plan.id + "): " + reason);
    observe(obs::EventKind::PlanStarted, now, from, mode_, reason);

    if (auto r = coordinator_.submit(plan); !r) {
        spdlog::error("engine: plan {} not accepted by coordinator: {}", plan.id, r.error().message);
        alert(Severity::Critical, "plan " + plan.id + " could not be submitted: " + r.error().message);
        progress_->status = cutover::PlanStatus::Failed;
        progress_->error = r.error().message;
        progress_->finished_ms = now;
        save_progress();
    }
    return true;
}

void FailoverEngine::finish_plan(const cutover::PlanProgress& p, TimestampMs now) {
    if (journal_) {
        if (auto r = journal_->append(*plan_, p, now); !r) {
            spdlog::error("engine: cannot journal plan {}: {}", p.plan_id, r.error().message);
        }
    }
    switch (p.status) {
        case cutover::PlanStatus::Succeeded:
            alert(Severity::Info, "plan " + p.plan_id + " succeeded; traffic on " + region_str(active_region_));
            observe(obs::EventKind::PlanSucceeded, now, mode_, mode_, {});
            break;
        case cutover::PlanStatus::Cancelled:
            alert(Severity::Warning, "plan " + p.plan_id + " cancelled before commit; automation held until acknowledged");
            observe(obs::EventKind::PlanCancelled, now, mode_, mode_, p.error);
            break;
        default: {
            const std::string msg = "plan " + p.plan_id + " " + std::string(to_string(p.status)) +
                                    " after step " + std::to_string(p.last_successful_step) + "/" +
                                    std::to_string(p.steps.size()) + ": " + p.error +
                                    "; automation halted until acknowledged";
            spdlog::critical("engine: {}", msg);
            alert(Severity::Critical, msg);
            observe(obs::EventKind::PlanFailed, now, mode_, mode_, p.error);
            break;
        }
    }
}

bool FailoverEngine::safe_target(RegionId region, HealthStatus verdict, TimestampMs now, std::string& why) const {
    if (verdict != HealthStatus::Healthy) {
        why = region_str(region) + " verdict is " + std::string(to_string(verdict));
        return false;
    }
    const LagReading lag = lag_.worst_lag_into(region, now);
    if (lag.stale()) {
        why = "replication lag into " + region_str(region) + " is stale";
        return false;
    }
    if (!lag.within(cfg_.rpo_bound_ms)) {
        why = "replication lag into " + region_str(region) + " is " + std::to_string(lag.lag_ms) +
              " ms (bound " + std::to_string(cfg_.rpo_bound_ms) + " ms)";
        return false;
    }
    why = region_str(region) + " healthy, lag " + std::to_string(lag.lag_ms) + " ms";
    return true;
}

bool FailoverEngine::failback_started() const {
    return plan_ && plan_->kind == cutover::PlanKind::Failback && plan_->created_at_ms >= mode_since_ms_;
}

void FailoverEngine::save_progress() {
    std::lock_guard pk(persist_mu_);
    persist::PersistedState next = persisted_;
    next.progress = progress_;
    if (auto r = store_.save(next); !r) {
        spdlog::error("engine: cannot persist progress of plan {}: {}",
                      progress_ ? progress_->plan_id : std::string("?"), r.error().message);
        return;
    }
    persisted_ = std::move(next);
}

bool FailoverEngine::primary_writes_held() const {
    return plan_ && plan_->kind == cutover::PlanKind::Failover && plan_->source == cfg_.primary && progress_ &&
           progress_->terminal() && progress_->status != cutover::PlanStatus::Succeeded &&
           progress_->source_writes_blocked;
}

bool FailoverEngine::release_primary_writes() {
    if (automation_halted_) {
        if (!writes_held_alerted_) {
            writes_held_alerted_ = true;
            const std::string msg = "primary healthy but its writes stay blocked by plan " + plan_->id +
                                    "; acknowledge the failure to re-enable them";
            spdlog::critical("engine: {}", msg);
            alert(Severity::Critical, msg);
        }
        return false;
    }
    if (auto r = coordinator_.release_source_writes(*plan_); !r) {
        if (!writes_held_alerted_) {
            writes_held_alerted_ = true;
            alert(Severity::Critical, "cannot re-enable writes on " + region_str(cfg_.primary) +
                                      " after plan " + plan_->id + ": " + r.error().message);
        }
        return false;
    }
    writes_held_alerted_ = false;
    progress_->source_writes_blocked = false;
    save_progress();
    spdlog::warn("engine: writes re-enabled on {} left blocked by plan {}", region_str(cfg_.primary), plan_->id);
    alert(Severity::Warning, "writes re-enabled on " + region_str(cfg_.primary) + " after plan " + plan_->id);
    return true;
}

std::optional<cutover::PlanProgress> FailoverEngine::refresh_progress() {
    if (!plan_) return std::nullopt;
    if (auto p = coordinator_.progress(plan_->id)) progress_ = std::move(p);
    return progress_;
}

bool FailoverEngine::plan_in_flight() {
    if (coordinator_.busy()) return true;
    auto p = refresh_progress();
    return p && !p->terminal();
}

// ---------------------------------------------------------------------------
// Operator surface
// ---------------------------------------------------------------------------

Result<std::string> FailoverEngine::request_failover(TimestampMs now) {
    std::lock_guard lk(mu_);
    auto reject = [&](ErrorCode code, const std::string& msg) -> Result<std::string> {
        spdlog::warn("engine: failover request rejected: {}", msg);
        observe(obs::EventKind::RequestRejected, now, mode_, mode_, msg);
        return make_error(code, msg);
    };
    if (!restored_) return reject(ErrorCode::InvalidTransition, "engine state not restored");
    if (plan_in_flight()) {
        return reject(ErrorCode::PlanInProgress, "plan " + (plan_ ? plan_->id : std::string("?")) + " is still running");
    }
    if (automation_halted_) {
        return reject(ErrorCode::AutomationHalted, "previous cutover did not complete; acknowledge it first");
    }
    if (mode_ != OperatingMode::PrimaryActive && mode_ != OperatingMode::Degraded) {
        return reject(ErrorCode::InvalidTransition, "failover not valid in mode " + std::string(to_string(mode_)));
    }
    std::string why;
    if (!safe_target(cfg_.secondary, read_verdicts().secondary, now, why)) {
        return reject(ErrorCode::NoSafeTarget, why);
    }

    DecisionCycle cycle{mode_, mode_, {}};
    if (!start_plan(cutover::PlanKind::Failover, now, "operator request; " + why, cycle)) {
        return make_error(ErrorCode::Io, "failover plan could not be persisted");
    }
    const std::string id = plan_->id;
    step_pending(now, cycle);
    return id;
}

Result<std::string> FailoverEngine::request_failback(TimestampMs now) {
    std::lock_guard lk(mu_);
    auto reject = [&](ErrorCode code, const std::string& msg) -> Result<std::string> {
        spdlog::warn("engine: fail-back request rejected: {}", msg);
        observe(obs::EventKind::RequestRejected, now, mode_, mode_, msg);
        return make_error(code, msg);
    };
    if (!restored_) return reject(ErrorCode::InvalidTransition, "engine state not restored");
    if (plan_in_flight()) {
        return reject(ErrorCode::PlanInProgress, "plan " + (plan_ ? plan_->id : std::string("?")) + " is still running");
    }
    if (automation_halted_) {
        return reject(ErrorCode::AutomationHalted, "previous cutover did not complete; acknowledge it first");
    }
    if (mode_ != OperatingMode::SecondaryActive && mode_ != OperatingMode::Recovering) {
        return reject(ErrorCode::InvalidTransition, "fail-back not valid in mode " + std::string(to_string(mode_)));
    }
    const Verdicts v = read_verdicts();
    std::string why;
    if (!safe_target(cfg_.primary, v.primary, now, why)) return reject(ErrorCode::NoSafeTarget, why);
    if (guard_.has_unresolved()) {
        return reject(ErrorCode::InvalidTransition,
                      std::to_string(guard_.unresolved().size()) + " workflow(s) await manual reconciliation");
    }

    DecisionCycle cycle{mode_, mode_, {}};
    if (mode_ == OperatingMode::SecondaryActive &&
        !transition(OperatingMode::Recovering, now, "operator requested fail-back", cycle)) {
        return make_error(ErrorCode::Io, "RECOVERING could not be persisted");
    }
    const bool prev_confirmed = failback_confirmed_;
    failback_confirmed_ = true;
    if (!start_plan(cutover::PlanKind::Failback, now, "operator request; " + why, cycle)) {
        failback_confirmed_ = prev_confirmed;
        return make_error(ErrorCode::Io, "fail-back plan could not be persisted");
    }
    const std::string id = plan_->id;
    step_recovering(now, v, cycle);
    return id;
}

Result<void> FailoverEngine::confirm_failback() {
    std::lock_guard lk(mu_);
    if (mode_ != OperatingMode::Recovering && mode_ != OperatingMode::SecondaryActive) {
        return make_error(ErrorCode::InvalidTransition,
                          "no fail-back to confirm in mode " + std::string(to_string(mode_)));
    }
    if (failback_confirmed_) return {};
    failback_confirmed_ = true;
    if (auto r = persist(durable_view(mode_, mode_since_ms_)); !r) {
        failback_confirmed_ = false;
        return r;
    }
    spdlog::info("engine: fail-back confirmed by operator");
    alert(Severity::Info, "fail-back confirmed by operator");
    return {};
}

Result<void> FailoverEngine::acknowledge_failure() {
    std::lock_guard lk(mu_);
    if (!automation_halted_) return make_error(ErrorCode::InvalidTransition, "automation is not halted");
    automation_halted_ = false;
    if (auto r = persist(durable_view(mode_, mode_since_ms_)); !r) {
        automation_halted_ = true;
        return r;
    }
    no_target_alerted_ = false;
    writes_held_alerted_ = false;
    spdlog::info("engine: cutover failure acknowledged; automation re-enabled");
    alert(Severity::Info, "cutover failure acknowledged; automation re-enabled");
    return {};
}

Result<void> FailoverEngine::cancel_active_plan() {
    std::lock_guard lk(mu_);
    if (!plan_ || plan_closed_) return make_error(ErrorCode::NoActivePlan, "no cutover plan in flight");
    if (auto r = coordinator_.cancel(plan_->id); !r) {
        spdlog::warn("engine: cancel of plan {} refused: {}", plan_->id, r.error().message);
        return r;
    }
    spdlog::warn("engine: operator cancelled plan {}", plan_->id);
    return {};
}

OperatingMode FailoverEngine::mode() const {
    std::lock_guard lk(mu_);
    return mode_;
}

EngineStatus FailoverEngine::status() const {
    std::lock_guard lk(mu_);
    EngineStatus s;
    s.mode = mode_;
    s.mode_since_ms = mode_since_ms_;
    s.active_region = active_region_;
    s.plan = plan_;
    s.progress = progress_;
    if (plan_) {
        if (auto p = coordinator_.progress(plan_->id)) s.progress = std::move(p);
    }
    s.failback_proposed = mode_ == OperatingMode::Recovering && !failback_started();
    s.failback_confirmed = failback_confirmed_;
    s.automation_halted = automation_halted_;
    s.rto_escalated = rto_escalated_;
    s.unresolved_workflows = guard_.unresolved();
    return s;
}

void FailoverEngine::alert(Severity sev, const std::string& msg) { alerts_.notify(sev, msg); }

void FailoverEngine::observe(obs::EventKind kind, TimestampMs now, OperatingMode from, OperatingMode to,
                             const std::string& reason) {
    if (!observer_) return;
    obs::DecisionEvent e;
    e.kind = kind;
    e.at_ms = now;
    e.from = from;
    e.to = to;
    if (plan_) e.plan_id = plan_->id;
    e.reason = reason;
    observer_->record(e);
}

} // namespace drguard::engine
