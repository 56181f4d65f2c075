/**
 * @file coordinator.cpp
 * @brief Step implementations and the plan execution loop.
 */
#include "drguard/cutover/coordinator.hpp"
#include "drguard/replication/lag_poller.hpp"

#include <algorithm>
#include <chrono>
#include <exception>
#include <utility>

#include <spdlog/spdlog.h>

namespace drguard::cutover {

namespace {

constexpr std::size_t kHistoryMax = 32;

drguard_detail::unexpected<Error> fail(const Error& e, std::string_view what) {
    return drguard_detail::unexpected<Error>(Error{e.code, std::string(what) + ": " + e.message});
}

std::string region_str(RegionId r) { return "region " + std::to_string(r); }

} // namespace

CutoverCoordinator::CutoverCoordinator(CoordinatorConfig cfg,
                                       backend::StorageBackend& storage,
                                       backend::TrafficRouter& router,
                                       replication::ReplicationLagTracker& lag,
                                       workflow::WorkflowConsistencyGuard& guard,
                                       Clock clock, Sleeper sleeper)
    : cfg_(cfg), storage_(storage), router_(router), lag_(lag), guard_(guard),
      clock_(std::move(clock)), sleep_(std::move(sleeper)) {
    if (!clock_) clock_ = &drguard::now_ms;
    if (!sleep_) {
        sleep_ = [](std::uint32_t ms) { std::this_thread::sleep_for(std::chrono::milliseconds(ms)); };
    }
}

CutoverCoordinator::~CutoverCoordinator() { join(); }

void CutoverCoordinator::set_progress_listener(ProgressListener listener) {
    std::lock_guard lk(mu_);
    listener_ = std::move(listener);
}

Result<void> CutoverCoordinator::claim(const CutoverPlan& plan, std::optional<PlanProgress> resume) {
    if (plan.steps.empty()) return make_error(ErrorCode::InvalidArgument, "plan has no steps");
    if (resume && (resume->plan_id != plan.id || resume->steps.size() != plan.steps.size())) {
        return make_error(ErrorCode::InvalidArgument, "resume progress does not belong to plan " + plan.id);
    }

    std::lock_guard lk(mu_);
    if (active_ && !active_->progress.terminal()) {
        return make_error(ErrorCode::PlanInProgress,
                          "plan " + active_->plan.id + " is " + std::string(to_string(active_->progress.status)));
    }
    Run r{.plan = plan, .progress = resume ? std::move(*resume) : make_progress(plan)};
    r.progress.status = PlanStatus::Pending;
    r.progress.error.clear();
    r.progress.finished_ms = 0;
    r.sealed = r.progress.committed;
    active_ = std::move(r);
    return {};
}

Result<PlanProgress> CutoverCoordinator::execute(const CutoverPlan& plan, std::optional<PlanProgress> resume) {
    if (auto c = claim(plan, std::move(resume)); !c) return drguard_detail::unexpected<Error>(c.error());
    run();
    std::lock_guard lk(mu_);
    return active_->progress;
}

Result<void> CutoverCoordinator::submit(const CutoverPlan& plan, std::optional<PlanProgress> resume) {
    if (auto c = claim(plan, std::move(resume)); !c) return c;
    if (cfg_.run_inline) {
        run();
        return {};
    }
    std::lock_guard wk(worker_mu_);
    if (worker_.joinable()) worker_.join(); // previous plan is terminal; its thread is finishing
    worker_ = std::thread([this] { run(); });
    return {};
}

void CutoverCoordinator::join() {
    std::lock_guard wk(worker_mu_);
    if (worker_.joinable()) worker_.join();
}

bool CutoverCoordinator::busy() const {
    std::lock_guard lk(mu_);
    return active_ && !active_->progress.terminal();
}

std::optional<PlanProgress> CutoverCoordinator::progress(const std::string& plan_id) const {
    std::lock_guard lk(mu_);
    if (active_ && active_->plan.id == plan_id) return active_->progress;
    auto it = history_.find(plan_id);
    if (it == history_.end()) return std::nullopt;
    return it->second;
}

std::optional<PlanProgress> CutoverCoordinator::current() const {
    std::lock_guard lk(mu_);
    if (!active_) return std::nullopt;
    return active_->progress;
}

Result<void> CutoverCoordinator::cancel(const std::string& plan_id) {
    std::lock_guard lk(mu_);
    if (!active_ || active_->plan.id != plan_id || active_->progress.terminal()) {
        return make_error(ErrorCode::NoActivePlan, "plan " + plan_id + " is not running");
    }
    if (active_->sealed || active_->progress.committed) {
        return make_error(ErrorCode::PlanCommitted,
                          "plan " + plan_id + " passed a committing step and must run to completion");
    }
    active_->cancel_requested = true;
    spdlog::warn("cutover: cancellation requested for plan {}", plan_id);
    return {};
}

Result<void> CutoverCoordinator::release_source_writes(const CutoverPlan& plan) {
    if (busy()) return make_error(ErrorCode::PlanInProgress, "a cutover plan is running");
    if (auto r = reopen_writes(plan.source); !r) {
        spdlog::error("cutover: cannot release writes on {} held by plan {}: {}",
                      region_str(plan.source), plan.id, r.error().message);
        return r;
    }
    std::lock_guard lk(mu_);
    if (active_ && active_->plan.id == plan.id) active_->progress.source_writes_blocked = false;
    if (auto it = history_.find(plan.id); it != history_.end()) it->second.source_writes_blocked = false;
    spdlog::warn("cutover: writes re-enabled on {} after plan {}", region_str(plan.source), plan.id);
    return {};
}

Result<void> CutoverCoordinator::reopen_writes(RegionId region) {
    try {
        auto blocked = router_.writes_blocked(region);
        if (!blocked) return fail(blocked.error(), "writes_blocked");
        if (!*blocked) return {};
        if (auto r = router_.allow_writes(region); !r) return fail(r.error(), "allow_writes");
        return {};
    } catch (const std::exception& e) {
        return make_error(ErrorCode::BackendFailure, std::string("router threw: ") + e.what());
    }
}

bool CutoverCoordinator::cancel_requested() const {
    std::lock_guard lk(mu_);
    return active_ && active_->cancel_requested;
}

template <class Fn>
void CutoverCoordinator::update(Fn&& fn) {
    CutoverPlan plan;
    PlanProgress snap;
    ProgressListener listener;
    {
        std::lock_guard lk(mu_);
        fn(*active_);
        snap = active_->progress;
        plan = active_->plan;
        listener = listener_;
        if (snap.terminal()) {
            if (history_.insert_or_assign(snap.plan_id, snap).second) history_order_.push_back(snap.plan_id);
            while (history_order_.size() > kHistoryMax) {
                history_.erase(history_order_.front());
                history_order_.pop_front();
            }
        }
    }
    if (!listener) return;
    try {
        listener(plan, snap);
    } catch (const std::exception& e) {
        spdlog::error("cutover: progress listener failed for plan {}: {}", snap.plan_id, e.what());
    }
}

void CutoverCoordinator::run() {
    CutoverPlan plan;
    {
        std::lock_guard lk(mu_);
        plan = active_->plan;
    }
    spdlog::info("cutover: plan {} ({}) {} -> {} started",
                 plan.id, to_string(plan.kind), region_str(plan.source), region_str(plan.target));
    update([](Run& r) { r.progress.status = PlanStatus::Running; });

    const std::size_t n = plan.steps.size();
    for (std::size_t i = 0; i < n; ++i) {
        const StepKind kind = plan.steps[i];

        bool done = false;
        bool cancelled = false;
        {
            std::lock_guard lk(mu_);
            Run& r = *active_;
            if (r.progress.steps[i].state == StepState::Succeeded) {
                done = true;
            } else if (r.cancel_requested && !r.sealed) {
                cancelled = true;
            } else if (is_committing(kind)) {
                r.sealed = true;
            }
        }
        if (done) {
            spdlog::debug("cutover: plan {} step {}/{} {} already succeeded", plan.id, i + 1, n, to_string(kind));
            continue;
        }
        if (cancelled) {
            finish_cancelled(plan);
            return;
        }

        update([&](Run& r) {
            auto& sp = r.progress.steps[i];
            sp.state = StepState::Running;
            sp.attempts++;
            sp.started_ms = clock_();
            sp.finished_ms = 0;
            sp.detail.clear();
        });

        Result<std::string> res = run_step(plan, kind);
        const TimestampMs now = clock_();

        if (res) {
            update([&](Run& r) {
                auto& sp = r.progress.steps[i];
                sp.state = StepState::Succeeded;
                sp.finished_ms = now;
                sp.detail = *res;
                r.progress.last_successful_step = i + 1;
                if (kind == StepKind::StopWrites) r.progress.source_writes_blocked = true;
                if (is_committing(kind)) r.progress.committed = true;
            });
            spdlog::info("cutover: plan {} step {}/{} {} ok: {}", plan.id, i + 1, n, to_string(kind), *res);
            continue;
        }

        if (kind == StepKind::DrainReplication && cancel_requested()) {
            update([&](Run& r) {
                auto& sp = r.progress.steps[i];
                sp.state = StepState::Skipped;
                sp.finished_ms = now;
                sp.detail = "interrupted by cancellation";
            });
            finish_cancelled(plan);
            return;
        }

        std::string why = "step " + std::to_string(i + 1) + " (" + std::string(to_string(kind)) +
                          ") failed: " + res.error().message;
        bool sealed = false;
        {
            std::lock_guard lk(mu_);
            sealed = active_->sealed;
        }
        bool reopened = false;
        if (!sealed) {
            if (auto w = reopen_writes(plan.source); w) {
                reopened = true;
            } else {
                why += "; writes on " + region_str(plan.source) + " still blocked: " + w.error().message;
            }
        }
        update([&](Run& r) {
            auto& sp = r.progress.steps[i];
            sp.state = StepState::Failed;
            sp.finished_ms = now;
            sp.detail = res.error().message;
            r.progress.status = r.progress.last_successful_step == 0 ? PlanStatus::Failed : PlanStatus::Partial;
            r.progress.error = why;
            r.progress.finished_ms = now;
            if (reopened) r.progress.source_writes_blocked = false;
        });
        spdlog::error("cutover: plan {} halted: {}", plan.id, why);
        if (reopened) {
            spdlog::warn("cutover: plan {} halted before commit; writes re-enabled on {}",
                         plan.id, region_str(plan.source));
        }
        return;
    }

    update([&](Run& r) {
        r.progress.status = PlanStatus::Succeeded;
        r.progress.finished_ms = clock_();
    });
    spdlog::info("cutover: plan {} succeeded; traffic on {}", plan.id, region_str(plan.target));
}

void CutoverCoordinator::finish_cancelled(const CutoverPlan& plan) {
    std::string note;
    const auto reopened = reopen_writes(plan.source);
    if (!reopened) {
        note = "could not re-enable writes on source: " + reopened.error().message;
        spdlog::error("cutover: plan {} cancel: {}", plan.id, note);
    }

    const TimestampMs now = clock_();
    update([&](Run& r) {
        for (auto& sp : r.progress.steps) {
            if (sp.state == StepState::Pending || sp.state == StepState::Running) sp.state = StepState::Skipped;
        }
        r.progress.status = PlanStatus::Cancelled;
        r.progress.error = note;
        r.progress.finished_ms = now;
        if (reopened) r.progress.source_writes_blocked = false;
    });
    if (reopened) {
        spdlog::warn("cutover: plan {} cancelled before commit; writes re-enabled on {}",
                     plan.id, region_str(plan.source));
    }
}

Result<std::string> CutoverCoordinator::run_step(const CutoverPlan& plan, StepKind kind) {
    try {
        switch (kind) {
            case StepKind::StopWrites:         return stop_writes(plan);
            case StepKind::DrainReplication:   return drain_replication(plan);
            case StepKind::PromoteStorage:     return promote_storage(plan);
            case StepKind::RedirectTraffic:    return redirect_traffic(plan);
            case StepKind::ReconcileWorkflows: return reconcile_workflows(plan);
            case StepKind::MarkSucceeded:      return std::string("plan complete");
        }
    } catch (const std::exception& e) {
        return make_error(ErrorCode::BackendFailure, std::string("backend threw: ") + e.what());
    }
    return make_error(ErrorCode::InvalidArgument, "unknown step");
}

Result<std::string> CutoverCoordinator::stop_writes(const CutoverPlan& plan) {
    auto blocked = router_.writes_blocked(plan.source);
    if (!blocked) return fail(blocked.error(), "writes_blocked");
    if (*blocked) return "writes already blocked in " + region_str(plan.source);
    if (auto r = router_.block_writes(plan.source); !r) return fail(r.error(), "block_writes");
    return "writes blocked in " + region_str(plan.source);
}

Result<std::string> CutoverCoordinator::drain_replication(const CutoverPlan& plan) {
    replication::LagPoller poller(storage_, lag_);
    const TimestampMs deadline = clock_() + cfg_.drain_timeout_ms;
    LagReading last;
    for (;;) {
        const TimestampMs now = clock_();
        poller.poll_once(plan.target, now);
        last = lag_.worst_lag_into(plan.target, now);

        if (last.within(cfg_.rpo_bound_ms)) {
            return "lag into " + region_str(plan.target) + " is " + std::to_string(last.lag_ms) +
                   " ms (bound " + std::to_string(cfg_.rpo_bound_ms) + " ms)";
        }
        if (!last.stale() && cfg_.accepted_loss_window_ms > 0 && last.lag_ms <= cfg_.accepted_loss_window_ms) {
            spdlog::warn("cutover: plan {} accepting {} ms of replication lag as data-loss window",
                         plan.id, last.lag_ms);
            return "lag " + std::to_string(last.lag_ms) + " ms accepted within loss window of " +
                   std::to_string(cfg_.accepted_loss_window_ms) + " ms";
        }
        if (cancel_requested()) return make_error(ErrorCode::Timeout, "drain interrupted");
        if (now >= deadline) {
            return make_error(ErrorCode::Timeout,
                              "lag into " + region_str(plan.target) + " did not drain below " +
                              std::to_string(cfg_.rpo_bound_ms) + " ms within " +
                              std::to_string(cfg_.drain_timeout_ms) + " ms (last: " +
                              (last.stale() ? std::string("stale") : std::to_string(last.lag_ms) + " ms") + ")");
        }
        sleep_(cfg_.drain_poll_ms);
    }
}

Result<std::string> CutoverCoordinator::promote_storage(const CutoverPlan& plan) {
    std::size_t promoted = 0;
    std::size_t already = 0;
    for (const auto& store : lag_.stores()) {
        auto w = storage_.is_writable(plan.target, store);
        if (!w) return fail(w.error(), "is_writable(" + store + ")");
        if (*w) {
            ++already;
            continue;
        }
        if (auto r = storage_.promote_to_writable(plan.target, store); !r) {
            return fail(r.error(), "promote_to_writable(" + store + ")");
        }
        ++promoted;
    }
    return "promoted " + std::to_string(promoted) + " store(s), " + std::to_string(already) +
           " already writable in " + region_str(plan.target);
}

Result<std::string> CutoverCoordinator::redirect_traffic(const CutoverPlan& plan) {
    auto blocked = router_.writes_blocked(plan.target);
    if (!blocked) return fail(blocked.error(), "writes_blocked");
    if (*blocked) {
        if (auto r = router_.allow_writes(plan.target); !r) return fail(r.error(), "allow_writes");
    }
    auto active = router_.active_region();
    if (!active) return fail(active.error(), "active_region");
    if (*active == plan.target) return "traffic already on " + region_str(plan.target);
    if (auto r = router_.set_active_region(plan.target); !r) return fail(r.error(), "set_active_region");
    return "traffic redirected to " + region_str(plan.target);
}

Result<std::string> CutoverCoordinator::reconcile_workflows(const CutoverPlan& plan) {
    auto rep = guard_.reconcile(plan.source, plan.target);
    if (!rep) return fail(rep.error(), "reconcile");
    const auto manual = rep->count(workflow::ReconcileAction::ManualReview);
    if (manual > 0) {
        spdlog::warn("cutover: plan {} left {} workflow(s) for manual reconciliation", plan.id, manual);
    }
    return std::to_string(rep->entries.size()) + " workflow(s) reconciled, " + std::to_string(manual) +
           " awaiting manual review";
}

} // namespace drguard::cutover
