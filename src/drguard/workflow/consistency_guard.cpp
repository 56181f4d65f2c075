/**
 * @file consistency_guard.cpp
 */
#include "drguard/workflow/consistency_guard.hpp"
#include "drguard/obs/alert_dispatcher.hpp"

#include <algorithm>
#include <exception>
#include <utility>

#include <spdlog/spdlog.h>

namespace drguard::workflow {

std::size_t ReconcileReport::count(ReconcileAction a) const noexcept {
    return static_cast<std::size_t>(std::count_if(entries.begin(), entries.end(),
                                                  [a](const ReconcileEntry& e) { return e.action == a; }));
}

WorkflowConsistencyGuard::WorkflowConsistencyGuard(backend::WorkflowEngine& engine,
                                                   obs::AlertDispatcher* alerts)
    : engine_(engine), alerts_(alerts) {}

void WorkflowConsistencyGuard::begin(const std::string& id, RegionId region, bool resumable) {
    std::lock_guard lk(mu_);
    ledger_[id] = WorkflowExecutionRecord{.workflow_id = id, .region = region, .resumable = resumable};
}

Result<void> WorkflowConsistencyGuard::start_step(const std::string& id, const std::string& token) {
    std::lock_guard lk(mu_);
    auto it = ledger_.find(id);
    if (it == ledger_.end()) return make_error(ErrorCode::InvalidArgument, "unknown workflow '" + id + "'");
    it->second.idempotency_token = token;
    return {};
}

Result<void> WorkflowConsistencyGuard::commit_step(const std::string& id, int step) {
    std::lock_guard lk(mu_);
    auto it = ledger_.find(id);
    if (it == ledger_.end()) return make_error(ErrorCode::InvalidArgument, "unknown workflow '" + id + "'");
    if (step <= it->second.last_completed_step) {
        return make_error(ErrorCode::OutOfOrder, "step " + std::to_string(step) + " already committed");
    }
    it->second.last_completed_step = step;
    it->second.idempotency_token.clear();
    return {};
}

Result<void> WorkflowConsistencyGuard::finish(const std::string& id) {
    std::lock_guard lk(mu_);
    if (ledger_.erase(id) == 0) return make_error(ErrorCode::InvalidArgument, "unknown workflow '" + id + "'");
    resumed_.erase(id);
    return {};
}

std::string WorkflowConsistencyGuard::resume_key(int step, const std::string& token) {
    return std::to_string(step) + "#" + token;
}

bool WorkflowConsistencyGuard::already_resumed(const std::string& id, int step, const std::string& token) const {
    auto it = resumed_.find(id);
    return it != resumed_.end() && it->second.count(resume_key(step, token)) != 0;
}

void WorkflowConsistencyGuard::note_resumed(const std::string& id, int step, const std::string& token,
                                            std::optional<RegionId> resumed_in) {
    auto& keys = resumed_[id];
    keys.insert(resume_key(step, token));
    auto it = ledger_.find(id);
    if (it == ledger_.end()) return;
    // The resumed step is in progress again under a token the engine has not reported yet.
    keys.insert(resume_key(step, {}));
    it->second.last_completed_step = step - 1;
    it->second.idempotency_token.clear();
    if (resumed_in) it->second.region = *resumed_in;
}

void WorkflowConsistencyGuard::drop(const std::string& id) {
    ledger_.erase(id);
    resumed_.erase(id);
}

Result<void> WorkflowConsistencyGuard::call_resume(const std::string& id, int from_step) {
    try {
        return engine_.resume(id, from_step);
    } catch (const std::exception& e) {
        return make_error(ErrorCode::BackendFailure, e.what());
    }
}

Result<void> WorkflowConsistencyGuard::call_abort(const std::string& id) {
    try {
        return engine_.abort(id);
    } catch (const std::exception& e) {
        return make_error(ErrorCode::BackendFailure, e.what());
    }
}

void WorkflowConsistencyGuard::flag(const WorkflowExecutionRecord& rec, const std::string& why) {
    manual_[rec.workflow_id] = rec;
    spdlog::warn("guard: workflow {} flagged for manual reconciliation: {}", rec.workflow_id, why);
    if (alerts_) {
        alerts_->notify(Severity::Warning,
                        "workflow " + rec.workflow_id + " needs manual reconciliation: " + why);
    }
}

Result<ReconcileReport> WorkflowConsistencyGuard::reconcile(RegionId region, std::optional<RegionId> resumed_in) {
    Result<std::vector<WorkflowExecutionRecord>> listed = make_error(ErrorCode::BackendFailure, "not read");
    try {
        listed = engine_.list_in_flight(region);
    } catch (const std::exception& e) {
        listed = make_error(ErrorCode::BackendFailure, e.what());
    }
    if (!listed) {
        spdlog::error("guard: cannot list in-flight workflows in region {}: {}", region, listed.error().message);
        return make_error(ErrorCode::BackendFailure, "list_in_flight failed: " + listed.error().message);
    }

    std::lock_guard lk(mu_);

    // Merge: the record that progressed furthest wins.
    std::map<std::string, WorkflowExecutionRecord> merged;
    for (const auto& [id, rec] : ledger_) {
        if (rec.region == region && !rec.terminal) merged.emplace(id, rec);
    }
    for (const auto& rec : *listed) {
        if (rec.terminal) continue;
        auto [it, inserted] = merged.emplace(rec.workflow_id, rec);
        if (inserted) continue;
        auto& cur = it->second;
        if (rec.last_completed_step > cur.last_completed_step ||
            (rec.last_completed_step == cur.last_completed_step && cur.idempotency_token.empty())) {
            cur = rec;
        }
    }

    ReconcileReport report;
    report.region = region;
    for (const auto& [id, rec] : merged) report.entries.push_back(resolve_one(rec, resumed_in));

    spdlog::info("guard: region {} reconciled {} workflow(s): {} resumed-next, {} resumed-same, "
                 "{} aborted, {} manual, {} skipped",
                 region, report.entries.size(),
                 report.count(ReconcileAction::ResumedNext), report.count(ReconcileAction::ResumedSame),
                 report.count(ReconcileAction::Aborted), report.count(ReconcileAction::ManualReview),
                 report.count(ReconcileAction::Skipped));
    return report;
}

ReconcileEntry WorkflowConsistencyGuard::resolve_one(const WorkflowExecutionRecord& rec,
                                                     std::optional<RegionId> resumed_in) {
    ReconcileEntry e{.workflow_id = rec.workflow_id};

    if (manual_.find(rec.workflow_id) != manual_.end()) {
        e.action = ReconcileAction::Skipped;
        e.detail = "awaiting manual resolution";
        return e;
    }

    const int in_progress = rec.last_completed_step + 1;
    auto status = backend::SideEffectStatus::NotApplied;
    if (!rec.idempotency_token.empty()) {
        try {
            status = engine_.side_effect_status(rec.workflow_id, rec.idempotency_token);
        } catch (const std::exception& ex) {
            e.action = ReconcileAction::ManualReview;
            e.detail = std::string("side-effect lookup failed: ") + ex.what();
            flag(rec, e.detail);
            return e;
        }
    }

    if (status == backend::SideEffectStatus::Unknown) {
        e.action = ReconcileAction::ManualReview;
        e.detail = "side effect of token " + rec.idempotency_token + " unknown";
        flag(rec, e.detail);
        return e;
    }

    if (status == backend::SideEffectStatus::NotApplied && !rec.resumable) {
        if (auto r = call_abort(rec.workflow_id); !r) {
            e.action = ReconcileAction::ManualReview;
            e.detail = "abort failed: " + r.error().message;
            flag(rec, e.detail);
            return e;
        }
        drop(rec.workflow_id);
        e.action = ReconcileAction::Aborted;
        e.detail = "not resumable outside its origin region";
        return e;
    }

    const bool applied = status == backend::SideEffectStatus::Applied;
    const int from = applied ? in_progress + 1 : in_progress;
    if (already_resumed(rec.workflow_id, from, rec.idempotency_token)) {
        e.action = ReconcileAction::Skipped;
        e.from_step = from;
        e.detail = "already resumed";
        return e;
    }
    if (auto r = call_resume(rec.workflow_id, from); !r) {
        e.action = ReconcileAction::ManualReview;
        e.detail = "resume failed: " + r.error().message;
        flag(rec, e.detail);
        return e;
    }
    note_resumed(rec.workflow_id, from, rec.idempotency_token, resumed_in);
    e.action = applied ? ReconcileAction::ResumedNext : ReconcileAction::ResumedSame;
    e.from_step = from;
    spdlog::debug("guard: workflow {} resumed from step {} ({})", rec.workflow_id, from, to_string(e.action));
    return e;
}

std::vector<WorkflowExecutionRecord> WorkflowConsistencyGuard::unresolved() const {
    std::lock_guard lk(mu_);
    std::vector<WorkflowExecutionRecord> out;
    out.reserve(manual_.size());
    for (const auto& [id, rec] : manual_) out.push_back(rec);
    return out;
}

bool WorkflowConsistencyGuard::has_unresolved() const {
    std::lock_guard lk(mu_);
    return !manual_.empty();
}

Result<void> WorkflowConsistencyGuard::resolve_manually(const std::string& id, ManualResolution resolution) {
    std::lock_guard lk(mu_);
    auto it = manual_.find(id);
    if (it == manual_.end()) {
        return make_error(ErrorCode::InvalidArgument, "workflow '" + id + "' is not awaiting manual resolution");
    }
    const WorkflowExecutionRecord rec = it->second;
    const int in_progress = rec.last_completed_step + 1;

    Result<void> r;
    int from = -1;
    switch (resolution) {
        case ManualResolution::SideEffectApplied:    from = in_progress + 1; break;
        case ManualResolution::SideEffectNotApplied: from = in_progress;     break;
        case ManualResolution::Abort:                break;
    }
    if (from >= 0) {
        if (!already_resumed(id, from, rec.idempotency_token)) {
            r = call_resume(id, from);
            if (r) note_resumed(id, from, rec.idempotency_token, std::nullopt);
        }
    } else {
        r = call_abort(id);
    }
    if (!r) {
        spdlog::error("guard: manual resolution {} of workflow {} failed: {}",
                      to_string(resolution), id, r.error().message);
        return r;
    }
    manual_.erase(it);
    if (from < 0) drop(id);
    spdlog::info("guard: workflow {} resolved manually ({})", id, to_string(resolution));
    return {};
}

std::optional<WorkflowExecutionRecord> WorkflowConsistencyGuard::record(const std::string& id) const {
    std::lock_guard lk(mu_);
    auto it = ledger_.find(id);
    if (it == ledger_.end()) return std::nullopt;
    return it->second;
}

std::vector<WorkflowExecutionRecord> WorkflowConsistencyGuard::records() const {
    std::lock_guard lk(mu_);
    std::vector<WorkflowExecutionRecord> out;
    out.reserve(ledger_.size());
    for (const auto& [id, rec] : ledger_) out.push_back(rec);
    return out;
}

std::string_view to_string(ReconcileAction a) noexcept {
    switch (a) {
        case ReconcileAction::ResumedNext:  return "resumed_next";
        case ReconcileAction::ResumedSame:  return "resumed_same";
        case ReconcileAction::Aborted:      return "aborted";
        case ReconcileAction::ManualReview: return "manual_review";
        case ReconcileAction::Skipped:      return "skipped";
    }
    return "unknown";
}

std::string_view to_string(ManualResolution r) noexcept {
    switch (r) {
        case ManualResolution::SideEffectApplied:    return "side_effect_applied";
        case ManualResolution::SideEffectNotApplied: return "side_effect_not_applied";
        case ManualResolution::Abort:                return "abort";
    }
    return "unknown";
}

} // namespace drguard::workflow

namespace drguard::backend {

std::string_view to_string(SideEffectStatus s) noexcept {
    switch (s) {
        case SideEffectStatus::Applied:    return "applied";
        case SideEffectStatus::NotApplied: return "not_applied";
        case SideEffectStatus::Unknown:    return "unknown";
    }
    return "unknown";
}

} // namespace drguard::backend
