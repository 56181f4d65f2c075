/**
 * @file sim_backends.cpp
 * @brief Implementation of the in-memory backends.
 */
#include "drguard/sim/sim_backends.hpp"

#include <algorithm>
#include <stdexcept>

namespace drguard::sim {

    // ---------------------------------------------------------------- storage

    Result<std::uint64_t> SimStorage::current_lag(const std::string& store, RegionId replica) {
        std::lock_guard lk(mu_);
        if (fail_lag_) return make_error(ErrorCode::BackendFailure, "lag metric unavailable");
        auto it = lag_.find({replica, store});
        return it == lag_.end() ? 0 : it->second;
    }

    Result<void> SimStorage::promote_to_writable(RegionId region, const std::string& store) {
        std::lock_guard lk(mu_);
        ++promote_calls_;
        if (fail_promotion_) return make_error(ErrorCode::BackendFailure, "promotion of " + store + " rejected");
        auto& w = writable_[{region, store}];
        if (!w) {
            w = true;
            ++promotions_[{region, store}];
        }
        return {};
    }

    Result<bool> SimStorage::is_writable(RegionId region, const std::string& store) {
        std::lock_guard lk(mu_);
        auto it = writable_.find({region, store});
        if (it != writable_.end()) return it->second;
        return region == writable_region_;
    }

    void SimStorage::set_lag(const std::string& store, RegionId replica, std::uint64_t lag_ms) {
        std::lock_guard lk(mu_);
        lag_[{replica, store}] = lag_ms;
    }

    void SimStorage::set_writable(RegionId region, const std::string& store, bool writable) {
        std::lock_guard lk(mu_);
        writable_[{region, store}] = writable;
    }

    void SimStorage::fail_lag_reads(bool fail) {
        std::lock_guard lk(mu_);
        fail_lag_ = fail;
    }

    void SimStorage::fail_promotion(bool fail) {
        std::lock_guard lk(mu_);
        fail_promotion_ = fail;
    }

    std::size_t SimStorage::promotions(RegionId region, const std::string& store) const {
        std::lock_guard lk(mu_);
        auto it = promotions_.find({region, store});
        return it == promotions_.end() ? 0 : it->second;
    }

    std::size_t SimStorage::promote_calls() const {
        std::lock_guard lk(mu_);
        return promote_calls_;
    }

    // ---------------------------------------------------------------- routing

    Result<void> SimRouter::set_active_region(RegionId region) {
        std::lock_guard lk(mu_);
        if (fail_redirect_) return make_error(ErrorCode::BackendFailure, "routing update rejected");
        if (active_ != region) {
            active_ = region;
            ++redirect_calls_;
        }
        return {};
    }

    Result<RegionId> SimRouter::active_region() {
        std::lock_guard lk(mu_);
        return active_;
    }

    Result<bool> SimRouter::health_check_status(RegionId region) {
        std::lock_guard lk(mu_);
        auto it = health_.find(region);
        return it == health_.end() ? true : it->second;
    }

    Result<void> SimRouter::block_writes(RegionId region) {
        std::lock_guard lk(mu_);
        if (blocked_.insert(region).second) ++block_calls_;
        return {};
    }

    Result<void> SimRouter::allow_writes(RegionId region) {
        std::lock_guard lk(mu_);
        if (blocked_.erase(region) > 0) ++allow_calls_;
        return {};
    }

    Result<bool> SimRouter::writes_blocked(RegionId region) {
        std::lock_guard lk(mu_);
        return blocked_.count(region) != 0;
    }

    void SimRouter::set_region_health(RegionId region, bool healthy) {
        std::lock_guard lk(mu_);
        health_[region] = healthy;
    }

    void SimRouter::fail_redirect(bool fail) {
        std::lock_guard lk(mu_);
        fail_redirect_ = fail;
    }

    std::size_t SimRouter::block_calls() const {
        std::lock_guard lk(mu_);
        return block_calls_;
    }

    std::size_t SimRouter::allow_calls() const {
        std::lock_guard lk(mu_);
        return allow_calls_;
    }

    std::size_t SimRouter::redirect_calls() const {
        std::lock_guard lk(mu_);
        return redirect_calls_;
    }

    bool SimRouter::blocked(RegionId region) const {
        std::lock_guard lk(mu_);
        return blocked_.count(region) != 0;
    }

    // ---------------------------------------------------------------- workflows

    Result<std::vector<WorkflowExecutionRecord>> SimWorkflowEngine::list_in_flight(RegionId region) {
        std::lock_guard lk(mu_);
        if (fail_listing_) return make_error(ErrorCode::BackendFailure, "workflow engine unavailable");
        std::vector<WorkflowExecutionRecord> out;
        for (const auto& [id, rec] : records_) {
            if (rec.region != region || rec.terminal) continue;
            if (resumed_from_.count(id) != 0 || aborted_.count(id) != 0) continue;
            out.push_back(rec);
        }
        return out;
    }

    Result<void> SimWorkflowEngine::resume(const std::string& workflow_id, int from_step) {
        std::lock_guard lk(mu_);
        auto it = records_.find(workflow_id);
        if (it == records_.end()) return make_error(ErrorCode::InvalidArgument, "unknown workflow " + workflow_id);
        if (failing_resume_.count(workflow_id) != 0) {
            return make_error(ErrorCode::BackendFailure, "resume of " + workflow_id + " failed");
        }
        ++resume_calls_[workflow_id];
        resumed_from_[workflow_id] = from_step;

        // Re-running the in-progress step reaches the downstream system; it dedups by token.
        const auto& rec = it->second;
        if (from_step == rec.last_completed_step + 1 && !rec.idempotency_token.empty()) {
            if (applied_.insert(rec.idempotency_token).second) ++applications_[rec.idempotency_token];
            unknown_.erase(rec.idempotency_token);
        }
        return {};
    }

    Result<void> SimWorkflowEngine::abort(const std::string& workflow_id) {
        std::lock_guard lk(mu_);
        if (records_.count(workflow_id) == 0) {
            return make_error(ErrorCode::InvalidArgument, "unknown workflow " + workflow_id);
        }
        aborted_.insert(workflow_id);
        return {};
    }

    backend::SideEffectStatus SimWorkflowEngine::side_effect_status(const std::string&, const std::string& token) {
        std::lock_guard lk(mu_);
        if (unknown_.count(token) != 0) return backend::SideEffectStatus::Unknown;
        if (applied_.count(token) != 0) return backend::SideEffectStatus::Applied;
        return backend::SideEffectStatus::NotApplied;
    }

    void SimWorkflowEngine::add(WorkflowExecutionRecord rec) {
        std::lock_guard lk(mu_);
        const std::string id = rec.workflow_id;
        records_[id] = std::move(rec);
    }

    void SimWorkflowEngine::mark_applied(const std::string& token) {
        std::lock_guard lk(mu_);
        if (applied_.insert(token).second) ++applications_[token];
    }

    void SimWorkflowEngine::mark_unknown(const std::string& token) {
        std::lock_guard lk(mu_);
        unknown_.insert(token);
    }

    void SimWorkflowEngine::fail_listing(bool fail) {
        std::lock_guard lk(mu_);
        fail_listing_ = fail;
    }

    void SimWorkflowEngine::fail_resume(const std::string& workflow_id, bool fail) {
        std::lock_guard lk(mu_);
        if (fail) {
            failing_resume_.insert(workflow_id);
        } else {
            failing_resume_.erase(workflow_id);
        }
    }

    std::size_t SimWorkflowEngine::applications(const std::string& token) const {
        std::lock_guard lk(mu_);
        auto it = applications_.find(token);
        return it == applications_.end() ? 0 : it->second;
    }

    std::size_t SimWorkflowEngine::resume_calls(const std::string& workflow_id) const {
        std::lock_guard lk(mu_);
        auto it = resume_calls_.find(workflow_id);
        return it == resume_calls_.end() ? 0 : it->second;
    }

    bool SimWorkflowEngine::aborted(const std::string& workflow_id) const {
        std::lock_guard lk(mu_);
        return aborted_.count(workflow_id) != 0;
    }

    int SimWorkflowEngine::resumed_from(const std::string& workflow_id) const {
        std::lock_guard lk(mu_);
        auto it = resumed_from_.find(workflow_id);
        return it == resumed_from_.end() ? -1 : it->second;
    }

    // ---------------------------------------------------------------- alerts

    void RecordingAlertSink::notify(Severity severity, const std::string& message) {
        std::lock_guard lk(mu_);
        if (fail_) throw std::runtime_error("alert sink unavailable");
        entries_.push_back(Entry{severity, message});
    }

    void RecordingAlertSink::fail(bool fail) {
        std::lock_guard lk(mu_);
        fail_ = fail;
    }

    std::vector<RecordingAlertSink::Entry> RecordingAlertSink::entries() const {
        std::lock_guard lk(mu_);
        return entries_;
    }

    std::size_t RecordingAlertSink::count(Severity severity) const {
        std::lock_guard lk(mu_);
        return static_cast<std::size_t>(std::count_if(entries_.begin(), entries_.end(),
                                                      [&](const Entry& e) { return e.severity == severity; }));
    }

    std::size_t RecordingAlertSink::count(Severity severity, const std::string& needle) const {
        std::lock_guard lk(mu_);
        return static_cast<std::size_t>(std::count_if(entries_.begin(), entries_.end(), [&](const Entry& e) {
            return e.severity == severity && e.message.find(needle) != std::string::npos;
        }));
    }

} // namespace drguard::sim
