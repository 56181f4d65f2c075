/**
 * @file health_aggregator.cpp
 * @brief Round bookkeeping, majority voting and the verdict hysteresis machine.
 */
#include "drguard/health/health_aggregator.hpp"
#include "drguard/obs/alert_dispatcher.hpp"

#include <algorithm>
#include <string>

#include <spdlog/spdlog.h>

namespace drguard::health {

Result<void> validate(const AggregatorConfig& c) {
    if (c.probe_interval_ms == 0) return make_error(ErrorCode::InvalidConfig, "probe interval must be > 0");
    if (c.k == 0 || c.k2 == 0 || c.d == 0) {
        return make_error(ErrorCode::InvalidConfig, "hysteresis thresholds K, K2, D must be >= 1");
    }
    if (c.r <= c.k + c.k2) {
        return make_error(ErrorCode::InvalidConfig,
                          "recovery threshold R must exceed K + K2 (" + std::to_string(c.r) +
                          " <= " + std::to_string(c.k + c.k2) + ")");
    }
    if (static_cast<std::uint64_t>(c.window_ms) <
        static_cast<std::uint64_t>(c.k) * c.probe_interval_ms) {
        return make_error(ErrorCode::InvalidConfig, "window W must cover at least K probe intervals");
    }
    return {};
}

std::string_view to_string(RoundOutcome o) noexcept {
    switch (o) {
        case RoundOutcome::MajorityFail:    return "majority_fail";
        case RoundOutcome::MajoritySuccess: return "majority_success";
        case RoundOutcome::Inconclusive:    return "inconclusive";
    }
    return "unknown";
}

HealthAggregator::HealthAggregator(AggregatorConfig cfg, obs::AlertDispatcher* alerts)
    : cfg_(cfg), alerts_(alerts) {
    if (cfg_.probe_interval_ms == 0) cfg_.probe_interval_ms = drguard::config::constants::PROBE_INTERVAL_MS;
}

Result<void> HealthAggregator::register_region(RegionId region, std::vector<ProbeId> probes) {
    if (probes.empty()) {
        return make_error(ErrorCode::InvalidArgument, "region needs at least one probe");
    }
    std::sort(probes.begin(), probes.end());
    if (std::adjacent_find(probes.begin(), probes.end()) != probes.end()) {
        return make_error(ErrorCode::InvalidArgument, "duplicate probe id");
    }
    RegionState st;
    st.probes = std::move(probes);
    st.verdict.region = region;
    regions_[region] = std::move(st);
    publish();
    return {};
}

TimestampMs HealthAggregator::round_deadline(std::uint64_t round) const noexcept {
    return (round + 1) * cfg_.probe_interval_ms + cfg_.round_grace_ms;
}

void HealthAggregator::ingest(const HealthSample& s) {
    auto it = regions_.find(s.region);
    if (it == regions_.end()) {
        spdlog::debug("aggregator: sample for unregistered region {}", s.region);
        return;
    }
    RegionState& st = it->second;
    if (!std::binary_search(st.probes.begin(), st.probes.end(), s.probe)) {
        spdlog::debug("aggregator: sample from unregistered probe {}/{}", s.region, s.probe);
        return;
    }

    st.window[s.probe].push_back(s);
    prune_window(st, s.timestamp_ms);

    const auto round = round_of(s.timestamp_ms);
    if (st.last_closed && round <= *st.last_closed) {
        spdlog::debug("aggregator: late sample {}/{} for closed round {}", s.region, s.probe, round);
        return;
    }

    auto& votes = st.open[round];
    auto [vit, inserted] = votes.emplace(s.probe, s.success);
    if (!inserted) vit->second = vit->second && s.success; // failure wins within a round

    close_ready_rounds(st, s.timestamp_ms);
}

void HealthAggregator::close_overdue_rounds(TimestampMs now) {
    for (auto& [region, st] : regions_) {
        // Arm the round clock so probes that never report still count as failing.
        if (!st.last_closed && st.open.empty() && round_of(now) > 0) {
            st.last_closed = round_of(now) - 1;
        }
        close_ready_rounds(st, now);
    }
}

void HealthAggregator::prune_window(RegionState& st, TimestampMs now) const {
    for (auto& [probe, dq] : st.window) {
        while (!dq.empty() && dq.front().timestamp_ms + cfg_.window_ms < now) dq.pop_front();
    }
}

void HealthAggregator::close_ready_rounds(RegionState& st, TimestampMs now) {
    bool changed = false;
    for (;;) {
        if (!st.last_closed && st.open.empty()) break;
        std::uint64_t next = st.last_closed ? *st.last_closed + 1 : st.open.begin()->first;

        auto it = st.open.find(next);
        if (it == st.open.end()) {
            // Nothing reported for this round. Skip rounds that fell out of the window.
            const std::uint64_t floor_round = round_of(now > cfg_.window_ms ? now - cfg_.window_ms : 0);
            std::uint64_t target = floor_round;
            if (!st.open.empty()) target = std::min(target, st.open.begin()->first);
            if (next < target) {
                st.last_closed = target - 1;
                continue;
            }
        }

        const bool complete = it != st.open.end() && it->second.size() == st.probes.size();
        const bool overdue  = now >= round_deadline(next);
        if (!complete && !overdue) break;

        static const std::map<ProbeId, bool> kNoVotes;
        const auto& votes = (it != st.open.end()) ? it->second : kNoVotes;
        const auto outcome = tally(st, votes);
        apply_round(st, next, outcome, now);
        if (it != st.open.end()) st.open.erase(it);
        st.last_closed = next;
        changed = true;
    }

    const RegionId active = active_region_.load(std::memory_order_acquire);
    if (active != armed_region_) {
        spdlog::info("aggregator: monitoring re-armed for active region {}", active);
        armed_region_ = active;
        changed = true;
    }
    if (changed) publish();
}

RoundOutcome HealthAggregator::tally(const RegionState& st,
                                     const std::map<ProbeId, bool>& votes) const noexcept {
    std::size_t ok = 0;
    for (const auto& [probe, success] : votes) if (success) ++ok;
    const std::size_t n = st.probes.size();
    const std::size_t failing = n - ok; // missing probes count as failing
    if (failing * 2 > n) return RoundOutcome::MajorityFail;
    if (ok * 2 > n)      return RoundOutcome::MajoritySuccess;
    return RoundOutcome::Inconclusive;
}

void HealthAggregator::apply_round(RegionState& st, std::uint64_t round,
                                   RoundOutcome outcome, TimestampMs now) {
    HealthVerdict& v = st.verdict;
    v.rounds_evaluated++;

    // Streaks must fall inside the trailing window.
    if (st.last_counted && round > *st.last_counted &&
        (round - *st.last_counted) * cfg_.probe_interval_ms > cfg_.window_ms) {
        v.consecutive_failures  = 0;
        v.consecutive_successes = 0;
        st.degraded_fail_run    = 0;
    }
    st.last_counted = round;

    const HealthStatus before = v.status;
    switch (outcome) {
        case RoundOutcome::MajorityFail:
            v.consecutive_failures++;
            v.consecutive_successes = 0;
            if (before == HealthStatus::Degraded) st.degraded_fail_run++;
            if (before == HealthStatus::Healthy && v.consecutive_failures >= cfg_.k) {
                transition(st, HealthStatus::Degraded, now);
            } else if (before == HealthStatus::Degraded && st.degraded_fail_run >= cfg_.k2) {
                transition(st, HealthStatus::Unhealthy, now);
            }
            break;

        case RoundOutcome::MajoritySuccess:
            // Resets the failure streak; never reverses a transition by itself.
            v.consecutive_failures = 0;
            st.degraded_fail_run   = 0;
            v.consecutive_successes++;
            if (before == HealthStatus::Degraded && v.consecutive_successes >= cfg_.d) {
                transition(st, HealthStatus::Healthy, now);
            } else if (before == HealthStatus::Unhealthy && v.consecutive_successes >= cfg_.r) {
                transition(st, HealthStatus::Healthy, now);
            }
            break;

        case RoundOutcome::Inconclusive:
            v.consecutive_failures  = 0;
            v.consecutive_successes = 0;
            st.degraded_fail_run    = 0;
            break;
    }
    spdlog::trace("aggregator: region {} round {} {} (fail={}, ok={}, status={})",
                  v.region, round, to_string(outcome), v.consecutive_failures,
                  v.consecutive_successes, to_string(v.status));
}

void HealthAggregator::transition(RegionState& st, HealthStatus next, TimestampMs now) {
    HealthVerdict& v = st.verdict;
    const HealthStatus prev = v.status;
    v.status = next;
    v.last_transition_ms = now;
    st.degraded_fail_run = 0;

    const bool worse = static_cast<int>(next) > static_cast<int>(prev);
    std::string msg = "region " + std::to_string(v.region) + " verdict " +
                      std::string(to_string(prev)) + " -> " + std::string(to_string(next));
    if (worse) {
        spdlog::warn("aggregator: {} after {} majority-failing rounds", msg, v.consecutive_failures);
    } else {
        spdlog::info("aggregator: {} after {} majority-successful rounds", msg, v.consecutive_successes);
    }
    if (alerts_) alerts_->notify(worse ? Severity::Warning : Severity::Info, std::move(msg));
}

void HealthAggregator::publish() {
    auto next = std::make_shared<VerdictSnapshot>();
    for (const auto& [region, st] : regions_) next->verdicts.emplace(region, st.verdict);
    next->active_region = active_region_.load(std::memory_order_acquire);
    next->version = ++version_;
    std::shared_ptr<const VerdictSnapshot> cnext = std::move(next);
    std::atomic_store_explicit(&snap_, std::move(cnext), std::memory_order_release);
}

std::shared_ptr<const VerdictSnapshot> HealthAggregator::snapshot() const noexcept {
    return std::atomic_load_explicit(&snap_, std::memory_order_acquire);
}

std::optional<HealthVerdict> HealthAggregator::verdict(RegionId region) const {
    auto snap = snapshot();
    auto it = snap->verdicts.find(region);
    if (it == snap->verdicts.end()) return std::nullopt;
    return it->second;
}

void HealthAggregator::set_active_region(RegionId region) noexcept {
    active_region_.store(region, std::memory_order_release);
}

std::size_t HealthAggregator::retained_samples(RegionId region, ProbeId probe) const {
    auto it = regions_.find(region);
    if (it == regions_.end()) return 0;
    auto wit = it->second.window.find(probe);
    return wit == it->second.window.end() ? 0 : wit->second.size();
}

} // namespace drguard::health
