/**
 * @file lag_tracker.cpp
 */
#include "drguard/replication/lag_tracker.hpp"

#include <algorithm>

#include <spdlog/spdlog.h>

namespace drguard::replication {

ReplicationLagTracker::ReplicationLagTracker(LagTrackerConfig cfg) : cfg_(cfg) {
    if (cfg_.stale_factor == 0) cfg_.stale_factor = 1;
    if (cfg_.history_max == 0) cfg_.history_max = 1;
}

void ReplicationLagTracker::register_store(const std::string& store) {
    std::lock_guard lk(mu_);
    stores_.insert(store);
}

Result<void> ReplicationLagTracker::record(const std::string& store, RegionId region,
                                           std::uint64_t lag_ms, TimestampMs ts_ms) {
    std::lock_guard lk(mu_);
    if (stores_.find(store) == stores_.end()) {
        return make_error(ErrorCode::UnknownStore, "lag sample for unregistered store '" + store + "'");
    }
    auto& s = series_[{store, region}];
    if (!s.empty() && ts_ms < s.back().first) {
        spdlog::debug("lag: rejected out-of-order sample {}@{} ts={} newest={}",
                      store, region, ts_ms, s.back().first);
        return make_error(ErrorCode::OutOfOrder, "lag sample older than newest accepted sample");
    }
    s.emplace_back(ts_ms, lag_ms);

    const TimestampMs newest = s.back().first;
    while (s.size() > cfg_.history_max ||
           (s.size() > 1 && s.front().first + cfg_.smoothing_window_ms < newest)) {
        s.pop_front();
    }
    return {};
}

LagReading ReplicationLagTracker::estimate(const Series& s, TimestampMs now) const noexcept {
    if (s.empty()) return LagReading{LagState::Stale, 0};
    const TimestampMs newest = s.back().first;
    const std::uint64_t stale_after = static_cast<std::uint64_t>(cfg_.report_interval_ms) * cfg_.stale_factor;
    if (now > newest && now - newest > stale_after) return LagReading{LagState::Stale, 0};

    std::uint64_t worst = 0;
    for (const auto& [ts, lag] : s) {
        if (ts + cfg_.smoothing_window_ms >= newest) worst = std::max(worst, lag);
    }
    return LagReading{LagState::Fresh, worst};
}

LagReading ReplicationLagTracker::worse(const LagReading& a, const LagReading& b) noexcept {
    if (a.stale()) return a;
    if (b.stale()) return b;
    return a.lag_ms >= b.lag_ms ? a : b;
}

LagReading ReplicationLagTracker::current_lag(const std::string& store, TimestampMs now) const {
    std::lock_guard lk(mu_);
    if (stores_.find(store) == stores_.end()) return LagReading{LagState::Stale, 0};

    bool any = false;
    LagReading out{LagState::Fresh, 0};
    for (auto it = series_.lower_bound({store, 0}); it != series_.end() && it->first.first == store; ++it) {
        out = worse(out, estimate(it->second, now));
        any = true;
    }
    return any ? out : LagReading{LagState::Stale, 0};
}

LagReading ReplicationLagTracker::current_lag(const std::string& store, RegionId region,
                                              TimestampMs now) const {
    std::lock_guard lk(mu_);
    auto it = series_.find({store, region});
    if (it == series_.end()) return LagReading{LagState::Stale, 0};
    return estimate(it->second, now);
}

LagReading ReplicationLagTracker::worst_lag(TimestampMs now) const {
    std::lock_guard lk(mu_);
    LagReading out{LagState::Fresh, 0};
    for (const auto& store : stores_) {
        bool any = false;
        for (auto it = series_.lower_bound({store, 0}); it != series_.end() && it->first.first == store; ++it) {
            out = worse(out, estimate(it->second, now));
            any = true;
        }
        if (!any) return LagReading{LagState::Stale, 0};
    }
    return out;
}

LagReading ReplicationLagTracker::worst_lag_into(RegionId region, TimestampMs now) const {
    std::lock_guard lk(mu_);
    LagReading out{LagState::Fresh, 0};
    for (const auto& store : stores_) {
        auto it = series_.find({store, region});
        if (it == series_.end()) return LagReading{LagState::Stale, 0};
        out = worse(out, estimate(it->second, now));
    }
    return out;
}

std::vector<std::string> ReplicationLagTracker::stores() const {
    std::lock_guard lk(mu_);
    return {stores_.begin(), stores_.end()};
}

std::vector<LagSeriesReport> ReplicationLagTracker::report(TimestampMs now) const {
    std::lock_guard lk(mu_);
    std::vector<LagSeriesReport> out;
    out.reserve(series_.size());
    for (const auto& [key, s] : series_) {
        out.push_back(LagSeriesReport{key.first, key.second, estimate(s, now),
                                      s.empty() ? 0 : s.back().first});
    }
    return out;
}

} // namespace drguard::replication
