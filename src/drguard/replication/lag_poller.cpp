#include "drguard/replication/lag_poller.hpp"

#include <exception>

#include <spdlog/spdlog.h>

namespace drguard::replication {

std::size_t LagPoller::poll_once(RegionId replica, TimestampMs now) {
    std::size_t failures = 0;
    for (const auto& store : tracker_.stores()) {
        Result<std::uint64_t> lag = make_error(ErrorCode::BackendFailure, "not read");
        try {
            lag = storage_.current_lag(store, replica);
        } catch (const std::exception& e) {
            lag = make_error(ErrorCode::BackendFailure, e.what());
        }
        if (!lag) {
            spdlog::debug("lag: read {}@{} failed: {}", store, replica, lag.error().message);
            ++failures;
            continue;
        }
        if (auto rec = tracker_.record(store, replica, *lag, now); !rec) {
            spdlog::debug("lag: record {}@{} rejected: {}", store, replica, rec.error().message);
            ++failures;
        }
    }
    return failures;
}

std::size_t LagPoller::poll_once(const std::vector<RegionId>& replicas, TimestampMs now) {
    std::size_t failures = 0;
    for (RegionId r : replicas) failures += poll_once(r, now);
    return failures;
}

} // namespace drguard::replication
