/**
 * @file region_probe.cpp
 * @brief RegionProbe check dispatch and sample stamping.
 */
#include "drguard/health/region_probe.hpp"
#include "drguard/backend/traffic_router.hpp"

#include <chrono>
#include <exception>
#include <utility>

#include <spdlog/spdlog.h>

namespace drguard::health {

namespace {
template <class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
template <class... Ts> overloaded(Ts...) -> overloaded<Ts...>;
} // namespace

RegionProbe::RegionProbe(ProbeSpec spec,
                         std::shared_ptr<backend::TrafficRouter> router,
                         Clock clock)
    : spec_(std::move(spec)), router_(std::move(router)), clock_(std::move(clock)) {}

HealthSample RegionProbe::sample() {
    return sample(spec_.region);
}

HealthSample RegionProbe::sample(RegionId region) {
    HealthSample s;
    s.region = region;
    s.probe  = spec_.id;

    Result<std::uint32_t> r = make_error(ErrorCode::BackendFailure, "probe did not run");
    try {
        r = run_check(region);
    } catch (const std::exception& ex) {
        // A thrown check is a failed sample, not a missing one.
        r = make_error(ErrorCode::BackendFailure, ex.what());
    }

    s.timestamp_ms = clock_();
    if (r) {
        s.latency_ms = *r;
        s.success = *r <= spec_.timeout_ms;
        if (!s.success) {
            spdlog::debug("probe {}/{}: latency {} ms above timeout {} ms",
                          region, spec_.id, *r, spec_.timeout_ms);
        }
    } else {
        s.success = false;
        spdlog::debug("probe {}/{} failed: {} ({})", region, spec_.id,
                      r.error().message, to_string(r.error().code));
    }
    return s;
}

Result<std::uint32_t> RegionProbe::run_check(RegionId region) {
    return std::visit(overloaded{
        [&](const TcpConnectCheck& c) -> Result<std::uint32_t> {
            return tcp_connect_latency(c.host, c.port, spec_.timeout_ms);
        },
        [&](const RoutingHealthCheck&) -> Result<std::uint32_t> {
            if (!router_) {
                return make_error(ErrorCode::InvalidConfig, "routing health check without router");
            }
            const auto t0 = std::chrono::steady_clock::now();
            auto up = router_->health_check_status(region);
            const auto dt = std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::steady_clock::now() - t0).count();
            if (!up) return drguard_detail::unexpected<Error>(up.error());
            if (!*up) return make_error(ErrorCode::BackendFailure, "routing health check reports down");
            return static_cast<std::uint32_t>(dt);
        },
        [&](const CallbackCheck& c) -> Result<std::uint32_t> {
            if (!c.fn) return make_error(ErrorCode::InvalidConfig, "empty callback check");
            return c.fn(region);
        }
    }, spec_.check);
}

} // namespace drguard::health
