#pragma once
/**
 * @file region_probe.hpp
 * @brief One independent liveness/latency signal for a region.
 * @details Checks are a tagged variant rather than a class hierarchy; every
 *          invocation of sample() yields exactly one HealthSample, even when the
 *          check errors or times out.
 */

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <variant>

#include "drguard/config/constants.hpp"
#include "drguard/core/error.hpp"
#include "drguard/core/types.hpp"

namespace drguard::backend { class TrafficRouter; }

namespace drguard::health {

/** @struct TcpConnectCheck
 *  @brief Healthy if a TCP connection to the regional health endpoint completes in time.
 */
struct TcpConnectCheck {
    std::string   host; ///< IPv4/IPv6 literal or resolvable name
    std::uint16_t port{0};
};

/** @struct RoutingHealthCheck
 *  @brief Healthy if the routing layer's own health check reports the region up.
 */
struct RoutingHealthCheck {};

/** @struct CallbackCheck
 *  @brief Injected check returning latency in ms or an error.
 */
struct CallbackCheck {
    std::function<Result<std::uint32_t>(RegionId)> fn;
};

using ProbeCheck = std::variant<TcpConnectCheck, RoutingHealthCheck, CallbackCheck>;

/** @struct ProbeSpec
 *  @brief Static description of one probe.
 */
struct ProbeSpec {
    ProbeId    id{0};
    RegionId   region{kPrimaryRegion};
    ProbeCheck check{RoutingHealthCheck{}};
    std::uint32_t timeout_ms{drguard::config::constants::PROBE_TIMEOUT_MS};
};

/** @class RegionProbe
 *  @brief Executes a ProbeSpec and stamps the result into a HealthSample.
 */
class RegionProbe {
public:
    using Clock = std::function<TimestampMs()>;

    /// @param router Required only for RoutingHealthCheck probes.
    explicit RegionProbe(ProbeSpec spec,
                         std::shared_ptr<backend::TrafficRouter> router = nullptr,
                         Clock clock = &drguard::now_ms);

    /// Probe the configured region.
    HealthSample sample();

    /// Probe @p region with this probe's check.
    HealthSample sample(RegionId region);

    const ProbeSpec& spec() const noexcept { return spec_; }

private:
    Result<std::uint32_t> run_check(RegionId region);

private:
    ProbeSpec spec_;
    std::shared_ptr<backend::TrafficRouter> router_;
    Clock clock_;
};

/**
 * @brief Non-blocking TCP connect bounded by @p timeout_ms.
 * @return Connect latency in ms, Timeout, or BackendFailure.
 */
Result<std::uint32_t> tcp_connect_latency(const std::string& host, std::uint16_t port,
                                          std::uint32_t timeout_ms);

} // namespace drguard::health
