/**
 * @file types.cpp
 * @brief String conversions for the shared data model.
 */
#include "drguard/core/types.hpp"
#include "drguard/core/error.hpp"

#include <chrono>

namespace drguard {

TimestampMs now_ms() noexcept {
    using namespace std::chrono;
    return static_cast<TimestampMs>(
        duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count());
}

std::string_view to_string(HealthStatus s) noexcept {
    switch (s) {
        case HealthStatus::Healthy:   return "HEALTHY";
        case HealthStatus::Degraded:  return "DEGRADED";
        case HealthStatus::Unhealthy: return "UNHEALTHY";
    }
    return "UNKNOWN";
}

std::string_view to_string(OperatingMode m) noexcept {
    switch (m) {
        case OperatingMode::PrimaryActive:   return "PRIMARY_ACTIVE";
        case OperatingMode::Degraded:        return "DEGRADED";
        case OperatingMode::FailoverPending: return "FAILOVER_PENDING";
        case OperatingMode::SecondaryActive: return "SECONDARY_ACTIVE";
        case OperatingMode::Recovering:      return "RECOVERING";
    }
    return "UNKNOWN";
}

std::string_view to_string(Severity s) noexcept {
    switch (s) {
        case Severity::Info:     return "INFO";
        case Severity::Warning:  return "WARNING";
        case Severity::Critical: return "CRITICAL";
    }
    return "UNKNOWN";
}

std::string_view to_string(LagState s) noexcept {
    return s == LagState::Fresh ? "FRESH" : "STALE";
}

std::optional<OperatingMode> operating_mode_from_string(std::string_view s) noexcept {
    for (auto m : {OperatingMode::PrimaryActive, OperatingMode::Degraded,
                   OperatingMode::FailoverPending, OperatingMode::SecondaryActive,
                   OperatingMode::Recovering}) {
        if (to_string(m) == s) return m;
    }
    return std::nullopt;
}

std::string_view to_string(ErrorCode c) noexcept {
    switch (c) {
        case ErrorCode::InvalidArgument:   return "invalid_argument";
        case ErrorCode::InvalidConfig:     return "invalid_config";
        case ErrorCode::UnknownStore:      return "unknown_store";
        case ErrorCode::OutOfOrder:        return "out_of_order";
        case ErrorCode::PlanInProgress:    return "plan_in_progress";
        case ErrorCode::PlanCommitted:     return "plan_committed";
        case ErrorCode::NoActivePlan:      return "no_active_plan";
        case ErrorCode::NoSafeTarget:      return "no_safe_target";
        case ErrorCode::InvalidTransition: return "invalid_transition";
        case ErrorCode::AutomationHalted:  return "automation_halted";
        case ErrorCode::BackendFailure:    return "backend_failure";
        case ErrorCode::Timeout:           return "timeout";
        case ErrorCode::Io:                return "io";
        case ErrorCode::Parse:             return "parse";
    }
    return "unknown";
}

} // namespace drguard
