/**
 * @file observability.cpp
 * @brief spdlog-backed implementation of Observer.
 */
#include "drguard/obs/observability.hpp"
#include "drguard/obs/logging.hpp"

#include <spdlog/spdlog.h>

namespace drguard::obs {

void LogObserver::record(const DecisionEvent& e) {
    {
        std::lock_guard<std::mutex> lk(mu_);
        switch (e.kind) {
            case EventKind::Cycle:           ctr_.decisions++;         break;
            case EventKind::ModeChange:      ctr_.mode_transitions++;  break;
            case EventKind::PlanStarted:     ctr_.plans_started++;     break;
            case EventKind::PlanSucceeded:   ctr_.plans_succeeded++;   break;
            case EventKind::PlanFailed:      ctr_.plans_failed++;      break;
            case EventKind::PlanCancelled:   ctr_.plans_cancelled++;   break;
            case EventKind::NoSafeTarget:    ctr_.no_safe_target++;    break;
            case EventKind::RtoEscalation:   ctr_.rto_escalations++;   break;
            case EventKind::RequestRejected: ctr_.requests_rejected++; break;
        }
    }
    if (e.kind == EventKind::Cycle) return;

    logger("decisions")->info(R"({{"event":"{}","at_ms":{},"from":"{}","to":"{}","plan":"{}","reason":"{}"}})",
                              to_string(e.kind), e.at_ms, to_string(e.from), to_string(e.to),
                              e.plan_id.value_or(""), e.reason);
}

Counters LogObserver::snapshot() const {
    std::lock_guard<std::mutex> lk(mu_);
    return ctr_;
}

std::unique_ptr<Observer> make_log_observer() { return std::make_unique<LogObserver>(); }

std::string_view to_string(EventKind k) noexcept {
    switch (k) {
        case EventKind::Cycle:           return "cycle";
        case EventKind::ModeChange:      return "mode_change";
        case EventKind::PlanStarted:     return "plan_started";
        case EventKind::PlanSucceeded:   return "plan_succeeded";
        case EventKind::PlanFailed:      return "plan_failed";
        case EventKind::PlanCancelled:   return "plan_cancelled";
        case EventKind::NoSafeTarget:    return "no_safe_target";
        case EventKind::RtoEscalation:   return "rto_escalation";
        case EventKind::RequestRejected: return "request_rejected";
    }
    return "unknown";
}

} // namespace drguard::obs
