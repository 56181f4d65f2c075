#pragma once
/**
 * @file observability.hpp
 * @brief Decision events and counters for the failover engine.
 * @details The default observer logs one structured line per event through the
 *          "decisions" logger and keeps process-level counters.
 */

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

#include "drguard/core/types.hpp"

namespace drguard::obs {

/** @struct Counters
 *  @brief Process-level counters for engine decisions.
 */
struct Counters {
    std::uint64_t decisions{0};          ///< Decision cycles evaluated
    std::uint64_t mode_transitions{0};   ///< Operating mode changes
    std::uint64_t plans_started{0};      ///< Cutover plans submitted
    std::uint64_t plans_succeeded{0};
    std::uint64_t plans_failed{0};       ///< FAILED or PARTIAL
    std::uint64_t plans_cancelled{0};
    std::uint64_t no_safe_target{0};     ///< Failover withheld: target not affirmatively safe
    std::uint64_t rto_escalations{0};
    std::uint64_t requests_rejected{0};  ///< Operator requests refused (conflict, safety, mode)
};

enum class EventKind : std::uint8_t {
    Cycle,
    ModeChange,
    PlanStarted,
    PlanSucceeded,
    PlanFailed,
    PlanCancelled,
    NoSafeTarget,
    RtoEscalation,
    RequestRejected
};

/** @struct DecisionEvent
 *  @brief Payload describing one engine decision.
 */
struct DecisionEvent {
    EventKind     kind{EventKind::Cycle};
    TimestampMs   at_ms{0};
    OperatingMode from{OperatingMode::PrimaryActive}; ///< Mode before the decision
    OperatingMode to{OperatingMode::PrimaryActive};   ///< Mode after the decision
    std::optional<std::string> plan_id;
    std::string   reason;                             ///< Human-readable cause
};

/** @class Observer
 *  @brief Observability sink interface.
 */
class Observer {
public:
    virtual ~Observer() = default;
    /// Record a single decision event.
    virtual void record(const DecisionEvent& e) = 0;
    /// Return a snapshot of counters.
    virtual Counters snapshot() const = 0;
};

/** @class LogObserver
 *  @brief Counts events and logs non-cycle events as one JSON-ish line each.
 */
class LogObserver final : public Observer {
public:
    void record(const DecisionEvent& e) override;
    Counters snapshot() const override;

private:
    mutable std::mutex mu_;
    Counters ctr_;
};

std::unique_ptr<Observer> make_log_observer();

std::string_view to_string(EventKind k) noexcept;

} // namespace drguard::obs
