/**
 * @file test_alert_dispatcher.cpp
 * @brief Alert queue delivery, overflow and sink isolation; decision counters.
 */
#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "drguard/obs/alert_dispatcher.hpp"
#include "drguard/obs/observability.hpp"
#include "drguard/sim/sim_backends.hpp"

using namespace drguard;
using namespace drguard::obs;

namespace {

// Holds the first delivery until released so the queue can be filled behind it.
class GateSink final : public backend::AlertSink {
public:
    void notify(Severity, const std::string& message) override {
        std::unique_lock<std::mutex> lk(mu_);
        delivered_.push_back(message);
        entered_.store(true);
        cv_.wait(lk, [&]{ return open_; });
    }

    void open() {
        {
            std::lock_guard<std::mutex> lk(mu_);
            open_ = true;
        }
        cv_.notify_all();
    }

    void wait_entered() const {
        while (!entered_.load()) std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }

    std::vector<std::string> delivered() const {
        std::lock_guard<std::mutex> lk(mu_);
        return delivered_;
    }

private:
    mutable std::mutex mu_;
    std::condition_variable cv_;
    bool open_{false};
    std::atomic<bool> entered_{false};
    std::vector<std::string> delivered_;
};

} // namespace

TEST(AlertDispatcher, InlineBeforeStart) {
    auto sink = std::make_shared<sim::RecordingAlertSink>();
    AlertDispatcher d(sink);
    d.notify(Severity::Warning, "region 0 degraded");
    ASSERT_EQ(sink->entries().size(), 1u);
    EXPECT_EQ(sink->entries()[0].severity, Severity::Warning);
    EXPECT_EQ(sink->entries()[0].message, "region 0 degraded");
}

TEST(AlertDispatcher, StopDeliversQueuedAlerts) {
    auto sink = std::make_shared<sim::RecordingAlertSink>();
    AlertDispatcher d(sink);
    d.start();
    d.start();
    for (int i = 0; i < 50; ++i) d.notify(Severity::Info, "alert " + std::to_string(i));
    d.stop();
    d.stop();

    const auto got = sink->entries();
    ASSERT_EQ(got.size(), 50u);
    for (int i = 0; i < 50; ++i) EXPECT_EQ(got[i].message, "alert " + std::to_string(i));
    EXPECT_EQ(d.dropped(), 0u);
    EXPECT_EQ(d.failed(), 0u);
}

TEST(AlertDispatcher, FullQueueDropsOldest) {
    auto sink = std::make_shared<GateSink>();
    AlertDispatcher d(sink, 2);
    d.start();
    d.notify(Severity::Critical, "a");
    sink->wait_entered();

    d.notify(Severity::Info, "b");
    d.notify(Severity::Info, "c");
    d.notify(Severity::Info, "d");
    EXPECT_EQ(d.dropped(), 1u);

    sink->open();
    d.stop();
    EXPECT_EQ(sink->delivered(), (std::vector<std::string>{"a", "c", "d"}));
}

TEST(AlertDispatcher, SinkFailureIsCountedNotPropagated) {
    auto sink = std::make_shared<sim::RecordingAlertSink>();
    sink->fail(true);
    AlertDispatcher d(sink);
    d.notify(Severity::Critical, "inline failure");
    EXPECT_EQ(d.failed(), 1u);

    d.start();
    d.notify(Severity::Critical, "queued failure");
    d.stop();
    EXPECT_EQ(d.failed(), 2u);

    sink->fail(false);
    d.notify(Severity::Info, "after recovery");
    EXPECT_EQ(sink->count(Severity::Info, "after recovery"), 1u);
}

TEST(AlertDispatcher, NullSinkIsIgnored) {
    AlertDispatcher d(nullptr);
    d.notify(Severity::Info, "nobody listens");
    d.start();
    d.notify(Severity::Info, "still nobody");
    d.stop();
    EXPECT_EQ(d.failed(), 0u);
}

TEST(LogObserver, CountsEveryKind) {
    auto obs = make_log_observer();
    const EventKind kinds[] = {EventKind::Cycle, EventKind::Cycle, EventKind::ModeChange,
                               EventKind::PlanStarted, EventKind::PlanSucceeded, EventKind::PlanFailed,
                               EventKind::PlanCancelled, EventKind::NoSafeTarget, EventKind::RtoEscalation,
                               EventKind::RequestRejected, EventKind::RequestRejected};
    for (auto k : kinds) {
        DecisionEvent e;
        e.kind = k;
        e.at_ms = 1000;
        e.to = OperatingMode::FailoverPending;
        e.plan_id = "plan-1";
        e.reason = "test";
        obs->record(e);
    }
    const auto c = obs->snapshot();
    EXPECT_EQ(c.decisions, 2u);
    EXPECT_EQ(c.mode_transitions, 1u);
    EXPECT_EQ(c.plans_started, 1u);
    EXPECT_EQ(c.plans_succeeded, 1u);
    EXPECT_EQ(c.plans_failed, 1u);
    EXPECT_EQ(c.plans_cancelled, 1u);
    EXPECT_EQ(c.no_safe_target, 1u);
    EXPECT_EQ(c.rto_escalations, 1u);
    EXPECT_EQ(c.requests_rejected, 2u);
}

TEST(LogObserver, EventKindNames) {
    EXPECT_EQ(to_string(EventKind::ModeChange), "mode_change");
    EXPECT_EQ(to_string(EventKind::NoSafeTarget), "no_safe_target");
    EXPECT_EQ(to_string(EventKind::RtoEscalation), "rto_escalation");
}
