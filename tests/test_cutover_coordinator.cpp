/**
 * @file test_cutover_coordinator.cpp
 * @brief CutoverCoordinator: step semantics, idempotent replay, drain, cancellation, conflicts.
 *
 * Plans run inline on the test thread. Time is a counter advanced by the drain sleeper.
 */
#include <gtest/gtest.h>

#include <atomic>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>

#include "drguard/cutover/coordinator.hpp"
#include "drguard/sim/sim_backends.hpp"

using namespace drguard;
using namespace drguard::cutover;

namespace {

replication::LagTrackerConfig lag_config() {
    replication::LagTrackerConfig c;
    c.report_interval_ms = 1000;
    c.stale_factor = 2;
    c.smoothing_window_ms = 500; // one poll per estimate
    return c;
}

class CoordinatorTest : public ::testing::Test {
protected:
    void SetUp() override {
        tracker.register_store("orders");
        tracker.register_store("ledger");
        storage.set_lag("orders", kSecondaryRegion, 1000);
        storage.set_lag("ledger", kSecondaryRegion, 2000);
    }

    CoordinatorConfig config(bool run_inline = true) {
        CoordinatorConfig c;
        c.rpo_bound_ms = 5000;
        c.accepted_loss_window_ms = 0;
        c.drain_timeout_ms = 3000;
        c.drain_poll_ms = 1000;
        c.run_inline = run_inline;
        return c;
    }

    std::unique_ptr<CutoverCoordinator> make(CoordinatorConfig cfg) {
        return std::make_unique<CutoverCoordinator>(
            cfg, storage, router, tracker, guard,
            [this] { return now.load(); },
            [this](std::uint32_t ms) {
                if (on_sleep) on_sleep();
                now += ms;
            });
    }

    CutoverPlan failover_plan(std::uint64_t seq = 1) {
        return make_cutover_plan(PlanKind::Failover, kPrimaryRegion, kSecondaryRegion, now.load(), seq);
    }

    std::atomic<TimestampMs> now{100000};
    std::function<void()> on_sleep;

    sim::SimStorage storage;
    sim::SimRouter router;
    sim::SimWorkflowEngine workflows;
    replication::ReplicationLagTracker tracker{lag_config()};
    workflow::WorkflowConsistencyGuard guard{workflows};
};

} // namespace

TEST(CutoverPlan, StandardShape) {
    const auto plan = make_cutover_plan(PlanKind::Failback, kSecondaryRegion, kPrimaryRegion, 42, 7);
    EXPECT_EQ(plan.id, "fb-42-7");
    EXPECT_EQ(plan.from_mode, OperatingMode::Recovering);
    EXPECT_EQ(plan.to_mode, OperatingMode::PrimaryActive);
    ASSERT_EQ(plan.steps.size(), 6u);
    EXPECT_EQ(plan.steps.front(), StepKind::StopWrites);
    EXPECT_EQ(plan.steps.back(), StepKind::MarkSucceeded);
    EXPECT_FALSE(is_committing(StepKind::DrainReplication));
    EXPECT_TRUE(is_committing(StepKind::PromoteStorage));

    const auto p = make_progress(plan);
    EXPECT_EQ(p.plan_id, plan.id);
    EXPECT_EQ(p.steps.size(), 6u);
    EXPECT_FALSE(p.terminal());
    EXPECT_EQ(step_kind_from_string(to_string(StepKind::RedirectTraffic)), StepKind::RedirectTraffic);
    EXPECT_FALSE(plan_status_from_string("bogus").has_value());
}

TEST_F(CoordinatorTest, FailoverRunsAllSixSteps) {
    auto coord = make(config());
    const auto plan = failover_plan();
    auto res = coord->execute(plan);
    ASSERT_TRUE(res) << res.error().message;

    EXPECT_EQ(res->status, PlanStatus::Succeeded);
    EXPECT_EQ(res->last_successful_step, 6u);
    EXPECT_TRUE(res->committed);
    EXPECT_TRUE(res->source_writes_blocked);
    for (const auto& sp : res->steps) {
        EXPECT_EQ(sp.state, StepState::Succeeded) << to_string(sp.kind);
        EXPECT_EQ(sp.attempts, 1u);
    }

    EXPECT_TRUE(router.blocked(kPrimaryRegion));
    EXPECT_FALSE(router.blocked(kSecondaryRegion));
    EXPECT_EQ(*router.active_region(), kSecondaryRegion);
    EXPECT_TRUE(*storage.is_writable(kSecondaryRegion, "orders"));
    EXPECT_TRUE(*storage.is_writable(kSecondaryRegion, "ledger"));
    EXPECT_FALSE(coord->busy());
}

// Replaying a completed plan leaves storage and routing exactly as one run did.
TEST_F(CoordinatorTest, ReplayIsIdempotent) {
    auto coord = make(config());
    ASSERT_TRUE(coord->execute(failover_plan(1)));
    const auto blocks = router.block_calls();
    const auto redirects = router.redirect_calls();

    auto again = coord->execute(failover_plan(2));
    ASSERT_TRUE(again);
    EXPECT_EQ(again->status, PlanStatus::Succeeded);
    EXPECT_EQ(router.block_calls(), blocks);
    EXPECT_EQ(router.redirect_calls(), redirects);
    EXPECT_EQ(storage.promotions(kSecondaryRegion, "orders"), 1u);
    EXPECT_EQ(storage.promotions(kSecondaryRegion, "ledger"), 1u);
    EXPECT_EQ(*router.active_region(), kSecondaryRegion);
}

TEST_F(CoordinatorTest, PromotionFailureIsPartialAtStepTwo) {
    auto coord = make(config());
    storage.fail_promotion(true);
    const auto plan = failover_plan();
    auto res = coord->execute(plan);
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, PlanStatus::Partial);
    EXPECT_EQ(res->last_successful_step, 2u);
    EXPECT_FALSE(res->committed);
    EXPECT_EQ(res->steps[2].state, StepState::Failed);
    EXPECT_EQ(res->steps[3].state, StepState::Pending);
    EXPECT_NE(res->error.find("step 3"), std::string::npos);
    EXPECT_EQ(*router.active_region(), kPrimaryRegion);

    // Promotion may have reached some stores: the source stays blocked until released.
    EXPECT_TRUE(router.blocked(kPrimaryRegion));
    EXPECT_TRUE(res->source_writes_blocked);
    ASSERT_TRUE(coord->release_source_writes(plan));
    EXPECT_FALSE(router.blocked(kPrimaryRegion));
    EXPECT_FALSE(coord->progress(plan.id)->source_writes_blocked);
}

TEST_F(CoordinatorTest, FailureAtFirstStepIsFailed) {
    class BrokenRouter final : public backend::TrafficRouter {
    public:
        Result<void> set_active_region(RegionId) override { return {}; }
        Result<RegionId> active_region() override { return kPrimaryRegion; }
        Result<bool> health_check_status(RegionId) override { return true; }
        Result<void> block_writes(RegionId) override { throw std::runtime_error("router down"); }
        Result<void> allow_writes(RegionId) override { return {}; }
        Result<bool> writes_blocked(RegionId) override { return false; }
    } broken;

    CutoverCoordinator coord(config(), storage, broken, tracker, guard, [this] { return now.load(); },
                             [](std::uint32_t) {});
    auto res = coord.execute(failover_plan());
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, PlanStatus::Failed);
    EXPECT_EQ(res->last_successful_step, 0u);
    EXPECT_NE(res->steps[0].detail.find("router down"), std::string::npos);
}

TEST_F(CoordinatorTest, ResumeSkipsSucceededSteps) {
    auto coord = make(config());
    const auto plan = failover_plan();
    storage.fail_promotion(true);
    auto partial = coord->execute(plan);
    ASSERT_TRUE(partial);
    ASSERT_EQ(partial->status, PlanStatus::Partial);

    storage.fail_promotion(false);
    auto done = coord->execute(plan, *partial);
    ASSERT_TRUE(done);
    EXPECT_EQ(done->status, PlanStatus::Succeeded);
    EXPECT_EQ(done->steps[0].attempts, 1u);
    EXPECT_EQ(done->steps[1].attempts, 1u);
    EXPECT_EQ(done->steps[2].attempts, 2u);
    EXPECT_EQ(router.block_calls(), 1u);
}

TEST_F(CoordinatorTest, ResumeProgressMustMatchPlan) {
    auto coord = make(config());
    auto other = make_progress(failover_plan(9));
    auto res = coord->execute(failover_plan(1), other);
    ASSERT_FALSE(res);
    EXPECT_EQ(res.error().code, ErrorCode::InvalidArgument);

    CutoverPlan empty;
    empty.id = "empty";
    EXPECT_FALSE(coord->execute(empty));
}

TEST_F(CoordinatorTest, DrainWaitsForLagToFall) {
    auto coord = make(config());
    storage.set_lag("orders", kSecondaryRegion, 9000);
    int sleeps = 0;
    on_sleep = [&] {
        if (++sleeps == 2) storage.set_lag("orders", kSecondaryRegion, 100);
    };
    auto res = coord->execute(failover_plan());
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, PlanStatus::Succeeded);
    EXPECT_EQ(sleeps, 2);
}

TEST_F(CoordinatorTest, DrainTimeoutHaltsBeforePromotion) {
    auto coord = make(config());
    storage.set_lag("orders", kSecondaryRegion, 9000);
    auto res = coord->execute(failover_plan());
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, PlanStatus::Partial);
    EXPECT_EQ(res->last_successful_step, 1u);
    EXPECT_EQ(res->steps[1].state, StepState::Failed);
    EXPECT_NE(res->steps[1].detail.find("did not drain"), std::string::npos);
    EXPECT_EQ(storage.promote_calls(), 0u);
    EXPECT_EQ(*router.active_region(), kPrimaryRegion);
    EXPECT_FALSE(router.blocked(kPrimaryRegion));
    EXPECT_FALSE(res->source_writes_blocked);
}

TEST_F(CoordinatorTest, StaleLagNeverDrains) {
    auto coord = make(config());
    storage.fail_lag_reads(true);
    auto res = coord->execute(failover_plan());
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, PlanStatus::Partial);
    EXPECT_NE(res->steps[1].detail.find("stale"), std::string::npos);
}

TEST_F(CoordinatorTest, AcceptedLossWindow) {
    auto cfg = config();
    cfg.accepted_loss_window_ms = 10000;
    auto coord = make(cfg);
    storage.set_lag("orders", kSecondaryRegion, 9000);
    auto res = coord->execute(failover_plan());
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, PlanStatus::Succeeded);
    EXPECT_NE(res->steps[1].detail.find("accepted"), std::string::npos);
}

TEST_F(CoordinatorTest, SecondPlanWhileRunningIsRejected) {
    auto coord = make(config());
    storage.set_lag("orders", kSecondaryRegion, 9000);
    std::optional<Error> conflict;
    bool busy_seen = false;
    on_sleep = [&] {
        busy_seen = coord->busy();
        auto r = coord->submit(failover_plan(2));
        if (!r) conflict = r.error();
        storage.set_lag("orders", kSecondaryRegion, 100);
    };
    auto res = coord->execute(failover_plan(1));
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, PlanStatus::Succeeded);
    EXPECT_TRUE(busy_seen);
    ASSERT_TRUE(conflict.has_value());
    EXPECT_EQ(conflict->code, ErrorCode::PlanInProgress);
    EXPECT_EQ(router.block_calls(), 1u);
}

TEST_F(CoordinatorTest, CancelDuringDrainRestoresWrites) {
    auto coord = make(config());
    const auto plan = failover_plan();
    storage.set_lag("orders", kSecondaryRegion, 9000);
    on_sleep = [&] { ASSERT_TRUE(coord->cancel(plan.id)); };

    auto res = coord->execute(plan);
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, PlanStatus::Cancelled);
    EXPECT_EQ(res->steps[1].state, StepState::Skipped);
    for (std::size_t i = 2; i < res->steps.size(); ++i) EXPECT_EQ(res->steps[i].state, StepState::Skipped);
    EXPECT_FALSE(router.blocked(kPrimaryRegion));
    EXPECT_EQ(storage.promote_calls(), 0u);
    EXPECT_EQ(*router.active_region(), kPrimaryRegion);
}

TEST_F(CoordinatorTest, CancelBeforeCommitStopsAtNextStep) {
    auto coord = make(config());
    const auto plan = failover_plan();
    coord->set_progress_listener([&](const CutoverPlan& p, const PlanProgress& pr) {
        if (pr.steps[1].state == StepState::Running) EXPECT_TRUE(coord->cancel(p.id));
    });
    auto res = coord->execute(plan);
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, PlanStatus::Cancelled);
    EXPECT_EQ(res->last_successful_step, 2u);
    EXPECT_EQ(storage.promote_calls(), 0u);
    EXPECT_FALSE(router.blocked(kPrimaryRegion));
}

TEST_F(CoordinatorTest, CancelAfterCommitIsRefused) {
    auto coord = make(config());
    const auto plan = failover_plan();
    std::optional<ErrorCode> refused;
    coord->set_progress_listener([&](const CutoverPlan& p, const PlanProgress& pr) {
        if (pr.steps[2].state == StepState::Running && !refused) {
            auto r = coord->cancel(p.id);
            refused = r ? std::optional<ErrorCode>{} : r.error().code;
        }
    });
    auto res = coord->execute(plan);
    ASSERT_TRUE(res);
    ASSERT_TRUE(refused.has_value());
    EXPECT_EQ(*refused, ErrorCode::PlanCommitted);
    EXPECT_EQ(res->status, PlanStatus::Succeeded);
}

TEST_F(CoordinatorTest, CancelWithoutActivePlan) {
    auto coord = make(config());
    auto r = coord->cancel("fo-none");
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::NoActivePlan);

    const auto plan = failover_plan();
    ASSERT_TRUE(coord->execute(plan));
    r = coord->cancel(plan.id);
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::NoActivePlan);
}

TEST_F(CoordinatorTest, ThrowingListenerDoesNotStopPlan) {
    auto coord = make(config());
    int calls = 0;
    coord->set_progress_listener([&](const CutoverPlan&, const PlanProgress&) {
        ++calls;
        throw std::runtime_error("listener broke");
    });
    auto res = coord->execute(failover_plan());
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, PlanStatus::Succeeded);
    EXPECT_GT(calls, 6);
}

TEST_F(CoordinatorTest, ReconcileStepResumesSourceWorkflows) {
    WorkflowExecutionRecord rec;
    rec.workflow_id = "wf-1";
    rec.region = kPrimaryRegion;
    rec.last_completed_step = 0;
    rec.idempotency_token = "tok-1";
    workflows.add(rec);

    auto coord = make(config());
    auto res = coord->execute(failover_plan());
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, PlanStatus::Succeeded);
    EXPECT_EQ(workflows.resumed_from("wf-1"), 1);
    EXPECT_NE(res->steps[4].detail.find("1 workflow(s)"), std::string::npos);
}

TEST_F(CoordinatorTest, FailbackReturnsToPrimary) {
    auto coord = make(config());
    ASSERT_TRUE(coord->execute(failover_plan()));
    storage.set_lag("orders", kPrimaryRegion, 10);
    storage.set_lag("ledger", kPrimaryRegion, 10);

    const auto back = make_cutover_plan(PlanKind::Failback, kSecondaryRegion, kPrimaryRegion, now.load(), 2);
    auto res = coord->execute(back);
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, PlanStatus::Succeeded);
    EXPECT_EQ(*router.active_region(), kPrimaryRegion);
    EXPECT_FALSE(router.blocked(kPrimaryRegion));
    EXPECT_TRUE(router.blocked(kSecondaryRegion));
}

TEST_F(CoordinatorTest, WorkerThreadRunsSubmittedPlan) {
    auto coord = make(config(false));
    const auto first = failover_plan(1);
    ASSERT_TRUE(coord->submit(first));
    coord->join();
    auto p = coord->progress(first.id);
    ASSERT_TRUE(p);
    EXPECT_EQ(p->status, PlanStatus::Succeeded);

    const auto second = failover_plan(2);
    ASSERT_TRUE(coord->submit(second));
    coord->join();
    ASSERT_TRUE(coord->current());
    EXPECT_EQ(coord->current()->plan_id, second.id);
    // Finished plans stay queryable.
    ASSERT_TRUE(coord->progress(first.id));
    EXPECT_EQ(coord->progress(first.id)->status, PlanStatus::Succeeded);
    EXPECT_FALSE(coord->progress("unknown").has_value());
}
