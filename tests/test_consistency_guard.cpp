/**
 * @file test_consistency_guard.cpp
 * @brief WorkflowConsistencyGuard: ledger, reconciliation rules, manual review.
 */
#include <gtest/gtest.h>

#include <memory>
#include <string>
#include <vector>

#include "drguard/obs/alert_dispatcher.hpp"
#include "drguard/sim/sim_backends.hpp"
#include "drguard/workflow/consistency_guard.hpp"

using namespace drguard;
using drguard::workflow::ManualResolution;
using drguard::workflow::ReconcileAction;
using drguard::workflow::WorkflowConsistencyGuard;

namespace {

WorkflowExecutionRecord wf(const std::string& id, int last, const std::string& token, bool resumable = true) {
    WorkflowExecutionRecord r;
    r.workflow_id = id;
    r.region = kPrimaryRegion;
    r.last_completed_step = last;
    r.idempotency_token = token;
    r.resumable = resumable;
    return r;
}

/// Keeps listing the same workflow no matter how often it is resumed.
class StickyEngine final : public backend::WorkflowEngine {
public:
    explicit StickyEngine(WorkflowExecutionRecord rec) : rec_(std::move(rec)) {}

    Result<std::vector<WorkflowExecutionRecord>> list_in_flight(RegionId) override {
        return std::vector<WorkflowExecutionRecord>{rec_};
    }
    Result<void> resume(const std::string&, int) override {
        ++resumes;
        return {};
    }
    Result<void> abort(const std::string&) override { return {}; }
    backend::SideEffectStatus side_effect_status(const std::string&, const std::string&) override {
        return backend::SideEffectStatus::NotApplied;
    }

    int resumes{0};

private:
    WorkflowExecutionRecord rec_;
};

class ConsistencyGuardTest : public ::testing::Test {
protected:
    std::shared_ptr<sim::RecordingAlertSink> sink{std::make_shared<sim::RecordingAlertSink>()};
    obs::AlertDispatcher alerts{sink};
    sim::SimWorkflowEngine engine;
    WorkflowConsistencyGuard guard{engine, &alerts};
};

} // namespace

TEST_F(ConsistencyGuardTest, LedgerTracksCommittedSteps) {
    guard.begin("w1", kPrimaryRegion);
    ASSERT_TRUE(guard.start_step("w1", "tok-0"));
    auto rec = guard.record("w1");
    ASSERT_TRUE(rec);
    EXPECT_EQ(rec->last_completed_step, -1);
    EXPECT_EQ(rec->idempotency_token, "tok-0");

    ASSERT_TRUE(guard.commit_step("w1", 0));
    rec = guard.record("w1");
    ASSERT_TRUE(rec);
    EXPECT_EQ(rec->last_completed_step, 0);
    EXPECT_TRUE(rec->idempotency_token.empty());

    auto again = guard.commit_step("w1", 0);
    ASSERT_FALSE(again);
    EXPECT_EQ(again.error().code, ErrorCode::OutOfOrder);

    EXPECT_EQ(guard.records().size(), 1u);
    ASSERT_TRUE(guard.finish("w1"));
    EXPECT_FALSE(guard.record("w1").has_value());
    EXPECT_FALSE(guard.finish("w1"));
    EXPECT_FALSE(guard.start_step("nope", "t"));
    EXPECT_FALSE(guard.commit_step("nope", 1));
}

// Crash after the side effect landed: resume after it, never repeat it.
TEST_F(ConsistencyGuardTest, AppliedSideEffectResumesFromNextStep) {
    engine.add(wf("w1", 1, "tok-2"));
    engine.mark_applied("tok-2");

    auto report = guard.reconcile(kPrimaryRegion);
    ASSERT_TRUE(report);
    ASSERT_EQ(report->entries.size(), 1u);
    EXPECT_EQ(report->entries[0].action, ReconcileAction::ResumedNext);
    EXPECT_EQ(report->entries[0].from_step, 3);
    EXPECT_EQ(engine.resumed_from("w1"), 3);
    EXPECT_EQ(engine.applications("tok-2"), 1u);
}

// Crash before the side effect: retry the same step exactly once.
TEST_F(ConsistencyGuardTest, MissingSideEffectRetriesSameStepOnce) {
    engine.add(wf("w1", 1, "tok-2"));

    auto first = guard.reconcile(kPrimaryRegion);
    ASSERT_TRUE(first);
    ASSERT_EQ(first->entries.size(), 1u);
    EXPECT_EQ(first->entries[0].action, ReconcileAction::ResumedSame);
    EXPECT_EQ(first->entries[0].from_step, 2);
    EXPECT_EQ(engine.applications("tok-2"), 1u);

    // A second reconciliation after another crash finds nothing left to do.
    auto second = guard.reconcile(kPrimaryRegion);
    ASSERT_TRUE(second);
    EXPECT_TRUE(second->entries.empty());
    EXPECT_EQ(engine.resume_calls("w1"), 1u);
    EXPECT_EQ(engine.applications("tok-2"), 1u);
}

TEST_F(ConsistencyGuardTest, RepeatedResumeKeyIsSkipped) {
    StickyEngine sticky(wf("w1", 0, "tok-1"));
    WorkflowConsistencyGuard g(sticky);

    auto first = g.reconcile(kPrimaryRegion);
    ASSERT_TRUE(first);
    EXPECT_EQ(first->count(ReconcileAction::ResumedSame), 1u);
    auto second = g.reconcile(kPrimaryRegion);
    ASSERT_TRUE(second);
    EXPECT_EQ(second->count(ReconcileAction::Skipped), 1u);
    EXPECT_EQ(sticky.resumes, 1);
}

TEST_F(ConsistencyGuardTest, StepWithoutTokenIsRetried) {
    engine.add(wf("w1", 3, ""));
    auto report = guard.reconcile(kPrimaryRegion);
    ASSERT_TRUE(report);
    ASSERT_EQ(report->entries.size(), 1u);
    EXPECT_EQ(report->entries[0].action, ReconcileAction::ResumedSame);
    EXPECT_EQ(engine.resumed_from("w1"), 4);
}

TEST_F(ConsistencyGuardTest, UnknownSideEffectNeedsManualReview) {
    engine.add(wf("w1", 1, "tok-2"));
    engine.mark_unknown("tok-2");

    auto report = guard.reconcile(kPrimaryRegion);
    ASSERT_TRUE(report);
    EXPECT_EQ(report->count(ReconcileAction::ManualReview), 1u);
    EXPECT_EQ(engine.resume_calls("w1"), 0u);
    EXPECT_TRUE(guard.has_unresolved());
    ASSERT_EQ(guard.unresolved().size(), 1u);
    EXPECT_EQ(guard.unresolved()[0].workflow_id, "w1");
    EXPECT_EQ(sink->count(Severity::Warning, "w1"), 1u);

    // Never guessed at on later passes.
    auto again = guard.reconcile(kPrimaryRegion);
    ASSERT_TRUE(again);
    EXPECT_EQ(again->count(ReconcileAction::Skipped), 1u);
    EXPECT_EQ(engine.resume_calls("w1"), 0u);
}

TEST_F(ConsistencyGuardTest, ManualResolutionResumesAndClears) {
    engine.add(wf("w1", 1, "tok-2"));
    engine.mark_unknown("tok-2");
    ASSERT_TRUE(guard.reconcile(kPrimaryRegion));
    ASSERT_TRUE(guard.has_unresolved());

    auto bad = guard.resolve_manually("other", ManualResolution::Abort);
    ASSERT_FALSE(bad);
    EXPECT_EQ(bad.error().code, ErrorCode::InvalidArgument);

    ASSERT_TRUE(guard.resolve_manually("w1", ManualResolution::SideEffectApplied));
    EXPECT_FALSE(guard.has_unresolved());
    EXPECT_EQ(engine.resumed_from("w1"), 3);
}

TEST_F(ConsistencyGuardTest, ManualAbort) {
    engine.add(wf("w1", 1, "tok-2"));
    engine.mark_unknown("tok-2");
    ASSERT_TRUE(guard.reconcile(kPrimaryRegion));
    ASSERT_TRUE(guard.resolve_manually("w1", ManualResolution::Abort));
    EXPECT_TRUE(engine.aborted("w1"));
    EXPECT_FALSE(guard.has_unresolved());
}

TEST_F(ConsistencyGuardTest, PinnedWorkflowIsAborted) {
    engine.add(wf("pinned", 0, "tok-1", false));
    auto report = guard.reconcile(kPrimaryRegion);
    ASSERT_TRUE(report);
    EXPECT_EQ(report->count(ReconcileAction::Aborted), 1u);
    EXPECT_TRUE(engine.aborted("pinned"));
    EXPECT_EQ(engine.resume_calls("pinned"), 0u);
}

TEST_F(ConsistencyGuardTest, ResumeFailureFlagsOnlyThatWorkflow) {
    engine.add(wf("a", 0, "tok-a"));
    engine.add(wf("b", 0, "tok-b"));
    engine.fail_resume("a", true);

    auto report = guard.reconcile(kPrimaryRegion);
    ASSERT_TRUE(report);
    EXPECT_EQ(report->entries.size(), 2u);
    EXPECT_EQ(report->count(ReconcileAction::ManualReview), 1u);
    EXPECT_EQ(report->count(ReconcileAction::ResumedSame), 1u);
    ASSERT_EQ(guard.unresolved().size(), 1u);
    EXPECT_EQ(guard.unresolved()[0].workflow_id, "a");
}

TEST_F(ConsistencyGuardTest, ListingFailureIsAnError) {
    engine.fail_listing(true);
    auto report = guard.reconcile(kPrimaryRegion);
    ASSERT_FALSE(report);
    EXPECT_EQ(report.error().code, ErrorCode::BackendFailure);
}

TEST_F(ConsistencyGuardTest, LedgerProgressBeatsStaleEngineView) {
    engine.add(wf("w1", 0, "tok-1"));
    guard.begin("w1", kPrimaryRegion);
    ASSERT_TRUE(guard.commit_step("w1", 0));
    ASSERT_TRUE(guard.commit_step("w1", 1));
    ASSERT_TRUE(guard.start_step("w1", "tok-2"));

    auto report = guard.reconcile(kPrimaryRegion);
    ASSERT_TRUE(report);
    ASSERT_EQ(report->entries.size(), 1u);
    EXPECT_EQ(report->entries[0].from_step, 2);
    EXPECT_EQ(engine.resumed_from("w1"), 2);

    auto rec = guard.record("w1");
    ASSERT_TRUE(rec);
    EXPECT_EQ(rec->last_completed_step, 1);
    EXPECT_TRUE(rec->idempotency_token.empty());

    // No new progress since the resume: nothing to do on another pass.
    auto again = guard.reconcile(kPrimaryRegion);
    ASSERT_TRUE(again);
    EXPECT_EQ(again->count(ReconcileAction::Skipped), 1u);
    EXPECT_EQ(engine.resume_calls("w1"), 1u);
}

TEST_F(ConsistencyGuardTest, ResumedWorkflowKeepsItsLedgerRecord) {
    engine.add(wf("w1", -1, "tok-0"));
    guard.begin("w1", kPrimaryRegion);
    ASSERT_TRUE(guard.start_step("w1", "tok-0"));

    auto first = guard.reconcile(kPrimaryRegion, kSecondaryRegion);
    ASSERT_TRUE(first);
    ASSERT_EQ(first->entries.size(), 1u);
    EXPECT_EQ(first->entries[0].action, ReconcileAction::ResumedSame);
    auto rec = guard.record("w1");
    ASSERT_TRUE(rec);
    EXPECT_EQ(rec->region, kSecondaryRegion);

    // The engine keeps driving it through the ledger in its new region.
    ASSERT_TRUE(guard.commit_step("w1", 0));
    ASSERT_TRUE(guard.start_step("w1", "tok-1"));
    engine.mark_applied("tok-1");

    auto back = guard.reconcile(kSecondaryRegion, kPrimaryRegion);
    ASSERT_TRUE(back);
    ASSERT_EQ(back->entries.size(), 1u);
    EXPECT_EQ(back->entries[0].action, ReconcileAction::ResumedNext);
    EXPECT_EQ(back->entries[0].from_step, 2);
    EXPECT_EQ(engine.resumed_from("w1"), 2);

    ASSERT_TRUE(guard.finish("w1"));
    EXPECT_FALSE(guard.record("w1").has_value());
}

TEST_F(ConsistencyGuardTest, FinishForgetsResumeHistory) {
    engine.add(wf("w1", -1, ""));
    guard.begin("w1", kPrimaryRegion);
    ASSERT_TRUE(guard.reconcile(kPrimaryRegion));
    EXPECT_EQ(engine.resume_calls("w1"), 1u);
    ASSERT_TRUE(guard.finish("w1"));

    // A new execution under the same id starts with a clean resume history.
    guard.begin("w1", kPrimaryRegion);
    auto report = guard.reconcile(kPrimaryRegion);
    ASSERT_TRUE(report);
    EXPECT_EQ(report->count(ReconcileAction::ResumedSame), 1u);
    EXPECT_EQ(engine.resume_calls("w1"), 2u);
}

TEST_F(ConsistencyGuardTest, AbortedWorkflowLeavesTheLedger) {
    engine.add(wf("pinned", 0, "tok-1", false));
    guard.begin("pinned", kPrimaryRegion, false);
    ASSERT_TRUE(guard.commit_step("pinned", 0));
    ASSERT_TRUE(guard.start_step("pinned", "tok-1"));
    auto report = guard.reconcile(kPrimaryRegion);
    ASSERT_TRUE(report);
    EXPECT_EQ(report->count(ReconcileAction::Aborted), 1u);
    EXPECT_FALSE(guard.record("pinned").has_value());
}

TEST_F(ConsistencyGuardTest, OtherRegionsUntouched) {
    auto rec = wf("remote", 0, "tok");
    rec.region = kSecondaryRegion;
    engine.add(rec);
    auto report = guard.reconcile(kPrimaryRegion);
    ASSERT_TRUE(report);
    EXPECT_TRUE(report->entries.empty());
    EXPECT_EQ(engine.resume_calls("remote"), 0u);
}
