/**
 * @file test_health_aggregator.cpp
 * @brief Majority voting, hysteresis and round bookkeeping of HealthAggregator.
 *
 * Time is synthetic: round r covers [r*1000, (r+1)*1000) and every probe
 * reports at r*1000 + 100. A round closes as soon as all probes reported.
 */
#include <gtest/gtest.h>

#include <memory>
#include <vector>

#include "drguard/health/health_aggregator.hpp"
#include "drguard/obs/alert_dispatcher.hpp"
#include "drguard/sim/sim_backends.hpp"

using namespace drguard;
using drguard::health::AggregatorConfig;
using drguard::health::HealthAggregator;

namespace {

constexpr std::uint32_t kInterval = 1000;

AggregatorConfig test_config() {
    AggregatorConfig c;
    c.probe_interval_ms = kInterval;
    c.k = 3;
    c.k2 = 3;
    c.d = 3;
    c.r = 7;
    c.window_ms = 60 * kInterval;
    c.round_grace_ms = 500;
    return c;
}

TimestampMs at(std::uint64_t round) { return round * kInterval + 100; }

/// Ingest one sample per probe for @p round; @p ok[i] is the result of probe i.
void feed(HealthAggregator& agg, RegionId region, std::uint64_t round, const std::vector<bool>& ok) {
    for (std::size_t i = 0; i < ok.size(); ++i) {
        HealthSample s;
        s.region = region;
        s.probe = static_cast<ProbeId>(i);
        s.timestamp_ms = at(round);
        s.success = ok[i];
        agg.ingest(s);
    }
}

HealthStatus status_of(const HealthAggregator& agg, RegionId region) {
    auto v = agg.verdict(region);
    return v ? v->status : HealthStatus::Unhealthy;
}

class HealthAggregatorTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(agg.register_region(kPrimaryRegion, {0, 1, 2}));
    }

    HealthAggregator agg{test_config()};
    std::uint64_t round{0};

    void rounds(std::size_t n, const std::vector<bool>& ok) {
        for (std::size_t i = 0; i < n; ++i) feed(agg, kPrimaryRegion, round++, ok);
    }
};

const std::vector<bool> kAllOk{true, true, true};
const std::vector<bool> kAllFail{false, false, false};
const std::vector<bool> kMajorityFail{false, false, true};
const std::vector<bool> kOneFail{true, false, true};

} // namespace

TEST(AggregatorConfig, Validation) {
    EXPECT_TRUE(health::validate(test_config()));

    auto c = test_config();
    c.r = c.k + c.k2;
    auto r = health::validate(c);
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::InvalidConfig);

    c = test_config();
    c.k = 0;
    EXPECT_FALSE(health::validate(c));

    c = test_config();
    c.window_ms = 2 * kInterval;
    EXPECT_FALSE(health::validate(c));
}

TEST(HealthAggregator, RegisterRejectsEmptyAndDuplicateProbes) {
    HealthAggregator agg(test_config());
    EXPECT_FALSE(agg.register_region(kPrimaryRegion, {}));
    EXPECT_FALSE(agg.register_region(kPrimaryRegion, {1, 1}));
    EXPECT_FALSE(agg.verdict(kPrimaryRegion).has_value());
}

TEST_F(HealthAggregatorTest, StartsHealthy) {
    auto v = agg.verdict(kPrimaryRegion);
    ASSERT_TRUE(v);
    EXPECT_EQ(v->status, HealthStatus::Healthy);
    EXPECT_EQ(v->rounds_evaluated, 0u);
    EXPECT_FALSE(agg.verdict(kSecondaryRegion).has_value());
}

// A single bad probe is outvoted forever.
TEST_F(HealthAggregatorTest, SingleFailingProbeNeverFlips) {
    rounds(50, kOneFail);
    auto v = agg.verdict(kPrimaryRegion);
    ASSERT_TRUE(v);
    EXPECT_EQ(v->status, HealthStatus::Healthy);
    EXPECT_EQ(v->consecutive_failures, 0u);
    EXPECT_EQ(v->rounds_evaluated, 50u);
}

// Fewer than K consecutive majority failures never leave HEALTHY.
TEST_F(HealthAggregatorTest, ShortFailureRunsNeverFlip) {
    for (int i = 0; i < 10; ++i) {
        rounds(2, kMajorityFail);
        rounds(1, kAllOk);
    }
    EXPECT_EQ(status_of(agg, kPrimaryRegion), HealthStatus::Healthy);
}

TEST_F(HealthAggregatorTest, KFailuresDegradeAndOneSuccessDoesNotRevert) {
    rounds(2, kAllFail);
    EXPECT_EQ(status_of(agg, kPrimaryRegion), HealthStatus::Healthy);
    rounds(1, kAllFail);
    EXPECT_EQ(status_of(agg, kPrimaryRegion), HealthStatus::Degraded);

    rounds(1, kAllOk);
    EXPECT_EQ(status_of(agg, kPrimaryRegion), HealthStatus::Degraded);
    auto v = agg.verdict(kPrimaryRegion);
    ASSERT_TRUE(v);
    EXPECT_EQ(v->consecutive_successes, 1u);
    EXPECT_EQ(v->last_transition_ms, at(2));
}

TEST_F(HealthAggregatorTest, DegradedRecoversAfterDSuccesses) {
    rounds(3, kAllFail);
    ASSERT_EQ(status_of(agg, kPrimaryRegion), HealthStatus::Degraded);
    rounds(2, kAllOk);
    EXPECT_EQ(status_of(agg, kPrimaryRegion), HealthStatus::Degraded);
    rounds(1, kAllOk);
    EXPECT_EQ(status_of(agg, kPrimaryRegion), HealthStatus::Healthy);
}

TEST_F(HealthAggregatorTest, UnhealthyNeedsRSuccessesToRecover) {
    rounds(3, kAllFail);
    ASSERT_EQ(status_of(agg, kPrimaryRegion), HealthStatus::Degraded);
    rounds(3, kAllFail);
    ASSERT_EQ(status_of(agg, kPrimaryRegion), HealthStatus::Unhealthy);

    // D (and even K + K2) successes are not enough once UNHEALTHY.
    rounds(6, kAllOk);
    EXPECT_EQ(status_of(agg, kPrimaryRegion), HealthStatus::Unhealthy);
    rounds(1, kAllOk);
    EXPECT_EQ(status_of(agg, kPrimaryRegion), HealthStatus::Healthy);
}

TEST_F(HealthAggregatorTest, FailureInterruptsRecoveryStreak) {
    rounds(6, kAllFail);
    ASSERT_EQ(status_of(agg, kPrimaryRegion), HealthStatus::Unhealthy);
    rounds(6, kAllOk);
    rounds(1, kMajorityFail);
    rounds(6, kAllOk);
    EXPECT_EQ(status_of(agg, kPrimaryRegion), HealthStatus::Unhealthy);
    rounds(1, kAllOk);
    EXPECT_EQ(status_of(agg, kPrimaryRegion), HealthStatus::Healthy);
}

TEST(HealthAggregator, InconclusiveRoundResetsStreaks) {
    HealthAggregator agg(test_config());
    ASSERT_TRUE(agg.register_region(kPrimaryRegion, {0, 1}));
    std::uint64_t r = 0;
    feed(agg, kPrimaryRegion, r++, {false, false});
    feed(agg, kPrimaryRegion, r++, {false, false});
    feed(agg, kPrimaryRegion, r++, {false, true}); // 1 of 2: no strict majority
    feed(agg, kPrimaryRegion, r++, {false, false});
    feed(agg, kPrimaryRegion, r++, {false, false});
    auto v = agg.verdict(kPrimaryRegion);
    ASSERT_TRUE(v);
    EXPECT_EQ(v->status, HealthStatus::Healthy);
    EXPECT_EQ(v->consecutive_failures, 2u);

    feed(agg, kPrimaryRegion, r++, {false, false});
    EXPECT_EQ(status_of(agg, kPrimaryRegion), HealthStatus::Degraded);
}

TEST_F(HealthAggregatorTest, FailureWinsWithinOneRound) {
    // Probe 0 reports success then failure in the same round.
    HealthSample s;
    s.region = kPrimaryRegion;
    for (std::uint64_t r = 0; r < 3; ++r) {
        s.probe = 0; s.timestamp_ms = at(r); s.success = true;  agg.ingest(s);
        s.probe = 0; s.timestamp_ms = at(r) + 10; s.success = false; agg.ingest(s);
        s.probe = 1; s.timestamp_ms = at(r); s.success = false; agg.ingest(s);
        s.probe = 2; s.timestamp_ms = at(r); s.success = true;  agg.ingest(s);
    }
    EXPECT_EQ(status_of(agg, kPrimaryRegion), HealthStatus::Degraded);
}

TEST_F(HealthAggregatorTest, MissingProbesCountAsFailing) {
    // Only probe 0 reports; the rounds close at their deadline.
    HealthSample s;
    s.region = kPrimaryRegion;
    s.probe = 0;
    s.success = true;
    for (std::uint64_t r = 0; r < 3; ++r) {
        s.timestamp_ms = at(r);
        agg.ingest(s);
    }
    // Round 0 passed its deadline when the round-2 sample arrived.
    EXPECT_EQ(agg.verdict(kPrimaryRegion)->rounds_evaluated, 1u);

    agg.close_overdue_rounds(3 * kInterval + 500);
    auto v = agg.verdict(kPrimaryRegion);
    ASSERT_TRUE(v);
    EXPECT_EQ(v->rounds_evaluated, 3u);
    EXPECT_EQ(v->status, HealthStatus::Degraded);
}

TEST_F(HealthAggregatorTest, IncompleteRoundWaitsForGrace) {
    HealthSample s;
    s.region = kPrimaryRegion;
    s.probe = 0;
    s.timestamp_ms = at(0);
    s.success = true;
    agg.ingest(s);

    agg.close_overdue_rounds(kInterval + 499);
    EXPECT_EQ(agg.verdict(kPrimaryRegion)->rounds_evaluated, 0u);
    agg.close_overdue_rounds(kInterval + 500);
    EXPECT_EQ(agg.verdict(kPrimaryRegion)->rounds_evaluated, 1u);
}

TEST(HealthAggregator, SilentRegionDegradesOnceArmed) {
    HealthAggregator agg(test_config());
    ASSERT_TRUE(agg.register_region(kPrimaryRegion, {0, 1}));

    // First call arms the round clock at the current round.
    agg.close_overdue_rounds(10 * kInterval);
    EXPECT_EQ(agg.verdict(kPrimaryRegion)->rounds_evaluated, 0u);

    agg.close_overdue_rounds(13 * kInterval + 500);
    auto v = agg.verdict(kPrimaryRegion);
    ASSERT_TRUE(v);
    EXPECT_EQ(v->rounds_evaluated, 3u);
    EXPECT_EQ(v->status, HealthStatus::Degraded);
}

TEST_F(HealthAggregatorTest, LateSampleForClosedRoundIsNotCounted) {
    rounds(2, kAllFail);
    const auto before = *agg.verdict(kPrimaryRegion);

    HealthSample late;
    late.region = kPrimaryRegion;
    late.probe = 0;
    late.timestamp_ms = at(0) + 50;
    late.success = false;
    agg.ingest(late);

    const auto after = *agg.verdict(kPrimaryRegion);
    EXPECT_EQ(after.rounds_evaluated, before.rounds_evaluated);
    EXPECT_EQ(after.consecutive_failures, before.consecutive_failures);
    // Still retained in the trailing window.
    EXPECT_EQ(agg.retained_samples(kPrimaryRegion, 0), 3u);
}

TEST_F(HealthAggregatorTest, WindowDropsExpiredSamples) {
    rounds(100, kAllOk);
    // Samples at r*1000+100 with r in [39, 99] fall inside W = 60 s of the last one.
    EXPECT_EQ(agg.retained_samples(kPrimaryRegion, 0), 61u);
    EXPECT_EQ(agg.retained_samples(kPrimaryRegion, 2), 61u);
}

TEST_F(HealthAggregatorTest, UnknownRegionAndProbeIgnored) {
    HealthSample s;
    s.region = 7;
    s.probe = 0;
    s.timestamp_ms = at(0);
    agg.ingest(s);
    s.region = kPrimaryRegion;
    s.probe = 9;
    agg.ingest(s);
    EXPECT_EQ(agg.retained_samples(kPrimaryRegion, 9), 0u);
    EXPECT_EQ(agg.verdict(kPrimaryRegion)->rounds_evaluated, 0u);
}

TEST_F(HealthAggregatorTest, RegionsAreIndependent) {
    ASSERT_TRUE(agg.register_region(kSecondaryRegion, {0, 1, 2}));
    for (std::uint64_t r = 0; r < 6; ++r) {
        feed(agg, kPrimaryRegion, r, kAllFail);
        feed(agg, kSecondaryRegion, r, kAllOk);
    }
    auto snap = agg.snapshot();
    ASSERT_EQ(snap->verdicts.size(), 2u);
    EXPECT_EQ(snap->verdicts.at(kPrimaryRegion).status, HealthStatus::Unhealthy);
    EXPECT_EQ(snap->verdicts.at(kSecondaryRegion).status, HealthStatus::Healthy);
}

TEST_F(HealthAggregatorTest, SnapshotVersionAdvancesAndOldSnapshotsStayValid) {
    auto first = agg.snapshot();
    rounds(3, kAllFail);
    auto second = agg.snapshot();
    EXPECT_GT(second->version, first->version);
    EXPECT_EQ(first->verdicts.at(kPrimaryRegion).status, HealthStatus::Healthy);
    EXPECT_EQ(second->verdicts.at(kPrimaryRegion).status, HealthStatus::Degraded);
}

TEST_F(HealthAggregatorTest, ActiveRegionPublishedOnNextRound) {
    agg.set_active_region(kSecondaryRegion);
    EXPECT_EQ(agg.active_region(), kSecondaryRegion);
    rounds(1, kAllOk);
    EXPECT_EQ(agg.snapshot()->active_region, kSecondaryRegion);
}

TEST(HealthAggregator, TransitionsRaiseAlerts) {
    auto sink = std::make_shared<sim::RecordingAlertSink>();
    obs::AlertDispatcher alerts(sink);
    HealthAggregator agg(test_config(), &alerts);
    ASSERT_TRUE(agg.register_region(kPrimaryRegion, {0, 1}));
    std::uint64_t r = 0;
    for (int i = 0; i < 3; ++i) feed(agg, kPrimaryRegion, r++, {false, false});
    for (int i = 0; i < 3; ++i) feed(agg, kPrimaryRegion, r++, {true, true});

    // Dispatcher not started: alerts are delivered on the caller.
    EXPECT_EQ(sink->count(Severity::Warning, "HEALTHY -> DEGRADED"), 1u);
    EXPECT_EQ(sink->count(Severity::Info, "DEGRADED -> HEALTHY"), 1u);
}
