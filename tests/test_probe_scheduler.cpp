/**
 * @file test_probe_scheduler.cpp
 * @brief ProbeScheduler: per-probe rings, single-consumer ingestion, lifecycle.
 */
#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <memory>
#include <thread>

#include "drguard/health/probe_scheduler.hpp"

using namespace drguard;
using drguard::health::AggregatorConfig;
using drguard::health::CallbackCheck;
using drguard::health::HealthAggregator;
using drguard::health::ProbeScheduler;
using drguard::health::ProbeSpec;
using drguard::health::RegionProbe;
using drguard::health::SchedulerConfig;

namespace {

AggregatorConfig fast_config(std::uint32_t interval_ms) {
    AggregatorConfig c;
    c.probe_interval_ms = interval_ms;
    c.k = 3;
    c.k2 = 3;
    c.d = 3;
    c.r = 7;
    c.window_ms = 100 * interval_ms;
    c.round_grace_ms = interval_ms / 4;
    return c;
}

std::unique_ptr<RegionProbe> make_probe(ProbeId id, bool healthy) {
    ProbeSpec spec;
    spec.id = id;
    spec.region = kPrimaryRegion;
    spec.timeout_ms = 1000;
    spec.check = CallbackCheck{[healthy](RegionId) -> Result<std::uint32_t> {
        if (!healthy) return make_error(ErrorCode::Timeout, "simulated outage");
        return 1u;
    }};
    return std::make_unique<RegionProbe>(spec);
}

HealthSample sample(ProbeId probe, TimestampMs ts, bool ok) {
    HealthSample s;
    s.region = kPrimaryRegion;
    s.probe = probe;
    s.timestamp_ms = ts;
    s.success = ok;
    return s;
}

} // namespace

TEST(ProbeScheduler, AddProbeValidation) {
    HealthAggregator agg(fast_config(1000));
    ProbeScheduler bad_ring(SchedulerConfig{1000, 100, 5}, agg);
    auto r = bad_ring.add_probe(make_probe(0, true));
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::InvalidConfig);

    ProbeScheduler sched(SchedulerConfig{1000, 8, 5}, agg);
    EXPECT_FALSE(sched.add_probe(nullptr));
    auto first = sched.add_probe(make_probe(0, true));
    ASSERT_TRUE(first);
    EXPECT_EQ(*first, 0u);
    auto second = sched.add_probe(make_probe(1, true));
    ASSERT_TRUE(second);
    EXPECT_EQ(*second, 1u);
    EXPECT_EQ(sched.probe_count(), 2u);
}

TEST(ProbeScheduler, StartWithoutProbesFails) {
    HealthAggregator agg(fast_config(1000));
    ProbeScheduler sched(SchedulerConfig{}, agg);
    auto r = sched.start();
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::InvalidConfig);
    EXPECT_FALSE(sched.running());
}

TEST(ProbeScheduler, DrainMovesQueuedSamplesIntoAggregator) {
    HealthAggregator agg(fast_config(1000));
    ASSERT_TRUE(agg.register_region(kPrimaryRegion, {0, 1}));
    ProbeScheduler sched(SchedulerConfig{1000, 8, 5}, agg);
    ASSERT_TRUE(sched.add_probe(make_probe(0, true)));
    ASSERT_TRUE(sched.add_probe(make_probe(1, true)));

    for (std::uint64_t r = 0; r < 3; ++r) {
        ASSERT_TRUE(sched.offer(0, sample(0, r * 1000 + 10, false)));
        ASSERT_TRUE(sched.offer(1, sample(1, r * 1000 + 20, false)));
    }
    EXPECT_EQ(agg.verdict(kPrimaryRegion)->rounds_evaluated, 0u);

    EXPECT_EQ(sched.drain_once(), 6u);
    EXPECT_EQ(sched.drain_once(), 0u);
    auto v = agg.verdict(kPrimaryRegion);
    ASSERT_TRUE(v);
    EXPECT_EQ(v->rounds_evaluated, 3u);
    EXPECT_EQ(v->status, HealthStatus::Degraded);
}

TEST(ProbeScheduler, FullRingDropsAndCounts) {
    HealthAggregator agg(fast_config(1000));
    ProbeScheduler sched(SchedulerConfig{1000, 4, 5}, agg);
    ASSERT_TRUE(sched.add_probe(make_probe(0, true)));

    // Capacity 4 holds 3 samples.
    EXPECT_TRUE(sched.offer(0, sample(0, 1, true)));
    EXPECT_TRUE(sched.offer(0, sample(0, 2, true)));
    EXPECT_TRUE(sched.offer(0, sample(0, 3, true)));
    EXPECT_FALSE(sched.offer(0, sample(0, 4, true)));
    EXPECT_EQ(sched.dropped(), 1u);
    EXPECT_FALSE(sched.offer(5, sample(0, 5, true)));
}

TEST(ProbeScheduler, ThreadsFeedAggregatorUntilStopped) {
    constexpr std::uint32_t kInterval = 20;
    HealthAggregator agg(fast_config(kInterval));
    ASSERT_TRUE(agg.register_region(kPrimaryRegion, {0, 1}));

    ProbeScheduler sched(SchedulerConfig{kInterval, 64, 2}, agg);
    ASSERT_TRUE(sched.add_probe(make_probe(0, false)));
    ASSERT_TRUE(sched.add_probe(make_probe(1, false)));
    ASSERT_TRUE(sched.start());
    EXPECT_TRUE(sched.running());
    EXPECT_FALSE(sched.offer(0, sample(0, 1, true)));
    EXPECT_FALSE(sched.add_probe(make_probe(2, true)));

    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (std::chrono::steady_clock::now() < deadline) {
        auto v = agg.verdict(kPrimaryRegion);
        if (v && v->status != HealthStatus::Healthy) break;
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }

    sched.stop();
    sched.stop(); // idempotent
    EXPECT_FALSE(sched.running());
    auto v = agg.verdict(kPrimaryRegion);
    ASSERT_TRUE(v);
    EXPECT_NE(v->status, HealthStatus::Healthy);
    EXPECT_GE(v->rounds_evaluated, 3u);
}
