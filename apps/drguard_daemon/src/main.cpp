/**
 * @file main.cpp
 * @brief drguard_daemon: regional failover control loop.
 *
 * **Bootstrap**
 * - Load config (or built-in defaults), configure logging, validate.
 * - Construct backends, aggregator, lag tracker, coordinator, guard, engine.
 * - Restore persisted engine state before the first decision cycle.
 *
 * **Threads**
 * - One thread per probe plus one ingestion thread (ProbeScheduler).
 * - One cutover worker (CutoverCoordinator), one alert delivery thread.
 * - The main thread runs the decision tick: lag poll, evaluate, journal prune.
 *
 * Backends are the in-memory simulations (dry-run): routing-layer probes answer
 * from SimRouter, replication lag comes from SimStorage.
 *
 * Usage:
 *   drguard_daemon [--config <file.json>] [--status] [--confirm-failback]
 *                  [--acknowledge-failure] [--ticks <n>]
 */

#include <algorithm>
#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdint>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "drguard/config/config_loader.hpp"
#include "drguard/cutover/coordinator.hpp"
#include "drguard/engine/failover_engine.hpp"
#include "drguard/engine/status_report.hpp"
#include "drguard/health/health_aggregator.hpp"
#include "drguard/health/probe_scheduler.hpp"
#include "drguard/health/region_probe.hpp"
#include "drguard/obs/alert_dispatcher.hpp"
#include "drguard/obs/logging.hpp"
#include "drguard/obs/observability.hpp"
#include "drguard/persist/plan_journal.hpp"
#include "drguard/persist/state_store.hpp"
#include "drguard/replication/lag_poller.hpp"
#include "drguard/replication/lag_tracker.hpp"
#include "drguard/sim/sim_backends.hpp"
#include "drguard/version.hpp"
#include "drguard/workflow/consistency_guard.hpp"

namespace {

std::atomic<bool> g_stop{false};

extern "C" void on_signal(int) { g_stop.store(true); }

struct Options {
    std::optional<std::string> config_path;
    bool status_only{false};
    bool confirm_failback{false};
    bool acknowledge_failure{false};
    std::optional<std::uint64_t> ticks; ///< Stop after this many decision cycles
};

void usage(const char* argv0) {
    std::cerr << "usage: " << argv0
              << " [--config <file.json>] [--status] [--confirm-failback]"
                 " [--acknowledge-failure] [--ticks <n>]\n";
}

std::optional<Options> parse_args(int argc, char** argv) {
    Options o;
    for (int i = 1; i < argc; ++i) {
        const std::string a = argv[i];
        if (a == "--config" && i + 1 < argc) {
            o.config_path = argv[++i];
        } else if (a == "--status") {
            o.status_only = true;
        } else if (a == "--confirm-failback") {
            o.confirm_failback = true;
        } else if (a == "--acknowledge-failure") {
            o.acknowledge_failure = true;
        } else if (a == "--ticks" && i + 1 < argc) {
            try {
                o.ticks = std::stoull(argv[++i]);
            } catch (const std::exception&) {
                return std::nullopt;
            }
        } else {
            return std::nullopt;
        }
    }
    return o;
}

std::vector<drguard::RegionId> replica_regions(const drguard::config::DrConfig& cfg) {
    std::vector<drguard::RegionId> out;
    for (const auto& r : cfg.regions) out.push_back(r.id);
    return out;
}

} // namespace

int main(int argc, char** argv) {
    using namespace drguard;

    auto opts = parse_args(argc, argv);
    if (!opts) {
        usage(argv[0]);
        return 2;
    }

    auto loaded = opts->config_path ? config::Loader::load_from_file(*opts->config_path)
                                    : Result<config::DrConfig>(config::Loader::defaults());
    if (!loaded) {
        std::cerr << "drguard_daemon: " << to_string(loaded.error().code) << ": "
                  << loaded.error().message << "\n";
        return 1;
    }
    const config::DrConfig cfg = std::move(*loaded);

    obs::configure_logging(cfg.logging);
    spdlog::info("drguard_daemon {} starting ({} regions, {} stores, dry-run backends)",
                 version_string, cfg.regions.size(), cfg.stores.size());

    // Backends
    auto router   = std::make_shared<sim::SimRouter>(cfg.engine.primary);
    auto storage  = std::make_shared<sim::SimStorage>(cfg.engine.primary);
    auto workflows = std::make_shared<sim::SimWorkflowEngine>();

    obs::AlertDispatcher alerts(std::make_shared<obs::LogAlertSink>(), cfg.alert_queue_capacity);
    alerts.start();

    // Health
    health::HealthAggregator aggregator(cfg.aggregator, &alerts);
    health::ProbeScheduler scheduler(
        health::SchedulerConfig{cfg.aggregator.probe_interval_ms, cfg.probe_ring_capacity,
                                config::constants::INGEST_IDLE_SLEEP_MS},
        aggregator);

    for (const auto& region : cfg.regions) {
        std::vector<ProbeId> ids;
        for (const auto& p : region.probes) {
            ids.push_back(p.id);
            health::ProbeSpec spec;
            spec.id = p.id;
            spec.region = region.id;
            spec.timeout_ms = p.timeout_ms;
            if (p.type == config::ProbeType::Tcp) {
                spec.check = health::TcpConnectCheck{p.host, p.port};
            } else {
                spec.check = health::RoutingHealthCheck{};
            }
            if (auto r = scheduler.add_probe(std::make_unique<health::RegionProbe>(spec, router)); !r) {
                spdlog::critical("probe {} for {}: {}", p.id, region.name, r.error().message);
                return 1;
            }
        }
        if (auto r = aggregator.register_region(region.id, ids); !r) {
            spdlog::critical("region {}: {}", region.name, r.error().message);
            return 1;
        }
    }

    // Replication
    replication::ReplicationLagTracker tracker(cfg.lag);
    for (const auto& s : cfg.stores) tracker.register_store(s);
    replication::LagPoller poller(*storage, tracker);
    const auto replicas = replica_regions(cfg);

    // Cutover, reconciliation, persistence
    workflow::WorkflowConsistencyGuard guard(*workflows, &alerts);
    cutover::CutoverCoordinator coordinator(cfg.coordinator, *storage, *router, tracker, guard);
    persist::JsonFileStateStore state(cfg.persistence.state_file);
    persist::PlanJournal journal(cfg.persistence.journal_file, cfg.persistence.plan_retention_ms);
    auto observer = obs::make_log_observer();

    engine::FailoverEngine engine(cfg.engine, aggregator, tracker, coordinator, guard, state, alerts,
                                  &journal, observer.get());

    if (auto r = engine.restore(now_ms()); !r) {
        spdlog::critical("cannot restore engine state: {}", r.error().message);
        alerts.stop();
        return 1;
    }

    if (opts->status_only) {
        poller.poll_once(replicas, now_ms());
        const auto counters = observer->snapshot();
        std::cout << engine::render_status(engine.status(), *aggregator.snapshot(),
                                           tracker.report(now_ms()), &counters).dump(2)
                  << std::endl;
        alerts.stop();
        return 0;
    }
    if (opts->acknowledge_failure) {
        if (auto r = engine.acknowledge_failure(); !r) spdlog::warn("acknowledge: {}", r.error().message);
    }
    if (opts->confirm_failback) {
        if (auto r = engine.confirm_failback(); !r) spdlog::warn("confirm fail-back: {}", r.error().message);
    }

    std::signal(SIGINT, on_signal);
    std::signal(SIGTERM, on_signal);

    if (auto r = scheduler.start(); !r) {
        spdlog::critical("cannot start probes: {}", r.error().message);
        alerts.stop();
        return 1;
    }

    const auto tick = std::chrono::milliseconds(cfg.decision_tick_ms);
    const std::uint64_t status_every = std::max<std::uint64_t>(1, 60000 / cfg.decision_tick_ms);
    const std::uint64_t prune_every = std::max<std::uint64_t>(1, 3600000 / cfg.decision_tick_ms);
    std::uint64_t n = 0;

    while (!g_stop.load()) {
        const TimestampMs now = now_ms();
        poller.poll_once(replicas, now);

        const auto cycle = engine.evaluate(now);
        for (const auto& t : cycle.transitions) {
            spdlog::info("mode {} -> {} ({})", to_string(t.from), to_string(t.to), t.reason);
        }

        ++n;
        if (n % status_every == 0) {
            const auto counters = observer->snapshot();
            spdlog::info("status {}", engine::render_status(engine.status(), *aggregator.snapshot(),
                                                            tracker.report(now), &counters).dump());
        }
        if (n % prune_every == 0) {
            if (auto pruned = journal.prune(now); !pruned) {
                spdlog::warn("plan journal prune failed: {}", pruned.error().message);
            } else if (*pruned > 0) {
                spdlog::info("plan journal: pruned {} entries", *pruned);
            }
        }
        if (opts->ticks && n >= *opts->ticks) break;

        std::this_thread::sleep_for(tick);
    }

    spdlog::info("drguard_daemon stopping (mode {})", to_string(engine.mode()));
    scheduler.stop();
    coordinator.join();
    alerts.stop();
    spdlog::shutdown();
    return 0;
}
