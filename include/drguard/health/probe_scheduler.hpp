#pragma once
/**
 * @file probe_scheduler.hpp
 * @brief Runs each probe on its own periodic thread and funnels samples to the aggregator.
 *
 * Concurrency model:
 *   - One producer thread per probe, each owning the producer side of its own SPSC ring.
 *   - One ingestion thread drains every ring and is the aggregator's only writer.
 *   - A full ring drops the new sample and counts it; probes never block on ingestion.
 */

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

#include "drguard/config/constants.hpp"
#include "drguard/core/error.hpp"
#include "drguard/core/types.hpp"
#include "drguard/health/health_aggregator.hpp"
#include "drguard/health/region_probe.hpp"
#include "drguard/mem/spsc_queue.hpp"

namespace drguard::health {

struct SchedulerConfig {
    std::uint32_t interval_ms{drguard::config::constants::PROBE_INTERVAL_MS};
    std::size_t   ring_capacity{drguard::config::constants::PROBE_RING_CAPACITY}; ///< Power of two
    std::uint32_t idle_sleep_ms{drguard::config::constants::INGEST_IDLE_SLEEP_MS};
};

class ProbeScheduler {
public:
    using Clock = std::function<TimestampMs()>;

    ProbeScheduler(SchedulerConfig cfg, HealthAggregator& aggregator, Clock clock = &drguard::now_ms);
    ~ProbeScheduler();

    ProbeScheduler(const ProbeScheduler&)            = delete;
    ProbeScheduler& operator=(const ProbeScheduler&) = delete;

    /**
     * @brief Register a probe and allocate its ring. Not allowed once started.
     * @return Index of the probe's ring, or InvalidArgument/InvalidConfig.
     */
    Result<std::size_t> add_probe(std::unique_ptr<RegionProbe> probe);

    /// Spawn probe threads and the ingestion thread.
    Result<void> start();

    /// Stop all threads and ingest what is still queued. Idempotent.
    void stop();

    /**
     * @brief Producer side for @p index outside the probe thread (tests, replay).
     * @warning Only valid while the scheduler is stopped; each ring has one producer.
     */
    bool offer(std::size_t index, const HealthSample& sample);

    /// Consumer side: move every queued sample into the aggregator. @return samples ingested.
    std::size_t drain_once();

    /// Samples rejected by full rings, summed over all probes.
    [[nodiscard]] std::uint64_t dropped() const noexcept;
    [[nodiscard]] std::size_t probe_count() const noexcept { return slots_.size(); }
    [[nodiscard]] bool running() const noexcept { return running_.load(std::memory_order_acquire); }

private:
    struct Slot {
        std::unique_ptr<RegionProbe>  probe;
        mem::SpscQueue<HealthSample>  ring;
        std::thread                   thread;
    };

    void probe_loop(Slot& slot);
    void ingest_loop();
    bool wait_for(std::uint32_t ms);

private:
    SchedulerConfig   cfg_;
    HealthAggregator& aggregator_;
    Clock             clock_;

    std::vector<std::unique_ptr<Slot>> slots_;
    std::thread ingest_;

    std::atomic<bool>          running_{false};
    std::mutex                 stop_mu_;
    std::condition_variable    stop_cv_;
};

} // namespace drguard::health
