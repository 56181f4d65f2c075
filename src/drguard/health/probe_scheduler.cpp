/**
 * @file probe_scheduler.cpp
 */
#include "drguard/health/probe_scheduler.hpp"

#include <chrono>
#include <utility>

#include <spdlog/spdlog.h>

namespace drguard::health {

ProbeScheduler::ProbeScheduler(SchedulerConfig cfg, HealthAggregator& aggregator, Clock clock)
    : cfg_(cfg), aggregator_(aggregator), clock_(std::move(clock)) {
    if (!clock_) clock_ = &drguard::now_ms;
}

ProbeScheduler::~ProbeScheduler() { stop(); }

Result<std::size_t> ProbeScheduler::add_probe(std::unique_ptr<RegionProbe> probe) {
    if (!probe) return make_error(ErrorCode::InvalidArgument, "null probe");
    if (running()) return make_error(ErrorCode::InvalidArgument, "cannot add probes while running");

    auto ring = mem::SpscQueue<HealthSample>::with_capacity(cfg_.ring_capacity);
    if (!ring) {
        return make_error(ErrorCode::InvalidConfig,
                          "probe ring of capacity " + std::to_string(cfg_.ring_capacity) + " rejected (error " +
                          std::to_string(static_cast<int>(ring.error())) + ")");
    }
    auto slot = std::make_unique<Slot>();
    slot->probe = std::move(probe);
    slot->ring = std::move(*ring);
    slots_.push_back(std::move(slot));
    return slots_.size() - 1;
}

Result<void> ProbeScheduler::start() {
    if (slots_.empty()) return make_error(ErrorCode::InvalidConfig, "no probes registered");
    bool expected = false;
    if (!running_.compare_exchange_strong(expected, true, std::memory_order_acq_rel)) return {};

    for (auto& s : slots_) {
        Slot& slot = *s;
        slot.thread = std::thread([this, &slot] { probe_loop(slot); });
    }
    ingest_ = std::thread([this] { ingest_loop(); });
    spdlog::info("scheduler: {} probe(s) running every {} ms", slots_.size(), cfg_.interval_ms);
    return {};
}

void ProbeScheduler::stop() {
    {
        std::lock_guard lk(stop_mu_);
        if (!running_.exchange(false, std::memory_order_acq_rel)) return;
    }
    stop_cv_.notify_all();
    for (auto& s : slots_) {
        if (s->thread.joinable()) s->thread.join();
    }
    if (ingest_.joinable()) ingest_.join();
    drain_once();
    spdlog::info("scheduler: stopped ({} sample(s) dropped)", dropped());
}

bool ProbeScheduler::wait_for(std::uint32_t ms) {
    std::unique_lock lk(stop_mu_);
    return !stop_cv_.wait_for(lk, std::chrono::milliseconds(ms), [this] { return !running(); });
}

void ProbeScheduler::probe_loop(Slot& slot) {
    const auto& spec = slot.probe->spec();
    do {
        const auto started = clock_();
        HealthSample s = slot.probe->sample();
        if (!slot.ring.push(std::move(s))) {
            const auto n = slot.ring.dropped();
            if ((n & (n - 1)) == 0) { // 1, 2, 4, ...
                spdlog::warn("scheduler: ring full for probe {}/{}; {} sample(s) dropped so far",
                             spec.region, spec.id, n);
            }
        }
        const auto spent = clock_() - started;
        const std::uint32_t pause = spent >= cfg_.interval_ms ? 0 : cfg_.interval_ms - static_cast<std::uint32_t>(spent);
        if (!wait_for(pause)) break;
    } while (running());
}

void ProbeScheduler::ingest_loop() {
    while (running()) {
        const std::size_t n = drain_once();
        aggregator_.close_overdue_rounds(clock_());
        if (n == 0 && !wait_for(cfg_.idle_sleep_ms)) break;
    }
}

bool ProbeScheduler::offer(std::size_t index, const HealthSample& sample) {
    if (index >= slots_.size() || running()) return false;
    return slots_[index]->ring.push(sample);
}

std::size_t ProbeScheduler::drain_once() {
    std::size_t n = 0;
    for (auto& slot : slots_) {
        n += slot->ring.drain([this](HealthSample&& s) { aggregator_.ingest(s); });
    }
    return n;
}

std::uint64_t ProbeScheduler::dropped() const noexcept {
    std::uint64_t n = 0;
    for (const auto& slot : slots_) n += slot->ring.dropped();
    return n;
}

} // namespace drguard::health
