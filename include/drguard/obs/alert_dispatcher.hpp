#pragma once
/**
 * @file alert_dispatcher.hpp
 * @brief Asynchronous, bounded delivery of alerts to an AlertSink.
 * @details notify() never blocks on the sink: alerts are queued and delivered on a
 *          dispatcher thread. When the queue is full the oldest alert is dropped and
 *          counted. Before start() (and after stop()) alerts are delivered inline.
 */

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include "drguard/backend/alert_sink.hpp"
#include "drguard/config/constants.hpp"
#include "drguard/core/types.hpp"

namespace drguard::obs {

class AlertDispatcher {
public:
    explicit AlertDispatcher(std::shared_ptr<backend::AlertSink> sink,
                             std::size_t capacity = drguard::config::constants::ALERT_QUEUE_CAPACITY);
    ~AlertDispatcher();

    AlertDispatcher(const AlertDispatcher&)            = delete;
    AlertDispatcher& operator=(const AlertDispatcher&) = delete;

    /// Spawn the delivery thread. Idempotent.
    void start();

    /// Deliver what is queued, then join the delivery thread. Idempotent.
    void stop();

    /// Queue one alert. Never throws, never waits for the sink.
    void notify(Severity severity, std::string message) noexcept;

    /// Alerts discarded because the queue was full.
    std::uint64_t dropped() const noexcept { return dropped_.load(std::memory_order_relaxed); }

    /// Alerts whose delivery raised an error in the sink.
    std::uint64_t failed() const noexcept { return failed_.load(std::memory_order_relaxed); }

private:
    struct Alert {
        Severity    severity{Severity::Info};
        std::string message;
    };

    void run();
    void deliver(const Alert& a) noexcept;

private:
    std::shared_ptr<backend::AlertSink> sink_;
    std::size_t capacity_;

    mutable std::mutex      mu_;
    std::condition_variable cv_;
    std::deque<Alert>       queue_;
    bool                    running_{false};
    std::thread             worker_;

    std::atomic<std::uint64_t> dropped_{0};
    std::atomic<std::uint64_t> failed_{0};
};

/** @class LogAlertSink
 *  @brief Sink that writes alerts to the "alerts" logger. Default for dry-run deployments.
 */
class LogAlertSink final : public backend::AlertSink {
public:
    void notify(Severity severity, const std::string& message) override;
};

} // namespace drguard::obs
