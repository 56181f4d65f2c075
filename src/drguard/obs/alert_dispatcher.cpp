/**
 * @file alert_dispatcher.cpp
 * @brief Bounded alert queue with a single delivery thread.
 */
#include "drguard/obs/alert_dispatcher.hpp"
#include "drguard/obs/logging.hpp"

#include <exception>
#include <utility>

#include <spdlog/spdlog.h>

namespace drguard::obs {

AlertDispatcher::AlertDispatcher(std::shared_ptr<backend::AlertSink> sink, std::size_t capacity)
    : sink_(std::move(sink)), capacity_(capacity == 0 ? 1 : capacity) {}

AlertDispatcher::~AlertDispatcher() {
    stop();
}

void AlertDispatcher::start() {
    std::lock_guard<std::mutex> lk(mu_);
    if (running_) return;
    running_ = true;
    worker_ = std::thread(&AlertDispatcher::run, this);
}

void AlertDispatcher::stop() {
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (!running_) return;
        running_ = false;
    }
    cv_.notify_all();
    if (worker_.joinable()) worker_.join();
}

void AlertDispatcher::notify(Severity severity, std::string message) noexcept {
    Alert a{severity, std::move(message)};
    {
        std::unique_lock<std::mutex> lk(mu_);
        if (running_) {
            if (queue_.size() >= capacity_) {
                queue_.pop_front();
                dropped_.fetch_add(1, std::memory_order_relaxed);
                spdlog::warn("alert queue full ({}), dropped oldest alert", capacity_);
            }
            queue_.push_back(std::move(a));
            lk.unlock();
            cv_.notify_one();
            return;
        }
    }
    deliver(a);
}

void AlertDispatcher::run() {
    for (;;) {
        Alert a;
        {
            std::unique_lock<std::mutex> lk(mu_);
            cv_.wait(lk, [&]{ return !running_ || !queue_.empty(); });
            if (queue_.empty()) return; // stopped and drained
            a = std::move(queue_.front());
            queue_.pop_front();
        }
        deliver(a);
    }
}

void AlertDispatcher::deliver(const Alert& a) noexcept {
    if (!sink_) return;
    try {
        sink_->notify(a.severity, a.message);
    } catch (const std::exception& ex) {
        failed_.fetch_add(1, std::memory_order_relaxed);
        spdlog::warn("alert sink failed ({}): {} [{}]", ex.what(), a.message, to_string(a.severity));
    }
}

void LogAlertSink::notify(Severity severity, const std::string& message) {
    auto log = logger("alerts");
    switch (severity) {
        case Severity::Info:     log->info("{}", message); break;
        case Severity::Warning:  log->warn("{}", message); break;
        case Severity::Critical: log->critical("{}", message); break;
    }
}

} // namespace drguard::obs
