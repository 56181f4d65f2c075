#pragma once
/**
 * @file alert_sink.hpp
 * @brief Alerting/notification sink. Fire-and-forget, best effort.
 */

#include <string>

#include "drguard/core/types.hpp"

namespace drguard::backend {

    class AlertSink {
    public:
        virtual ~AlertSink() = default;

        /// Deliver one alert. May throw; callers isolate the decision engine from failures.
        virtual void notify(Severity severity, const std::string& message) = 0;
    };

} // namespace drguard::backend
