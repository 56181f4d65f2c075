#pragma once
/**
 * @file status_report.hpp
 * @brief Operator status document: mode, plan progress, manual work, verdicts, lag.
 */

#include <vector>

#include <nlohmann/json_fwd.hpp>

#include "drguard/engine/failover_engine.hpp"
#include "drguard/health/health_aggregator.hpp"
#include "drguard/obs/observability.hpp"
#include "drguard/replication/lag_tracker.hpp"

namespace drguard::engine {

/// Render everything an operator needs to see; nothing is hidden behind retries.
nlohmann::json render_status(const EngineStatus& status,
                             const health::VerdictSnapshot& verdicts,
                             const std::vector<replication::LagSeriesReport>& lag,
                             const obs::Counters* counters = nullptr);

} // namespace drguard::engine
