#include "drguard/engine/status_report.hpp"
#include "drguard/persist/json_codec.hpp"

#include <string>

#include <nlohmann/json.hpp>

namespace drguard::engine {

nlohmann::json render_status(const EngineStatus& s,
                             const health::VerdictSnapshot& verdicts,
                             const std::vector<replication::LagSeriesReport>& lag,
                             const obs::Counters* counters) {
    nlohmann::json j;
    j["mode"] = std::string(to_string(s.mode));
    j["mode_since_ms"] = s.mode_since_ms;
    j["active_region"] = s.active_region;
    j["failback_proposed"] = s.failback_proposed;
    j["failback_confirmed"] = s.failback_confirmed;
    j["automation_halted"] = s.automation_halted;
    j["rto_escalated"] = s.rto_escalated;
    j["plan"] = s.plan ? nlohmann::json(*s.plan) : nlohmann::json(nullptr);
    j["progress"] = s.progress ? nlohmann::json(*s.progress) : nlohmann::json(nullptr);

    auto& manual = j["manual_reconciliation"] = nlohmann::json::array();
    for (const auto& w : s.unresolved_workflows) {
        manual.push_back({{"workflow_id", w.workflow_id},
                          {"region", w.region},
                          {"last_completed_step", w.last_completed_step},
                          {"idempotency_token", w.idempotency_token}});
    }

    auto& regions = j["regions"] = nlohmann::json::array();
    for (const auto& [id, v] : verdicts.verdicts) {
        regions.push_back({{"region", id},
                           {"status", std::string(to_string(v.status))},
                           {"consecutive_failures", v.consecutive_failures},
                           {"consecutive_successes", v.consecutive_successes},
                           {"last_transition_ms", v.last_transition_ms},
                           {"rounds_evaluated", v.rounds_evaluated}});
    }

    auto& lj = j["replication_lag"] = nlohmann::json::array();
    for (const auto& r : lag) {
        nlohmann::json row{{"store", r.store},
                           {"region", r.region},
                           {"state", std::string(to_string(r.reading.state))},
                           {"last_sample_ms", r.last_sample_ms}};
        row["lag_ms"] = r.reading.stale() ? nlohmann::json(nullptr) : nlohmann::json(r.reading.lag_ms);
        lj.push_back(std::move(row));
    }

    if (counters) {
        j["counters"] = {{"decisions", counters->decisions},
                         {"mode_transitions", counters->mode_transitions},
                         {"plans_started", counters->plans_started},
                         {"plans_succeeded", counters->plans_succeeded},
                         {"plans_failed", counters->plans_failed},
                         {"plans_cancelled", counters->plans_cancelled},
                         {"no_safe_target", counters->no_safe_target},
                         {"rto_escalations", counters->rto_escalations},
                         {"requests_rejected", counters->requests_rejected}};
    }
    return j;
}

} // namespace drguard::engine
