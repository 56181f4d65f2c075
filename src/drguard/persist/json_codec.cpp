/**
 * @file json_codec.cpp
 */
#include "drguard/persist/json_codec.hpp"
#include "drguard/persist/state_store.hpp"

#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

namespace drguard {
namespace {

template <class E, class Parse>
E enum_from(const nlohmann::json& j, const char* key, Parse parse) {
    const auto s = j.at(key).get<std::string>();
    if (auto v = parse(s)) return *v;
    throw std::invalid_argument(std::string("invalid value '") + s + "' for '" + key + "'");
}

} // namespace

namespace cutover {

void to_json(nlohmann::json& j, const CutoverPlan& p) {
    nlohmann::json steps = nlohmann::json::array();
    for (StepKind k : p.steps) steps.push_back(std::string(to_string(k)));
    j = nlohmann::json{
        {"id", p.id},
        {"kind", std::string(to_string(p.kind))},
        {"from_mode", std::string(to_string(p.from_mode))},
        {"to_mode", std::string(to_string(p.to_mode))},
        {"source", p.source},
        {"target", p.target},
        {"created_at_ms", p.created_at_ms},
        {"steps", std::move(steps)},
    };
}

void from_json(const nlohmann::json& j, CutoverPlan& p) {
    j.at("id").get_to(p.id);
    p.kind      = enum_from<PlanKind>(j, "kind", plan_kind_from_string);
    p.from_mode = enum_from<OperatingMode>(j, "from_mode", operating_mode_from_string);
    p.to_mode   = enum_from<OperatingMode>(j, "to_mode", operating_mode_from_string);
    j.at("source").get_to(p.source);
    j.at("target").get_to(p.target);
    j.at("created_at_ms").get_to(p.created_at_ms);
    p.steps.clear();
    for (const auto& s : j.at("steps")) {
        auto k = step_kind_from_string(s.get<std::string>());
        if (!k) throw std::invalid_argument("invalid step kind '" + s.get<std::string>() + "'");
        p.steps.push_back(*k);
    }
}

void to_json(nlohmann::json& j, const StepProgress& s) {
    j = nlohmann::json{
        {"kind", std::string(to_string(s.kind))},
        {"state", std::string(to_string(s.state))},
        {"attempts", s.attempts},
        {"started_ms", s.started_ms},
        {"finished_ms", s.finished_ms},
        {"detail", s.detail},
    };
}

void from_json(const nlohmann::json& j, StepProgress& s) {
    s.kind  = enum_from<StepKind>(j, "kind", step_kind_from_string);
    s.state = enum_from<StepState>(j, "state", step_state_from_string);
    j.at("attempts").get_to(s.attempts);
    j.at("started_ms").get_to(s.started_ms);
    j.at("finished_ms").get_to(s.finished_ms);
    s.detail = j.value("detail", std::string{});
}

void to_json(nlohmann::json& j, const PlanProgress& p) {
    j = nlohmann::json{
        {"plan_id", p.plan_id},
        {"status", std::string(to_string(p.status))},
        {"last_successful_step", p.last_successful_step},
        {"committed", p.committed},
        {"source_writes_blocked", p.source_writes_blocked},
        {"steps", p.steps},
        {"error", p.error},
        {"finished_ms", p.finished_ms},
    };
}

void from_json(const nlohmann::json& j, PlanProgress& p) {
    j.at("plan_id").get_to(p.plan_id);
    p.status = enum_from<PlanStatus>(j, "status", plan_status_from_string);
    j.at("last_successful_step").get_to(p.last_successful_step);
    j.at("committed").get_to(p.committed);
    p.source_writes_blocked = j.value("source_writes_blocked", false);
    j.at("steps").get_to(p.steps);
    p.error = j.value("error", std::string{});
    p.finished_ms = j.value("finished_ms", TimestampMs{0});
}

} // namespace cutover

namespace persist {

void to_json(nlohmann::json& j, const PersistedState& s) {
    j = nlohmann::json{
        {"version", 1},
        {"mode", std::string(to_string(s.mode))},
        {"mode_since_ms", s.mode_since_ms},
        {"active_region", s.active_region},
        {"failback_confirmed", s.failback_confirmed},
        {"automation_halted", s.automation_halted},
        {"plan_seq", s.plan_seq},
    };
    j["plan"]     = s.plan ? nlohmann::json(*s.plan) : nlohmann::json(nullptr);
    j["progress"] = s.progress ? nlohmann::json(*s.progress) : nlohmann::json(nullptr);
}

void from_json(const nlohmann::json& j, PersistedState& s) {
    s.mode = enum_from<OperatingMode>(j, "mode", operating_mode_from_string);
    j.at("mode_since_ms").get_to(s.mode_since_ms);
    s.active_region      = j.value("active_region", kPrimaryRegion);
    s.failback_confirmed = j.value("failback_confirmed", false);
    s.automation_halted  = j.value("automation_halted", false);
    s.plan_seq           = j.value("plan_seq", std::uint64_t{0});
    s.plan.reset();
    s.progress.reset();
    if (j.contains("plan") && !j.at("plan").is_null()) s.plan = j.at("plan").get<cutover::CutoverPlan>();
    if (j.contains("progress") && !j.at("progress").is_null()) {
        s.progress = j.at("progress").get<cutover::PlanProgress>();
    }
}

} // namespace persist
} // namespace drguard
