#pragma once
/**
 * @file json_codec.hpp
 * @brief nlohmann::json (de)serialization of plans, progress and persisted engine state.
 * @details from_json throws on malformed documents; storage adapters convert that
 *          into ErrorCode::Parse at their boundary.
 */

#include <nlohmann/json_fwd.hpp>

#include "drguard/cutover/cutover_plan.hpp"

namespace drguard::cutover {

void to_json(nlohmann::json& j, const CutoverPlan& p);
void from_json(const nlohmann::json& j, CutoverPlan& p);

void to_json(nlohmann::json& j, const StepProgress& s);
void from_json(const nlohmann::json& j, StepProgress& s);

void to_json(nlohmann::json& j, const PlanProgress& p);
void from_json(const nlohmann::json& j, PlanProgress& p);

} // namespace drguard::cutover
