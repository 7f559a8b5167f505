#pragma once

#include "tradectl/domain/decision.hpp"
#include "tradectl/domain/level_take_profit.hpp"
#include "tradectl/domain/position_direction.hpp"
#include "tradectl/domain/risk_state.hpp"
#include "tradectl/domain/safety_order.hpp"
#include "tradectl/domain/trailing_grid.hpp"

#include <nlohmann/json.hpp>

#include <string>

namespace tradectl {
namespace domain {

// -----------------------------------------------------------------------------
// JSON conversions for the state records
// -----------------------------------------------------------------------------
//
// @brief  nlohmann::json ADL hooks so the external storage collaborator can
//         persist a position between ticks with `nlohmann::json j = state;`
//         and restore it with `j.get<LadderState>()`.
//
// @details
// Optional timestamps are written as null when unset. Enums are written with
// the same spellings as toString(); an unknown spelling on read throws
// std::invalid_argument, a missing or mistyped field throws
// nlohmann::json::exception. Field names match the struct members.
// -----------------------------------------------------------------------------

void to_json(nlohmann::json& j, const RiskState& s);
void from_json(const nlohmann::json& j, RiskState& s);

void to_json(nlohmann::json& j, const SafetyOrder& o);
void from_json(const nlohmann::json& j, SafetyOrder& o);

void to_json(nlohmann::json& j, const LadderState& s);
void from_json(const nlohmann::json& j, LadderState& s);

void to_json(nlohmann::json& j, const LevelTakeProfit& l);
void from_json(const nlohmann::json& j, LevelTakeProfit& l);

void to_json(nlohmann::json& j, const LevelTPState& s);
void from_json(const nlohmann::json& j, LevelTPState& s);

void to_json(nlohmann::json& j, const TrailShift& t);
void from_json(const nlohmann::json& j, TrailShift& t);

void to_json(nlohmann::json& j, const TrailingGridState& s);
void from_json(const nlohmann::json& j, TrailingGridState& s);

void to_json(nlohmann::json& j, const Decision& d);

SafetyOrderStatus parseSafetyOrderStatus(const std::string& text);
RejectReason parseRejectReason(const std::string& text);
PositionDirection parsePositionDirection(const std::string& text);

}  // namespace domain
}  // namespace tradectl
