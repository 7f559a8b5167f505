#pragma once

#include "tradectl/domain/level_take_profit.hpp"
#include "tradectl/domain/risk_config.hpp"
#include "tradectl/domain/safety_order.hpp"
#include "tradectl/domain/trailing_grid.hpp"

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

namespace tradectl {

// -----------------------------------------------------------------------------
// ControlConfig: every tunable of one strategy instance
// -----------------------------------------------------------------------------
//
// @details
// Mirrors the JSON document accepted by loadConfigFile():
//
//   {
//     "initial_balance": 10000,
//     "risk":               { "max_open_positions": 5, ... },
//     "safety_orders":      { "enabled": true, "trigger_drawdown": 5, ... },
//     "take_profit_levels": [ { "dca_level": 0, "tp_percent": 5,
//                               "close_percent": 20,
//                               "trailing_after_hit": false }, ... ],
//     "trailing_grid":      { "enabled": false, "trail_percent": 5, ... }
//   }
//
// Every section and every key is optional. A missing key keeps the default
// from the domain struct; a missing take_profit_levels array keeps
// LevelTPManager::defaultLevels().
// -----------------------------------------------------------------------------
struct ControlConfig {
  double initial_balance{10000.0};
  domain::RiskConfig risk;
  domain::LadderConfig safety_orders;
  std::vector<domain::LevelTakeProfit> take_profit_levels;
  domain::TrailingGridConfig trailing_grid;
};

// -----------------------------------------------------------------------------
// configFromJson(j)
// -----------------------------------------------------------------------------
// @brief  Builds and validates a ControlConfig from a parsed document.
//
// @throws ConfigError  On a wrongly typed value, an unknown direction, or
//                      any value the components' validate() rejects.
// -----------------------------------------------------------------------------
ControlConfig configFromJson(const nlohmann::json& j);

// Runs every component's validate() over `config` and sorts the take-profit
// table. Throws ConfigError on the first invalid section.
void validateConfig(ControlConfig& config);

// Parses JSON text, then configFromJson(). Malformed JSON → ConfigError.
ControlConfig parseConfig(const std::string& json_text);

// Reads and parses a file. An unreadable file → ConfigError.
ControlConfig loadConfigFile(const std::string& path);

}  // namespace tradectl
