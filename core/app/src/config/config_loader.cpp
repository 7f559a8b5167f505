#include "tradectl/config/config_loader.hpp"

#include "tradectl/domain/config_error.hpp"
#include "tradectl/grid/trailing_grid_manager.hpp"
#include "tradectl/ladder/safety_order_ladder.hpp"
#include "tradectl/risk/risk_gatekeeper.hpp"
#include "tradectl/takeprofit/level_tp_manager.hpp"

#include <fstream>
#include <sstream>

namespace tradectl {

namespace {

// Reads `key` into `out` when present; otherwise leaves the default alone.
template <typename T>
void readOptional(const nlohmann::json& section, const char* key, T& out) {
  auto it = section.find(key);
  if (it != section.end() && !it->is_null()) {
    out = it->get<T>();
  }
}

domain::PositionDirection parseDirection(const std::string& text) {
  if (text == "LONG" || text == "long") {
    return domain::PositionDirection::Long;
  }
  if (text == "SHORT" || text == "short") {
    return domain::PositionDirection::Short;
  }
  throw ConfigError("unknown direction '" + text + "' (expected LONG or SHORT)");
}

void readRisk(const nlohmann::json& s, domain::RiskConfig& c) {
  readOptional(s, "max_open_positions", c.max_open_positions);
  readOptional(s, "max_dca_orders", c.max_dca_orders);
  readOptional(s, "max_position_size", c.max_position_size);
  readOptional(s, "max_position_percent", c.max_position_percent);
  readOptional(s, "max_total_invested", c.max_total_invested);
  readOptional(s, "max_total_invested_percent", c.max_total_invested_percent);
  readOptional(s, "max_drawdown_percent", c.max_drawdown_percent);
  readOptional(s, "max_daily_loss", c.max_daily_loss);
  readOptional(s, "max_daily_loss_percent", c.max_daily_loss_percent);
  readOptional(s, "cooldown_between_orders_min", c.cooldown_between_orders_min);
  readOptional(s, "cooldown_after_loss_min", c.cooldown_after_loss_min);
  readOptional(s, "circuit_breaker_enabled", c.circuit_breaker_enabled);
  readOptional(s, "circuit_breaker_losses", c.circuit_breaker_losses);
}

void readLadder(const nlohmann::json& s, domain::LadderConfig& c) {
  readOptional(s, "enabled", c.enabled);
  std::string direction;
  readOptional(s, "direction", direction);
  if (!direction.empty()) {
    c.direction = parseDirection(direction);
  }
  readOptional(s, "trigger_drawdown", c.trigger_drawdown);
  readOptional(s, "safety_amount", c.safety_amount);
  readOptional(s, "safety_amount_multiplier", c.safety_amount_multiplier);
  readOptional(s, "max_safety_orders", c.max_safety_orders);
  readOptional(s, "safety_interval_min", c.safety_interval_min);
  readOptional(s, "price_deviation", c.price_deviation);
}

void readGrid(const nlohmann::json& s, domain::TrailingGridConfig& c) {
  readOptional(s, "enabled", c.enabled);
  readOptional(s, "trail_percent", c.trail_percent);
  readOptional(s, "min_trail_distance", c.min_trail_distance);
  readOptional(s, "keep_filled_levels", c.keep_filled_levels);
  readOptional(s, "max_trails", c.max_trails);
}

std::vector<domain::LevelTakeProfit> readLevels(const nlohmann::json& arr) {
  if (!arr.is_array()) {
    throw ConfigError("take_profit_levels must be an array");
  }
  std::vector<domain::LevelTakeProfit> levels;
  levels.reserve(arr.size());
  for (const auto& row : arr) {
    domain::LevelTakeProfit level;
    level.dca_level = row.at("dca_level").get<int>();
    level.tp_percent = row.at("tp_percent").get<double>();
    level.close_percent = row.at("close_percent").get<double>();
    readOptional(row, "trailing_after_hit", level.trailing_after_hit);
    levels.push_back(level);
  }
  return levels;
}

}  // namespace

// -----------------------------------------------------------------------------
// configFromJson: overlay the document on the defaults, then validate
// -----------------------------------------------------------------------------
ControlConfig configFromJson(const nlohmann::json& j) {
  if (!j.is_object()) {
    throw ConfigError("configuration root must be a JSON object");
  }

  ControlConfig config;
  config.take_profit_levels = LevelTPManager::defaultLevels();

  try {
    readOptional(j, "initial_balance", config.initial_balance);
    if (j.contains("risk")) {
      readRisk(j.at("risk"), config.risk);
    }
    if (j.contains("safety_orders")) {
      readLadder(j.at("safety_orders"), config.safety_orders);
    }
    if (j.contains("take_profit_levels")) {
      config.take_profit_levels = readLevels(j.at("take_profit_levels"));
    }
    if (j.contains("trailing_grid")) {
      readGrid(j.at("trailing_grid"), config.trailing_grid);
    }
  } catch (const nlohmann::json::exception& e) {
    // type_error / out_of_range from get<T>() and at().
    throw ConfigError(std::string("invalid configuration value: ") + e.what());
  }

  validateConfig(config);
  return config;
}

void validateConfig(ControlConfig& config) {
  if (config.initial_balance < 0.0) {
    throw ConfigError("initial_balance must not be negative");
  }
  RiskGatekeeper::validate(config.risk);
  SafetyOrderLadder::validate(config.safety_orders);
  LevelTPManager::validate(config.take_profit_levels);
  TrailingGridManager::validate(config.trailing_grid);
}

ControlConfig parseConfig(const std::string& json_text) {
  nlohmann::json j;
  try {
    j = nlohmann::json::parse(json_text);
  } catch (const nlohmann::json::parse_error& e) {
    throw ConfigError(std::string("malformed configuration JSON: ") + e.what());
  }
  return configFromJson(j);
}

ControlConfig loadConfigFile(const std::string& path) {
  std::ifstream in(path);
  if (!in) {
    throw ConfigError("cannot open configuration file: " + path);
  }
  std::ostringstream buffer;
  buffer << in.rdbuf();
  return parseConfig(buffer.str());
}

}  // namespace tradectl
