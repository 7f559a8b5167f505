#include "tradectl/grid/trailing_grid_manager.hpp"

#include "tradectl/domain/config_error.hpp"

#include <cmath>
#include <iostream>
#include <utility>

namespace tradectl {

TrailingGridManager::TrailingGridManager(
    const domain::TrailingGridConfig& config, const ITimeProvider& clock)
    : config_(config), clock_(clock) {
  validate(config_);
}

void TrailingGridManager::validate(const domain::TrailingGridConfig& c) {
  if (c.trail_percent <= 0.0) {
    throw ConfigError("trailing_grid.trail_percent must be positive");
  }
  if (c.min_trail_distance < 0.0) {
    throw ConfigError("trailing_grid.min_trail_distance must not be negative");
  }
  if (c.max_trails < 0) {
    throw ConfigError("trailing_grid.max_trails must not be negative");
  }
}

void TrailingGridManager::updateConfig(
    const domain::TrailingGridConfig& config) {
  validate(config);
  config_ = config;
}

bool TrailingGridManager::shouldTrail(const domain::TrailingGridState& state,
                                      double current_price) const {
  if (!config_.enabled || state.trail_count >= config_.max_trails ||
      state.current_center <= 0.0) {
    return false;
  }

  const double distance_percent =
      std::abs(current_price - state.current_center) / state.current_center *
      100.0;
  return distance_percent > config_.trail_percent;
}

// -----------------------------------------------------------------------------
// executeTrail: half the distance, clamped up to min_trail_distance
// -----------------------------------------------------------------------------
domain::Transition<domain::TrailingGridState,
                   std::optional<domain::TrailResult>>
TrailingGridManager::executeTrail(const domain::TrailingGridState& state,
                                  double current_price) const {
  if (!shouldTrail(state, current_price)) {
    return domain::makeTransition(state,
                                  std::optional<domain::TrailResult>());
  }

  const double distance = current_price - state.current_center;
  const domain::TrailDirection direction =
      distance > 0.0 ? domain::TrailDirection::Up : domain::TrailDirection::Down;
  const double sign = distance > 0.0 ? 1.0 : -1.0;

  double shift = distance * 0.5;
  if (std::abs(shift) < config_.min_trail_distance) {
    shift = sign * config_.min_trail_distance;
  }

  domain::TrailingGridState next = state;
  for (double& level : next.levels) {
    level += shift;
  }

  const std::int64_t now = clock_.now_ms();
  domain::TrailShift record;
  record.from = state.current_center;
  record.to = state.current_center + shift;
  record.price = current_price;
  record.time_ms = now;
  next.trail_history.push_back(record);

  next.current_center = record.to;
  ++next.trail_count;
  next.last_trail_ms = now;

  std::cout << "[TrailingGridManager] Grid trailed "
            << domain::toString(direction) << " by " << shift << " ("
            << record.from << " -> " << record.to << ", trail "
            << next.trail_count << "/" << config_.max_trails << ")\n";

  domain::TrailResult result;
  result.new_levels = next.levels;
  result.shift = shift;
  result.direction = direction;
  result.keep_filled_levels = config_.keep_filled_levels;
  return domain::makeTransition(std::move(next),
                                std::optional<domain::TrailResult>(
                                    std::move(result)));
}

domain::TrailingGridState TrailingGridManager::reset(
    double center_price, std::vector<double> levels) const {
  domain::TrailingGridState state;
  state.original_center = center_price;
  state.current_center = center_price;
  state.levels = std::move(levels);
  return state;
}

}  // namespace tradectl
