#include "tradectl/ladder/safety_order_ladder.hpp"

#include "tradectl/domain/config_error.hpp"
#include "tradectl/time/time_utils.hpp"

#include <algorithm>
#include <cstddef>
#include <iostream>
#include <iterator>
#include <utility>

namespace tradectl {

SafetyOrderLadder::SafetyOrderLadder(const domain::LadderConfig& config,
                                     const ITimeProvider& clock)
    : config_(config), clock_(clock) {
  validate(config_);
}

void SafetyOrderLadder::updateConfig(const domain::LadderConfig& config) {
  validate(config);
  config_ = config;
  std::cout << "[SafetyOrderLadder] Config updated: "
            << config_.max_safety_orders << " orders, interval "
            << config_.safety_interval_min << " min\n";
}

// -----------------------------------------------------------------------------
// validate: every parameter that would make the ladder non-monotone or
// silently empty is rejected here rather than at the first tick
// -----------------------------------------------------------------------------
void SafetyOrderLadder::validate(const domain::LadderConfig& c) {
  if (c.safety_amount_multiplier <= 0.0) {
    throw ConfigError("safety_orders.safety_amount_multiplier must be positive");
  }
  if (c.safety_amount <= 0.0) {
    throw ConfigError("safety_orders.safety_amount must be positive");
  }
  if (c.safety_interval_min < 0.0) {
    throw ConfigError("safety_orders.safety_interval must not be negative");
  }
  if (c.trigger_drawdown < 0.0 || c.trigger_drawdown >= 100.0) {
    throw ConfigError("safety_orders.trigger_drawdown must be in [0, 100)");
  }
  if (c.price_deviation <= 0.0 || c.price_deviation >= 100.0) {
    throw ConfigError("safety_orders.price_deviation must be in (0, 100)");
  }
  if (c.max_safety_orders < 0) {
    throw ConfigError("safety_orders.max_safety_orders must not be negative");
  }
  if (c.enabled && c.max_safety_orders == 0) {
    throw ConfigError(
        "safety_orders.max_safety_orders must be positive when the ladder is "
        "enabled");
  }
}

// -----------------------------------------------------------------------------
// initialize: lay out the full ladder from the entry price
// -----------------------------------------------------------------------------
domain::LadderState SafetyOrderLadder::initialize(double entry_price) const {
  domain::LadderState state;
  state.entry_price = entry_price;

  if (!config_.enabled) {
    return state;
  }

  // +1 moves triggers down (long), -1 moves them up (short).
  const double sign =
      config_.direction == domain::PositionDirection::Long ? 1.0 : -1.0;

  double trigger = entry_price * (1.0 - sign * config_.trigger_drawdown / 100.0);
  double amount = config_.safety_amount;

  state.orders.reserve(static_cast<std::size_t>(config_.max_safety_orders));
  for (int i = 0; i < config_.max_safety_orders; ++i) {
    domain::SafetyOrder order;
    order.index = i + 1;
    order.trigger_price = trigger;
    order.amount = amount;
    state.orders.push_back(order);

    trigger = trigger * (1.0 - sign * config_.price_deviation / 100.0);
    amount = amount * config_.safety_amount_multiplier;
  }

  return state;
}

bool SafetyOrderLadder::reached(const domain::SafetyOrder& order,
                                double price) const {
  return config_.direction == domain::PositionDirection::Long
             ? price <= order.trigger_price
             : price >= order.trigger_price;
}

// -----------------------------------------------------------------------------
// checkTriggers: once-per-call interval gate, then fire every reached order
// -----------------------------------------------------------------------------
domain::Transition<domain::LadderState, std::vector<domain::SafetyOrder>>
SafetyOrderLadder::checkTriggers(const domain::LadderState& state,
                                 double current_price) const {
  std::vector<domain::SafetyOrder> fired;

  if (!config_.enabled || current_price <= 0.0) {
    return domain::makeTransition(state, fired);
  }

  const std::int64_t now = clock_.now_ms();

  // The interval is measured from the previous batch, not between orders of
  // this batch.
  if (state.last_trigger_ms &&
      minutes_between(*state.last_trigger_ms, now) <
          config_.safety_interval_min) {
    return domain::makeTransition(state, fired);
  }

  domain::LadderState next = state;
  for (auto& order : next.orders) {
    if (order.status != domain::SafetyOrderStatus::Pending ||
        !reached(order, current_price)) {
      continue;
    }

    order.status = domain::SafetyOrderStatus::Triggered;
    order.triggered_at_ms = now;
    order.quantity = order.amount / current_price;

    ++next.triggered_count;
    next.total_safety_invested += order.amount;
    fired.push_back(order);
  }

  if (!fired.empty()) {
    next.last_trigger_ms = now;
  }

  return domain::makeTransition(std::move(next), std::move(fired));
}

// -----------------------------------------------------------------------------
// commitTriggered: keep the approved prefix of a dry-run batch
// -----------------------------------------------------------------------------
domain::LadderState SafetyOrderLadder::commitTriggered(
    const domain::LadderState& state,
    const std::vector<domain::SafetyOrder>& batch, std::size_t count) {
  domain::LadderState next = state;
  count = std::min(count, batch.size());

  for (std::size_t i = 0; i < count; ++i) {
    const domain::SafetyOrder& fired = batch[i];
    auto it = std::find_if(
        next.orders.begin(), next.orders.end(),
        [&fired](const domain::SafetyOrder& o) { return o.index == fired.index; });
    if (it == next.orders.end() ||
        !domain::canTransition(it->status,
                               domain::SafetyOrderStatus::Triggered)) {
      std::cerr << "[SafetyOrderLadder] WARNING: cannot commit safety order "
                << fired.index << ". Ignoring.\n";
      continue;
    }

    *it = fired;
    ++next.triggered_count;
    next.total_safety_invested += fired.amount;
    next.last_trigger_ms = fired.triggered_at_ms;
  }

  return next;
}

// -----------------------------------------------------------------------------
// markFilled: Triggered → Filled only; everything else is a tolerated no-op
// -----------------------------------------------------------------------------
domain::LadderState SafetyOrderLadder::markFilled(
    const domain::LadderState& state, int index, double filled_price) const {
  auto it = std::find_if(
      state.orders.begin(), state.orders.end(),
      [index](const domain::SafetyOrder& o) { return o.index == index; });

  if (it == state.orders.end()) {
    std::cerr << "[SafetyOrderLadder] WARNING: fill for unknown safety order "
              << index << ". Ignoring.\n";
    return state;
  }
  if (!domain::canTransition(it->status, domain::SafetyOrderStatus::Filled) ||
      filled_price <= 0.0) {
    std::cerr << "[SafetyOrderLadder] WARNING: ignoring fill for safety order "
              << index << " in status " << domain::toString(it->status)
              << "\n";
    return state;
  }

  domain::LadderState next = state;
  domain::SafetyOrder& order =
      next.orders[static_cast<std::size_t>(it - state.orders.begin())];
  order.status = domain::SafetyOrderStatus::Filled;
  order.filled_at_ms = clock_.now_ms();
  order.filled_price = filled_price;
  order.quantity = order.amount / filled_price;
  return next;
}

domain::LadderState SafetyOrderLadder::cancelAll(
    const domain::LadderState& state) const {
  domain::LadderState next = state;
  for (auto& order : next.orders) {
    if (order.status == domain::SafetyOrderStatus::Pending) {
      order.status = domain::SafetyOrderStatus::Cancelled;
    }
  }
  return next;
}

// -----------------------------------------------------------------------------
// calculateAverageEntry: weighted mean of base fill and filled safety orders
// -----------------------------------------------------------------------------
domain::AverageEntry SafetyOrderLadder::calculateAverageEntry(
    const domain::LadderState& state, double base_entry_price,
    double base_quantity) {
  domain::AverageEntry result;
  result.avg_entry_price = base_entry_price;
  result.total_quantity = base_quantity;
  result.total_invested = base_entry_price * base_quantity;

  bool any_filled = false;
  for (const auto& order : state.orders) {
    if (order.status != domain::SafetyOrderStatus::Filled ||
        !order.filled_price || order.quantity <= 0.0) {
      continue;
    }
    result.total_invested += *order.filled_price * order.quantity;
    result.total_quantity += order.quantity;
    any_filled = true;
  }

  if (any_filled && result.total_quantity > 0.0) {
    result.avg_entry_price = result.total_invested / result.total_quantity;
  }
  return result;
}

std::vector<domain::SafetyOrder> SafetyOrderLadder::filledOrders(
    const domain::LadderState& state) {
  std::vector<domain::SafetyOrder> filled;
  std::copy_if(state.orders.begin(), state.orders.end(),
               std::back_inserter(filled), [](const domain::SafetyOrder& o) {
                 return o.status == domain::SafetyOrderStatus::Filled;
               });
  return filled;
}

int SafetyOrderLadder::filledCount(const domain::LadderState& state) {
  return static_cast<int>(std::count_if(
      state.orders.begin(), state.orders.end(),
      [](const domain::SafetyOrder& o) {
        return o.status == domain::SafetyOrderStatus::Filled;
      }));
}

}  // namespace tradectl
