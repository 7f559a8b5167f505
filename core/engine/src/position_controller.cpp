#include "tradectl/engine/position_controller.hpp"

#include "tradectl/domain/config_error.hpp"
#include "tradectl/serialization/state_json.hpp"

#include <algorithm>
#include <iostream>
#include <utility>

namespace tradectl {

namespace {

// Remaining quantity below this is treated as fully closed.
constexpr double kQuantityEpsilon = 1e-9;

}  // namespace

const char* toString(PositionPhase phase) {
  switch (phase) {
    case PositionPhase::Idle:
      return "IDLE";
    case PositionPhase::Open:
      return "OPEN";
    case PositionPhase::Averaging:
      return "AVERAGING";
    case PositionPhase::PartiallyClosed:
      return "PARTIALLY_CLOSED";
    case PositionPhase::Closed:
      return "CLOSED";
  }
  return "UNKNOWN";
}

void to_json(nlohmann::json& j, const TickOutcome& outcome) {
  j = nlohmann::json{
      {"price", outcome.price},
      {"drawdown", outcome.drawdown},
      {"emergency_close", outcome.emergency_close},
      {"safety_orders", outcome.safety_orders},
      {"trailing_enabled", outcome.trailing_enabled},
  };
  j["ladder_decision"] = outcome.ladder_decision
                             ? nlohmann::json(*outcome.ladder_decision)
                             : nlohmann::json(nullptr);
  if (outcome.take_profit) {
    j["take_profit"] = {
        {"level", outcome.take_profit->level},
        {"close_quantity", outcome.take_profit->close_quantity},
        {"price", outcome.take_profit->price},
    };
  } else {
    j["take_profit"] = nullptr;
  }
  if (outcome.trail) {
    j["trail"] = {
        {"new_levels", outcome.trail->new_levels},
        {"shift", outcome.trail->shift},
        {"direction", domain::toString(outcome.trail->direction)},
        {"keep_filled_levels", outcome.trail->keep_filled_levels},
    };
  } else {
    j["trail"] = nullptr;
  }
}

// -----------------------------------------------------------------------------
// Constructor: build (and thereby validate) the four components
// -----------------------------------------------------------------------------
PositionController::PositionController(std::string symbol,
                                       const ControlConfig& config,
                                       const ITimeProvider& clock)
    : symbol_(std::move(symbol)),
      direction_(config.safety_orders.direction),
      gatekeeper_(config.risk, clock),
      ladder_manager_(config.safety_orders, clock),
      tp_manager_(config.take_profit_levels),
      grid_manager_(config.trailing_grid, clock),
      risk_(gatekeeper_.initialState(config.initial_balance)) {}

bool PositionController::isActive() const {
  return phase_ == PositionPhase::Open || phase_ == PositionPhase::Averaging ||
         phase_ == PositionPhase::PartiallyClosed;
}

double PositionController::remainingQuantity() const {
  return std::max(0.0, bought_quantity_ - closed_quantity_);
}

// -----------------------------------------------------------------------------
// open: position gate, then base order gate, then lay out the ladder
// -----------------------------------------------------------------------------
domain::Decision PositionController::open(
    double entry_price, double quantity,
    const std::vector<std::string>& other_open_symbols) {
  if (isActive()) {
    std::cerr << "[PositionController] " << symbol_
              << " already open; ignoring open()\n";
    return domain::Decision::allowWithWarning("Position already open");
  }

  domain::Decision position_check =
      gatekeeper_.canOpenNewPosition(risk_, symbol_, other_open_symbols);
  if (!position_check.allowed) {
    std::cerr << "[PositionController] " << symbol_ << " open rejected: "
              << position_check.message << "\n";
    return position_check;
  }

  const double amount = entry_price * quantity;
  auto order_check = gatekeeper_.canOpenAveragingOrder(risk_, amount, symbol_,
                                                       other_open_symbols);
  risk_ = order_check.state;
  if (!order_check.result.allowed) {
    std::cerr << "[PositionController] " << symbol_ << " open rejected: "
              << order_check.result.message << "\n";
    return order_check.result;
  }

  risk_ = gatekeeper_.recordPositionOpened(risk_);
  risk_ = gatekeeper_.recordOrderOpened(risk_, amount);

  ladder_ = ladder_manager_.initialize(entry_price);
  tp_ = tp_manager_.updateAvgEntryPrice(tp_manager_.reset(), entry_price);

  base_entry_price_ = entry_price;
  base_quantity_ = quantity;
  avg_entry_price_ = entry_price;
  bought_quantity_ = quantity;
  closed_quantity_ = 0.0;
  realized_pnl_ = 0.0;
  phase_ = PositionPhase::Open;

  std::cout << "[PositionController] " << symbol_ << " opened "
            << domain::toString(direction_) << " qty=" << quantity
            << " @ " << entry_price << " with " << ladder_.orders.size()
            << " safety orders\n";
  return order_check.result;
}

// -----------------------------------------------------------------------------
// onTick: drawdown → ladder → take-profit → grid
// -----------------------------------------------------------------------------
TickOutcome PositionController::onTick(double price) {
  TickOutcome outcome;
  outcome.price = price;

  if (isActive()) {
    // --- 1. Drawdown ------------------------------------------------------
    auto drawdown =
        gatekeeper_.updateDrawdown(risk_, unrealizedDrawdownPercent(price));
    risk_ = drawdown.state;
    outcome.drawdown = drawdown.result;
    outcome.emergency_close = !drawdown.result.allowed;
    if (outcome.emergency_close) {
      std::cerr << "[PositionController] " << symbol_
                << " EMERGENCY CLOSE requested: " << drawdown.result.message
                << "\n";
    }

    // --- 2. Safety orders (dry run, then gate order by order) ------------
    auto triggers = ladder_manager_.checkTriggers(ladder_, price);
    if (!triggers.result.empty() && !outcome.emergency_close) {
      // Each order is checked against the depth and exposure left by the
      // orders approved before it. The first rejection ends the batch.
      for (const auto& order : triggers.result) {
        auto check = gatekeeper_.canOpenAveragingOrder(risk_, order.amount,
                                                       symbol_, {});
        risk_ = check.state;
        outcome.ladder_decision = check.result;

        if (!check.result.allowed) {
          std::cerr << "[PositionController] " << symbol_ << " safety order "
                    << order.index << " rejected ("
                    << domain::toString(*check.result.reason)
                    << "): " << check.result.message << "\n";
          break;
        }
        if (check.result.warning) {
          std::cerr << "[PositionController] WARNING: "
                    << *check.result.warning << "\n";
        }

        risk_ = gatekeeper_.recordOrderOpened(risk_, order.amount);
        outcome.safety_orders.push_back(order);
        std::cout << "[PositionController] " << symbol_ << " safety order "
                  << order.index << " triggered at " << price << " (amount "
                  << order.amount << ")\n";
      }

      ladder_ = SafetyOrderLadder::commitTriggered(
          ladder_, triggers.result, outcome.safety_orders.size());
    }

    // --- 3. Take-profit against the current average ---------------------
    auto tp = tp_manager_.checkTP(tp_, price, direction_);
    tp_ = tp.state;
    if (tp.result.hit && tp.result.level) {
      TakeProfitOrder order;
      order.level = *tp.result.level;
      order.close_quantity = LevelTPManager::calculateCloseQuantity(
          order.level, remainingQuantity());
      order.price = price;
      outcome.take_profit = order;
    }
    outcome.trailing_enabled = tp_manager_.shouldEnableTrailing(tp_);
  }

  // --- 4. Grid trailing ---------------------------------------------------
  if (grid_attached_) {
    auto trail = grid_manager_.executeTrail(grid_, price);
    grid_ = trail.state;
    outcome.trail = trail.result;
  }

  return outcome;
}

// -----------------------------------------------------------------------------
// onSafetyOrderFilled: refresh average entry and DCA level
// -----------------------------------------------------------------------------
void PositionController::onSafetyOrderFilled(int index, double fill_price) {
  if (!isActive()) {
    std::cerr << "[PositionController] " << symbol_
              << " WARNING: safety fill with no active position. Ignoring.\n";
    return;
  }

  const int filled_before = SafetyOrderLadder::filledCount(ladder_);
  ladder_ = ladder_manager_.markFilled(ladder_, index, fill_price);
  const int filled_after = SafetyOrderLadder::filledCount(ladder_);
  if (filled_after == filled_before) {
    return;
  }

  if (closed_quantity_ <= 0.0) {
    // Nothing sold yet: the ladder's weighted mean over every fill is exact.
    domain::AverageEntry avg = SafetyOrderLadder::calculateAverageEntry(
        ladder_, base_entry_price_, base_quantity_);
    avg_entry_price_ = avg.avg_entry_price;
    bought_quantity_ = avg.total_quantity;
  } else {
    // After partial closes only the remaining quantity carries the old
    // average: fold the new fill into it.
    auto it = std::find_if(
        ladder_.orders.begin(), ladder_.orders.end(),
        [index](const domain::SafetyOrder& o) { return o.index == index; });
    const double fill_qty = it->quantity;
    const double remaining = remainingQuantity();
    avg_entry_price_ = (remaining * avg_entry_price_ + fill_qty * fill_price) /
                       (remaining + fill_qty);
    bought_quantity_ += fill_qty;
  }

  tp_ = tp_manager_.updateLevel(tp_, filled_after);
  tp_ = tp_manager_.updateAvgEntryPrice(tp_, avg_entry_price_);
  if (phase_ == PositionPhase::Open) {
    phase_ = PositionPhase::Averaging;
  }

  std::cout << "[PositionController] " << symbol_ << " safety order " << index
            << " filled @ " << fill_price << "; level=" << filled_after
            << " avg=" << avg_entry_price_ << " qty=" << remainingQuantity()
            << "\n";
}

double PositionController::onPartialClose(double quantity, double price) {
  if (!isActive() || quantity <= 0.0) {
    return 0.0;
  }

  const double sign = direction_ == domain::PositionDirection::Long ? 1.0 : -1.0;
  const double qty = std::min(quantity, remainingQuantity());
  const double pnl = qty * (price - avg_entry_price_) * sign;

  realized_pnl_ += pnl;
  closed_quantity_ += qty;
  phase_ = PositionPhase::PartiallyClosed;

  std::cout << "[PositionController] " << symbol_ << " partial close qty="
            << qty << " @ " << price << " pnl=" << pnl << "\n";

  if (remainingQuantity() <= kQuantityEpsilon) {
    finishClose();
  }
  return pnl;
}

double PositionController::close(double price) {
  if (!isActive()) {
    return 0.0;
  }

  const double sign = direction_ == domain::PositionDirection::Long ? 1.0 : -1.0;
  const double qty = remainingQuantity();
  realized_pnl_ += qty * (price - avg_entry_price_) * sign;
  closed_quantity_ += qty;

  finishClose();
  return realized_pnl_;
}

// -----------------------------------------------------------------------------
// finishClose: book with the gatekeeper, cancel what is still pending
// -----------------------------------------------------------------------------
void PositionController::finishClose() {
  const bool was_loss = realized_pnl_ < 0.0;
  risk_ = gatekeeper_.recordPositionClosed(risk_, realized_pnl_, was_loss);
  ladder_ = ladder_manager_.cancelAll(ladder_);
  tp_ = tp_manager_.reset();
  phase_ = PositionPhase::Closed;

  std::cout << "[PositionController] " << symbol_ << " closed, realized pnl="
            << realized_pnl_ << (was_loss ? " (loss)" : "") << "\n";
}

void PositionController::attachGrid(double center_price,
                                    std::vector<double> levels) {
  grid_ = grid_manager_.reset(center_price, std::move(levels));
  grid_attached_ = true;
}

// -----------------------------------------------------------------------------
// updateConfig: validate everything first, then swap all four sections
// -----------------------------------------------------------------------------
void PositionController::updateConfig(const ControlConfig& config) {
  ControlConfig next = config;
  validateConfig(next);
  if (next.safety_orders.direction != direction_) {
    throw ConfigError(
        "safety_orders.direction cannot change on an existing controller");
  }

  gatekeeper_.updateConfig(next.risk);
  ladder_manager_.updateConfig(next.safety_orders);
  tp_manager_.updateConfig(std::move(next.take_profit_levels));
  grid_manager_.updateConfig(next.trailing_grid);

  std::cout << "[PositionController] " << symbol_ << " config updated\n";
}

void PositionController::updateBalance(double available_balance) {
  risk_ = gatekeeper_.updateBalance(risk_, available_balance);
}

void PositionController::resetDaily() {
  risk_ = gatekeeper_.resetDaily(risk_);
}

// Adverse move from the average entry, in percent; 0 while in profit.
double PositionController::unrealizedDrawdownPercent(double price) const {
  if (avg_entry_price_ <= 0.0) {
    return 0.0;
  }
  const double adverse = direction_ == domain::PositionDirection::Long
                             ? avg_entry_price_ - price
                             : price - avg_entry_price_;
  return std::max(0.0, adverse / avg_entry_price_ * 100.0);
}

nlohmann::json PositionController::snapshot() const {
  nlohmann::json j;
  j["symbol"] = symbol_;
  j["phase"] = toString(phase_);
  j["direction"] = domain::toString(direction_);
  j["base_entry_price"] = base_entry_price_;
  j["base_quantity"] = base_quantity_;
  j["avg_entry_price"] = avg_entry_price_;
  j["remaining_quantity"] = remainingQuantity();
  j["realized_pnl"] = realized_pnl_;
  j["risk"] = risk_;
  j["safety_orders"] = ladder_;
  j["take_profit"] = tp_;
  j["trailing_grid"] = grid_attached_ ? nlohmann::json(grid_)
                                      : nlohmann::json(nullptr);
  return j;
}

}  // namespace tradectl
