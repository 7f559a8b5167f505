#include "tradectl/engine/replay_driver.hpp"

#include "tradectl/time/time_utils.hpp"

#include <iostream>
#include <utility>
#include <vector>

namespace tradectl {

ReplayDriver::ReplayDriver(const ControlConfig& config,
                           double base_order_amount)
    : config_(config),
      base_order_amount_(base_order_amount > 0.0
                             ? base_order_amount
                             : config.safety_orders.safety_amount) {}

// -----------------------------------------------------------------------------
// processLine: parse one JSONL tick
// -----------------------------------------------------------------------------
bool ReplayDriver::processLine(const std::string& line) {
  if (line.find_first_not_of(" \t\r\n") == std::string::npos) {
    return false;
  }

  try {
    // parse() throws parse_error on malformed input; at() throws
    // out_of_range on a missing key and get<>() type_error on a wrong type.
    auto json = nlohmann::json::parse(line);
    std::int64_t timestamp_ms = json.at("timestamp_ms").get<std::int64_t>();
    std::string symbol = json.at("symbol").get<std::string>();
    double price = json.at("price").get<double>();
    return processTick(timestamp_ms, symbol, price);
  } catch (const nlohmann::json::exception& e) {
    ++ticks_skipped_;
    std::cerr << "[ReplayDriver] JSON parse error: " << e.what()
              << " | line: " << line << "\n";
    return false;
  }
}

bool ReplayDriver::processTick(std::int64_t timestamp_ms,
                               const std::string& symbol, double price) {
  if (price <= 0.0) {
    ++ticks_skipped_;
    std::cerr << "[ReplayDriver] Skipping non-positive price " << price
              << " at " << timestamp_ms << "\n";
    return false;
  }

  // --- 1. Clock and day rollover ------------------------------------------
  clock_.advance_time(timestamp_ms);

  if (!controller_) {
    controller_ = std::make_unique<PositionController>(symbol, config_, clock_);
    std::cout << "[ReplayDriver] Replaying " << symbol << " ("
              << domain::toString(controller_->direction()) << ")\n";
    if (config_.trailing_grid.enabled) {
      const double step = config_.safety_orders.price_deviation / 100.0;
      std::vector<double> levels;
      for (int k = kGridLevelsPerSide; k >= 1; --k) {
        levels.push_back(price * (1.0 - k * step));
      }
      for (int k = 1; k <= kGridLevelsPerSide; ++k) {
        levels.push_back(price * (1.0 + k * step));
      }
      controller_->attachGrid(price, std::move(levels));
    }
  } else if (symbol != controller_->symbol()) {
    ++ticks_skipped_;
    std::cerr << "[ReplayDriver] Skipping tick for " << symbol
              << "; replaying " << controller_->symbol() << "\n";
    return false;
  }

  ++ticks_processed_;

  const std::int64_t day = day_index(timestamp_ms);
  if (current_day_ >= 0 && day != current_day_) {
    controller_->resetDaily();
    std::cout << "[ReplayDriver] New day " << day
              << ": daily loss counters reset\n";
  }
  current_day_ = day;

  // --- 2. (Re-)entry ------------------------------------------------------
  if (!controller_->isActive()) {
    syncBalance();
    domain::Decision opened =
        controller_->open(price, base_order_amount_ / price, {});
    if (opened.allowed) {
      ++positions_opened_;
      cycle_booked_ = false;
      syncBalance();
    } else {
      ++rejections_;
    }
  }

  // --- 3. Tick and immediate execution ------------------------------------
  TickOutcome outcome = controller_->onTick(price);
  executeOutcome(outcome);

  // --- 4. Balance ---------------------------------------------------------
  bookClosedCycle();
  syncBalance();
  return true;
}

void ReplayDriver::executeOutcome(const TickOutcome& outcome) {
  if (outcome.ladder_decision && !outcome.ladder_decision->allowed) {
    ++rejections_;
  }

  for (const auto& order : outcome.safety_orders) {
    controller_->onSafetyOrderFilled(order.index, outcome.price);
    ++safety_orders_filled_;
  }

  if (outcome.trail) {
    ++trails_;
  }

  if (outcome.emergency_close) {
    controller_->close(outcome.price);
    ++emergency_closes_;
    return;
  }

  if (outcome.take_profit) {
    controller_->onPartialClose(outcome.take_profit->close_quantity,
                                outcome.take_profit->price);
    ++take_profits_;
  }
}

// Folds a just-finished cycle's P&L into completed_pnl_ exactly once.
void ReplayDriver::bookClosedCycle() {
  if (!cycle_booked_ && controller_->phase() == PositionPhase::Closed) {
    completed_pnl_ += controller_->realizedPnl();
    cycle_booked_ = true;
  }
}

void ReplayDriver::syncBalance() {
  if (controller_) {
    controller_->updateBalance(availableBalance());
  }
}

double ReplayDriver::totalRealizedPnl() const {
  double total = completed_pnl_;
  if (!cycle_booked_ && controller_) {
    total += controller_->realizedPnl();
  }
  return total;
}

double ReplayDriver::availableBalance() const {
  double balance = config_.initial_balance + totalRealizedPnl();
  if (controller_ && controller_->isActive()) {
    balance -= controller_->remainingQuantity() * controller_->averageEntry();
  }
  return balance;
}

nlohmann::json ReplayDriver::summary() const {
  nlohmann::json j;
  j["ticks_processed"] = ticks_processed_;
  j["ticks_skipped"] = ticks_skipped_;
  j["positions_opened"] = positions_opened_;
  j["safety_orders_filled"] = safety_orders_filled_;
  j["take_profits"] = take_profits_;
  j["emergency_closes"] = emergency_closes_;
  j["trails"] = trails_;
  j["rejections"] = rejections_;
  j["total_realized_pnl"] = totalRealizedPnl();
  j["available_balance"] = availableBalance();
  j["position"] = controller_ ? controller_->snapshot() : nlohmann::json(nullptr);
  return j;
}

}  // namespace tradectl
