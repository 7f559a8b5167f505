#pragma once

#include "tradectl/config/config_loader.hpp"
#include "tradectl/engine/position_controller.hpp"
#include "tradectl/time/simulation_time_provider.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <memory>
#include <string>

namespace tradectl {

// -----------------------------------------------------------------------------
// ReplayDriver: drives one PositionController from recorded ticks
// -----------------------------------------------------------------------------
//
// @brief  Backtest harness behind tradectl_sim. Each tick line is a JSON
//         object {"timestamp_ms": <int>, "symbol": <string>, "price": <num>}.
//
// @details
// Per tick:
//   1. The simulation clock is advanced to timestamp_ms. A new UTC day
//      resets the daily loss counters.
//   2. With no active position, a base order of base_order_amount is
//      opened at the tick price (re-entry after a close is attempted on
//      every tick until the gatekeeper approves it).
//   3. PositionController::onTick() runs; every requested action is
//      executed immediately at the tick price: safety orders are filled,
//      a take-profit is closed for its quantity, an emergency close closes
//      the whole position.
//   4. The available balance handed to the gatekeeper is
//      initial_balance + realized P&L - cost basis of the open quantity.
//
// The first tick's symbol becomes the driver's symbol; ticks for any other
// symbol are skipped. With trailing_grid.enabled a grid of
// kGridLevelsPerSide levels each side of the first price, spaced by
// safety_orders.price_deviation percent, is attached and trailed.
//
// Malformed lines are logged to std::cerr and skipped.
// -----------------------------------------------------------------------------
class ReplayDriver {
 public:
  static constexpr int kGridLevelsPerSide = 3;

  // @param  config             Validated configuration (copied).
  // @param  base_order_amount  Quote amount of each base order. Values <= 0
  //                            fall back to safety_orders.safety_amount.
  explicit ReplayDriver(const ControlConfig& config,
                        double base_order_amount = 0.0);

  // Returns false when the line was skipped (malformed or foreign symbol).
  bool processLine(const std::string& line);

  // -------------------------------------------------------------------------
  // processTick(timestamp_ms, symbol, price)
  // -------------------------------------------------------------------------
  // @brief  Steps 1-4 above for one already-parsed tick.
  // -------------------------------------------------------------------------
  bool processTick(std::int64_t timestamp_ms, const std::string& symbol,
                   double price);

  // Counters plus the controller snapshot (null before the first tick).
  nlohmann::json summary() const;

  const PositionController* controller() const { return controller_.get(); }
  double availableBalance() const;
  double totalRealizedPnl() const;

 private:
  void executeOutcome(const TickOutcome& outcome);
  void bookClosedCycle();
  void syncBalance();

  const ControlConfig config_;
  const double base_order_amount_;
  SimulationTimeProvider clock_;
  std::unique_ptr<PositionController> controller_;

  std::int64_t current_day_{-1};
  double completed_pnl_{0.0};  // Realized P&L of finished cycles
  bool cycle_booked_{true};

  std::int64_t ticks_processed_{0};
  std::int64_t ticks_skipped_{0};
  std::int64_t positions_opened_{0};
  std::int64_t safety_orders_filled_{0};
  std::int64_t take_profits_{0};
  std::int64_t emergency_closes_{0};
  std::int64_t trails_{0};
  std::int64_t rejections_{0};
};

}  // namespace tradectl
