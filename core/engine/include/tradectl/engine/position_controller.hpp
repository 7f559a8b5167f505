#pragma once

#include "tradectl/config/config_loader.hpp"
#include "tradectl/domain/decision.hpp"
#include "tradectl/domain/level_take_profit.hpp"
#include "tradectl/domain/position_direction.hpp"
#include "tradectl/domain/risk_state.hpp"
#include "tradectl/domain/safety_order.hpp"
#include "tradectl/domain/trailing_grid.hpp"
#include "tradectl/grid/trailing_grid_manager.hpp"
#include "tradectl/ladder/safety_order_ladder.hpp"
#include "tradectl/risk/risk_gatekeeper.hpp"
#include "tradectl/takeprofit/level_tp_manager.hpp"
#include "tradectl/time/i_time_provider.hpp"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <vector>

namespace tradectl {

enum class PositionPhase {
  Idle,             // Nothing opened yet
  Open,             // Base order filled, no safety order filled
  Averaging,        // At least one safety order filled
  PartiallyClosed,  // At least one take-profit executed
  Closed,           // Fully closed; open() may start a new cycle
};

const char* toString(PositionPhase phase);

// Partial close the execution collaborator should submit.
struct TakeProfitOrder {
  domain::LevelTakeProfit level;
  double close_quantity{0.0};
  double price{0.0};
};

// -----------------------------------------------------------------------------
// TickOutcome: everything one tick asks the collaborators to do
// -----------------------------------------------------------------------------
struct TickOutcome {
  double price{0.0};

  // updateDrawdown() result. !allowed means "close this position now".
  domain::Decision drawdown;
  bool emergency_close{false};

  // Last gatekeeper answer for the triggered orders: the rejection that
  // ended the batch, or the approval of its last order. Empty when nothing
  // was proposed.
  std::optional<domain::Decision> ladder_decision;
  std::vector<domain::SafetyOrder> safety_orders;  // Approved, ladder order

  std::optional<TakeProfitOrder> take_profit;
  bool trailing_enabled{false};

  std::optional<domain::TrailResult> trail;  // Re-post grid at new_levels
};

void to_json(nlohmann::json& j, const TickOutcome& outcome);

// -----------------------------------------------------------------------------
// PositionController: one position's control loop
// -----------------------------------------------------------------------------
//
// @brief  Owns the four state records of a single position and advances
//         them in the fixed per-tick order.
//
// @details
// Tick order (onTick):
//
//   1. RiskGatekeeper::updateDrawdown: emergency-close advisory. While it
//      is raised no new order is committed.
//   2. SafetyOrderLadder::checkTriggers: dry run. The batch is gated in
//      ladder order, one canOpenAveragingOrder() per order with that order's
//      amount, each seeing the depth and invested total left by the orders
//      approved before it. The approved prefix is committed and recorded
//      with recordOrderOpened(); from the first rejection on, the orders
//      stay Pending and are offered again on a later tick.
//   3. LevelTPManager::checkTP: against the average entry that the last
//      onSafetyOrderFilled() computed.
//   4. TrailingGridManager::executeTrail: only when a grid is attached,
//      independent of the position phase.
//
// Fills and closes come back from the execution collaborator through
// onSafetyOrderFilled(), onPartialClose() and close(). Calls that do not fit
// the current phase (a tick on a closed position, a duplicate fill) are
// no-ops.
//
// Thread model:
//   Single-threaded. One controller per position; controllers share nothing
//   except the const clock.
//
// Ownership:
//   Holds a reference to the clock, which must outlive the controller.
// -----------------------------------------------------------------------------
class PositionController {
 public:
  // @throws ConfigError  If any section of `config` is invalid.
  PositionController(std::string symbol, const ControlConfig& config,
                     const ITimeProvider& clock);

  PositionController(const PositionController&) = delete;
  PositionController& operator=(const PositionController&) = delete;
  PositionController(PositionController&&) = delete;
  PositionController& operator=(PositionController&&) = delete;

  // -------------------------------------------------------------------------
  // open(entry_price, quantity, other_open_symbols)
  // -------------------------------------------------------------------------
  // @brief  Gates and books the base order of a new position.
  //
  // @details
  // canOpenNewPosition() then canOpenAveragingOrder(entry * quantity). The
  // base order counts toward ladder depth and money invested. On approval
  // the ladder is laid out from entry_price and take-profit state is reset.
  // Calling open() on an active position changes nothing and returns an
  // approval carrying a warning.
  // -------------------------------------------------------------------------
  domain::Decision open(double entry_price, double quantity,
                        const std::vector<std::string>& other_open_symbols);

  TickOutcome onTick(double price);

  // Forwards a safety-order fill and refreshes average entry and DCA level.
  void onSafetyOrderFilled(int index, double fill_price);

  // -------------------------------------------------------------------------
  // onPartialClose(quantity, price)
  // -------------------------------------------------------------------------
  // @brief  Books an executed partial close. Closing the remaining quantity
  //         closes the position.
  //
  // @return Realized P&L of this close.
  // -------------------------------------------------------------------------
  double onPartialClose(double quantity, double price);

  // Closes the remainder at `price`. Returns the position's total realized
  // P&L, or 0 when no position is active.
  double close(double price);

  void attachGrid(double center_price, std::vector<double> levels);

  // -------------------------------------------------------------------------
  // updateConfig(config)
  // -------------------------------------------------------------------------
  // @brief  Replaces the configuration of all four components.
  //
  // @details
  // Every section is validated before any component changes, so a
  // ConfigError leaves the previous configuration in force everywhere. The
  // position direction is fixed for the controller's lifetime, and
  // initial_balance is ignored; use updateBalance(). State records are kept:
  // an open ladder keeps the orders it was laid out with.
  //
  // @throws ConfigError  On any invalid section or a direction change.
  // -------------------------------------------------------------------------
  void updateConfig(const ControlConfig& config);

  void updateBalance(double available_balance);
  void resetDaily();

  const std::string& symbol() const { return symbol_; }
  PositionPhase phase() const { return phase_; }
  domain::PositionDirection direction() const { return direction_; }
  bool isActive() const;
  double averageEntry() const { return avg_entry_price_; }
  double remainingQuantity() const;
  double realizedPnl() const { return realized_pnl_; }

  const domain::RiskState& riskState() const { return risk_; }
  const domain::LadderState& ladderState() const { return ladder_; }
  const domain::LevelTPState& takeProfitState() const { return tp_; }
  const domain::TrailingGridState& gridState() const { return grid_; }

  // Full position snapshot for the storage collaborator.
  nlohmann::json snapshot() const;

 private:
  double unrealizedDrawdownPercent(double price) const;
  void finishClose();

  const std::string symbol_;
  const domain::PositionDirection direction_;

  RiskGatekeeper gatekeeper_;
  SafetyOrderLadder ladder_manager_;
  LevelTPManager tp_manager_;
  TrailingGridManager grid_manager_;

  domain::RiskState risk_;
  domain::LadderState ladder_;
  domain::LevelTPState tp_;
  domain::TrailingGridState grid_;
  bool grid_attached_{false};

  PositionPhase phase_{PositionPhase::Idle};
  double base_entry_price_{0.0};
  double base_quantity_{0.0};
  double avg_entry_price_{0.0};
  double bought_quantity_{0.0};  // Base + filled safety orders
  double closed_quantity_{0.0};
  double realized_pnl_{0.0};
};

}  // namespace tradectl
