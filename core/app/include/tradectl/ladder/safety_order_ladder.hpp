#pragma once

#include "tradectl/domain/safety_order.hpp"
#include "tradectl/domain/transition.hpp"
#include "tradectl/time/i_time_provider.hpp"

#include <cstddef>
#include <vector>

namespace tradectl {

// -----------------------------------------------------------------------------
// SafetyOrderLadder
// -----------------------------------------------------------------------------
//
// @brief  Builds and advances the ladder of drawdown-triggered averaging
//         ("safety") orders for one position.
//
// @details
// initialize() lays out the whole ladder up front from the entry price, so
// trigger prices and amounts are fixed for the life of the position:
//
//   trigger[1] = entry      * (1 - trigger_drawdown / 100)
//   trigger[i] = trigger[i-1] * (1 - price_deviation / 100)
//   amount[1]  = safety_amount
//   amount[i]  = amount[i-1]  * safety_amount_multiplier
//
// (Short ladders use 1 + ... and trigger on rising prices.)
//
// checkTriggers() then moves Pending orders to Triggered as price reaches
// them. The safety interval is measured ONCE per call, against the
// last_trigger_ms recorded by the previous batch: when it has elapsed,
// every order whose trigger has been reached fires in the same call. A
// sharp move through several levels therefore yields a burst of orders,
// and the next batch waits a full interval from this one.
//
// Each safety order follows the lifecycle in domain::SafetyOrderStatus.
// Out-of-order notifications (a fill for an order that is not Triggered,
// an unknown index) are ignored so duplicate reports from the execution
// collaborator are harmless.
//
// Ownership:
//   Holds the validated config and a clock reference; the LadderState is
//   owned by the position and passed in on every call.
// -----------------------------------------------------------------------------
class SafetyOrderLadder {
 public:
  // -------------------------------------------------------------------------
  // Constructor
  // -------------------------------------------------------------------------
  // @throws ConfigError  On a non-positive multiplier or amount, negative
  //                      interval, percentages outside [0, 100), or an
  //                      enabled ladder with max_safety_orders <= 0.
  // -------------------------------------------------------------------------
  SafetyOrderLadder(const domain::LadderConfig& config,
                    const ITimeProvider& clock);

  // -------------------------------------------------------------------------
  // initialize(entry_price)
  // -------------------------------------------------------------------------
  // @brief  Discards any previous ladder and lays out max_safety_orders
  //         Pending orders from entry_price. A disabled ladder yields an
  //         empty order list.
  // -------------------------------------------------------------------------
  domain::LadderState initialize(double entry_price) const;

  // -------------------------------------------------------------------------
  // checkTriggers(state, current_price)
  // -------------------------------------------------------------------------
  // @brief  Fires every Pending order reached by current_price, subject to
  //         the once-per-call safety interval.
  //
  // @return Transition carrying the next state and the orders that moved to
  //         Triggered in this call (quantity = amount / current_price), in
  //         ladder order. Empty when nothing fired.
  // -------------------------------------------------------------------------
  domain::Transition<domain::LadderState, std::vector<domain::SafetyOrder>>
  checkTriggers(const domain::LadderState& state, double current_price) const;

  // -------------------------------------------------------------------------
  // commitTriggered(state, batch, count)
  // -------------------------------------------------------------------------
  // @brief  Applies the first `count` orders of a checkTriggers() batch to
  //         `state`, the ladder the batch was computed from.
  //
  // @details
  // Lets the caller gate a batch order by order and keep only the approved
  // prefix. Orders past `count` stay Pending in the returned state and are
  // offered again by a later checkTriggers(). last_trigger_ms moves only
  // when at least one order is kept; count == 0 returns `state` unchanged.
  // -------------------------------------------------------------------------
  static domain::LadderState commitTriggered(
      const domain::LadderState& state,
      const std::vector<domain::SafetyOrder>& batch, std::size_t count);

  // -------------------------------------------------------------------------
  // markFilled(state, index, filled_price)
  // -------------------------------------------------------------------------
  // @brief  Triggered → Filled with quantity recomputed at the fill price.
  //         Any other status, or an unknown index, returns state unchanged.
  // -------------------------------------------------------------------------
  domain::LadderState markFilled(const domain::LadderState& state, int index,
                                 double filled_price) const;

  // Pending → Cancelled for every remaining order. Triggered and Filled
  // orders are left as they are.
  domain::LadderState cancelAll(const domain::LadderState& state) const;

  // -------------------------------------------------------------------------
  // calculateAverageEntry(state, base_entry_price, base_quantity)
  // -------------------------------------------------------------------------
  // @brief  Quantity-weighted average over the base fill and every Filled
  //         safety order. With no filled safety orders the base fill is
  //         returned unchanged.
  // -------------------------------------------------------------------------
  static domain::AverageEntry calculateAverageEntry(
      const domain::LadderState& state, double base_entry_price,
      double base_quantity);

  static std::vector<domain::SafetyOrder> filledOrders(
      const domain::LadderState& state);

  // Number of Filled safety orders, i.e. the position's DCA level.
  static int filledCount(const domain::LadderState& state);

  domain::LadderState reset() const { return domain::LadderState{}; }

  const domain::LadderConfig& config() const { return config_; }

  // -------------------------------------------------------------------------
  // updateConfig(config)
  // -------------------------------------------------------------------------
  // @brief  Validates and swaps in a new config. On ConfigError the current
  //         config is kept.
  //
  // @details
  // Orders already laid out keep their triggers and amounts; the new sizing
  // applies from the next initialize(). enabled and safety_interval_min take
  // effect on the next checkTriggers().
  // -------------------------------------------------------------------------
  void updateConfig(const domain::LadderConfig& config);

  static void validate(const domain::LadderConfig& config);

 private:
  bool reached(const domain::SafetyOrder& order, double price) const;

  domain::LadderConfig config_;
  const ITimeProvider& clock_;
};

}  // namespace tradectl
