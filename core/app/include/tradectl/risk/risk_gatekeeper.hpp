#pragma once

#include "tradectl/domain/decision.hpp"
#include "tradectl/domain/risk_config.hpp"
#include "tradectl/domain/risk_state.hpp"
#include "tradectl/domain/transition.hpp"
#include "tradectl/time/i_time_provider.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace tradectl {

// -----------------------------------------------------------------------------
// RiskGatekeeper
// -----------------------------------------------------------------------------
//
// @brief  Approves or rejects every proposed new commitment (a new position
//         or an additional averaging order) against exposure limits,
//         cooldowns and a time-boxed circuit breaker.
//
// @details
// The gatekeeper holds only its validated RiskConfig and a reference to the
// clock. The running picture lives in a domain::RiskState owned by the
// position; every operation takes the current record and returns the next
// one, so a rejected proposal never leaves partial changes behind.
//
// Rule order for canOpenAveragingOrder() (first violation wins):
//
//   1. circuit breaker active and unexpired     CircuitBreakerActive
//   2. ladder depth at max_dca_orders           MaxDepthReached
//   3. amount > max_position_size               OrderTooLarge
//   4. amount > max_position_percent of balance OrderPercentTooLarge
//   5. invested + amount > max_total_invested   AggregateCapExceeded
//   6. invested + amount > max_total_invested_percent of balance
//                                               AggregatePercentExceeded
//   7. amount > available balance               InsufficientBalance
//   8. inter-order cooldown not elapsed         CooldownActive
//   9. post-loss cooldown not elapsed           PostLossCooldownActive
//
// Circuit breaker:
//   Armed by recordPositionClosed() after a losing streak or a daily loss
//   breach, for exactly kCircuitBreakerDurationMs from the arming moment.
//   Re-arming an unexpired breaker does not extend it. Expiry is lazy: the
//   next canOpenAveragingOrder() call past the window clears the flag in the
//   returned state and goes on to evaluate the remaining rules.
//
// Thread model:
//   No internal mutable state; a single instance may evaluate any number of
//   independent positions. Each position's RiskState is single-owner.
// -----------------------------------------------------------------------------
class RiskGatekeeper {
 public:
  static constexpr std::int64_t kCircuitBreakerDurationMs = 60 * 60 * 1000;

  // Fraction of max_dca_orders at which approvals carry a depth warning.
  static constexpr double kDepthWarningRatio = 0.8;

  // -------------------------------------------------------------------------
  // Constructor
  // -------------------------------------------------------------------------
  // @param  config  Limits (copied). Validated here.
  // @param  clock   Time source for cooldowns and the breaker window. Must
  //                 outlive the gatekeeper.
  //
  // @throws ConfigError  On a negative cap or cooldown, a non-positive
  //                      position/depth limit, or a non-positive loss streak
  //                      threshold with the breaker enabled.
  // -------------------------------------------------------------------------
  RiskGatekeeper(const domain::RiskConfig& config, const ITimeProvider& clock);

  // -------------------------------------------------------------------------
  // initialState(available_balance)
  // -------------------------------------------------------------------------
  // @brief  Fresh state for a strategy instance with the given balance.
  // -------------------------------------------------------------------------
  domain::RiskState initialState(double available_balance) const;

  // -------------------------------------------------------------------------
  // canOpenAveragingOrder(state, amount, symbol, other_open_symbols)
  // -------------------------------------------------------------------------
  // @brief  Evaluates one proposed ladder order of `amount` quote currency.
  //
  // @return Transition whose state differs from the input only when an
  //         expired circuit breaker was cleared, and whose result is the
  //         decision. An approval at or above 80% of max_dca_orders carries
  //         an advisory warning.
  //
  // symbol and other_open_symbols are accepted for parity with
  // canOpenNewPosition(); the averaging rules are per position and do not
  // consult them.
  // -------------------------------------------------------------------------
  domain::Transition<domain::RiskState, domain::Decision> canOpenAveragingOrder(
      const domain::RiskState& state, double amount, const std::string& symbol,
      const std::vector<std::string>& other_open_symbols) const;

  // -------------------------------------------------------------------------
  // canOpenNewPosition(state, symbol, existing_symbols)
  // -------------------------------------------------------------------------
  // @brief  Adding to a symbol that is already open is never a "new
  //         position"; otherwise rejected once open_positions reaches
  //         max_open_positions.
  // -------------------------------------------------------------------------
  domain::Decision canOpenNewPosition(
      const domain::RiskState& state, const std::string& symbol,
      const std::vector<std::string>& existing_symbols) const;

  domain::RiskState recordPositionOpened(const domain::RiskState& state) const;

  // -------------------------------------------------------------------------
  // recordOrderOpened(state, amount)
  // -------------------------------------------------------------------------
  // @brief  Depth + 1, invested + amount, last-order time = now.
  // -------------------------------------------------------------------------
  domain::RiskState recordOrderOpened(const domain::RiskState& state,
                                      double amount) const;

  // -------------------------------------------------------------------------
  // recordPositionClosed(state, pnl, was_loss)
  // -------------------------------------------------------------------------
  // @brief  Books a closed position and arms the circuit breaker when the
  //         loss streak or the day's cumulative loss crosses its threshold.
  //
  // @details
  // Always: open_positions - 1 (never below 0), depth and invested reset,
  //         daily_pnl += pnl.
  // Loss:   daily_loss += |pnl|, consecutive_losses + 1, last-loss = now;
  //         arm if (breaker enabled and streak >= circuit_breaker_losses)
  //         or daily_loss >= max_daily_loss
  //         or daily_loss as % of balance >= max_daily_loss_percent.
  // Win:    consecutive_losses = 0.
  // -------------------------------------------------------------------------
  domain::RiskState recordPositionClosed(const domain::RiskState& state,
                                         double pnl, bool was_loss) const;

  // -------------------------------------------------------------------------
  // updateDrawdown(state, drawdown_percent)
  // -------------------------------------------------------------------------
  // @brief  Stores the position's unrealized drawdown and rejects with
  //         MaxDrawdownExceeded once it meets max_drawdown_percent. The
  //         caller treats the rejection as an emergency-close request;
  //         nothing is closed here.
  // -------------------------------------------------------------------------
  domain::Transition<domain::RiskState, domain::Decision> updateDrawdown(
      const domain::RiskState& state, double drawdown_percent) const;

  domain::RiskState updateBalance(const domain::RiskState& state,
                                  double available_balance) const;

  // Clears daily_pnl and daily_loss at the start of a trading day.
  domain::RiskState resetDaily(const domain::RiskState& state) const;

  // Fresh state keeping only the last known balance.
  domain::RiskState reset(const domain::RiskState& state) const;

  const domain::RiskConfig& config() const { return config_; }

  // Validates and swaps in new limits; they apply from the next check. On
  // ConfigError the current limits stay in force.
  void updateConfig(const domain::RiskConfig& config);

  // Throws ConfigError for the conditions listed on the constructor. Used by
  // the config loader to reject a file before any component is built.
  static void validate(const domain::RiskConfig& config);

 private:
  domain::RiskState armCircuitBreaker(domain::RiskState state,
                                      const std::string& cause) const;

  domain::RiskConfig config_;
  const ITimeProvider& clock_;
};

}  // namespace tradectl
