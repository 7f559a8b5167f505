#include "tradectl/risk/risk_gatekeeper.hpp"

#include "tradectl/domain/config_error.hpp"
#include "tradectl/time/time_utils.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <limits>
#include <sstream>
#include <utility>

namespace tradectl {

namespace {

// Share of the available balance represented by `amount`, in percent. With
// no balance any positive amount is an unbounded share.
double percentOfBalance(double amount, double balance) {
  if (balance <= 0.0) {
    return amount > 0.0 ? std::numeric_limits<double>::infinity() : 0.0;
  }
  return (amount / balance) * 100.0;
}

std::string waitMessage(const char* what, double remaining_min) {
  std::ostringstream os;
  os << what << ". Wait " << static_cast<long long>(std::ceil(remaining_min))
     << " minutes";
  return os.str();
}

}  // namespace

// -----------------------------------------------------------------------------
// Constructor: copy and validate limits
// -----------------------------------------------------------------------------
RiskGatekeeper::RiskGatekeeper(const domain::RiskConfig& config,
                               const ITimeProvider& clock)
    : config_(config), clock_(clock) {
  validate(config_);
}

void RiskGatekeeper::updateConfig(const domain::RiskConfig& config) {
  validate(config);
  config_ = config;
  std::cout << "[RiskGatekeeper] Limits updated: max depth "
            << config_.max_dca_orders << ", max invested "
            << config_.max_total_invested << "\n";
}

// -----------------------------------------------------------------------------
// validate: fail fast on limits that would silently disable a check
// -----------------------------------------------------------------------------
void RiskGatekeeper::validate(const domain::RiskConfig& c) {
  if (c.max_open_positions <= 0) {
    throw ConfigError("risk.max_open_positions must be positive");
  }
  if (c.max_dca_orders <= 0) {
    throw ConfigError("risk.max_dca_orders must be positive");
  }
  if (c.max_position_size < 0.0 || c.max_position_percent < 0.0) {
    throw ConfigError("risk per-order caps must not be negative");
  }
  if (c.max_total_invested < 0.0 || c.max_total_invested_percent < 0.0) {
    throw ConfigError("risk aggregate caps must not be negative");
  }
  if (c.max_drawdown_percent < 0.0) {
    throw ConfigError("risk.max_drawdown_percent must not be negative");
  }
  if (c.max_daily_loss < 0.0 || c.max_daily_loss_percent < 0.0) {
    throw ConfigError("risk daily loss caps must not be negative");
  }
  if (c.cooldown_between_orders_min < 0.0 || c.cooldown_after_loss_min < 0.0) {
    throw ConfigError("risk cooldowns must not be negative");
  }
  if (c.circuit_breaker_enabled && c.circuit_breaker_losses <= 0) {
    throw ConfigError(
        "risk.circuit_breaker_losses must be positive when the breaker is "
        "enabled");
  }
}

domain::RiskState RiskGatekeeper::initialState(double available_balance) const {
  domain::RiskState state;
  state.available_balance = available_balance;
  return state;
}

// -----------------------------------------------------------------------------
// canOpenAveragingOrder: fixed-priority rule chain, first violation wins
// -----------------------------------------------------------------------------
domain::Transition<domain::RiskState, domain::Decision>
RiskGatekeeper::canOpenAveragingOrder(
    const domain::RiskState& state, double amount,
    const std::string& /*symbol*/,
    const std::vector<std::string>& /*other_open_symbols*/) const {
  using domain::Decision;
  using domain::RejectReason;

  const std::int64_t now = clock_.now_ms();
  domain::RiskState next = state;

  // --- 1. Circuit breaker (lazy expiry) -------------------------------------
  if (next.circuit_breaker_active) {
    if (next.circuit_breaker_until_ms && now < *next.circuit_breaker_until_ms) {
      std::ostringstream os;
      os << "Circuit breaker active until " << *next.circuit_breaker_until_ms
         << " ms";
      return domain::makeTransition(
          next, Decision::reject(RejectReason::CircuitBreakerActive, os.str()));
    }
    next.circuit_breaker_active = false;
    next.circuit_breaker_until_ms.reset();
    std::cout << "[RiskGatekeeper] Circuit breaker expired at " << now
              << " ms\n";
  }

  // --- 2. Ladder depth ------------------------------------------------------
  if (next.current_dca_orders >= config_.max_dca_orders) {
    std::ostringstream os;
    os << "Maximum DCA orders reached (" << config_.max_dca_orders << ")";
    return domain::makeTransition(
        next, Decision::reject(RejectReason::MaxDepthReached, os.str()));
  }

  // --- 3-4. Per-order caps --------------------------------------------------
  if (amount > config_.max_position_size) {
    std::ostringstream os;
    os << "Order amount exceeds max position size ("
       << config_.max_position_size << ")";
    return domain::makeTransition(
        next, Decision::reject(RejectReason::OrderTooLarge, os.str()));
  }

  if (percentOfBalance(amount, next.available_balance) >
      config_.max_position_percent) {
    std::ostringstream os;
    os << "Order amount exceeds max position percent ("
       << config_.max_position_percent << "%)";
    return domain::makeTransition(
        next, Decision::reject(RejectReason::OrderPercentTooLarge, os.str()));
  }

  // --- 5-6. Aggregate caps --------------------------------------------------
  const double new_total = next.total_invested + amount;
  if (new_total > config_.max_total_invested) {
    std::ostringstream os;
    os << "Total invested would exceed limit (" << config_.max_total_invested
       << ")";
    return domain::makeTransition(
        next, Decision::reject(RejectReason::AggregateCapExceeded, os.str()));
  }

  if (percentOfBalance(new_total, next.available_balance) >
      config_.max_total_invested_percent) {
    std::ostringstream os;
    os << "Total invested would exceed " << config_.max_total_invested_percent
       << "% of balance";
    return domain::makeTransition(
        next,
        Decision::reject(RejectReason::AggregatePercentExceeded, os.str()));
  }

  // --- 7. Balance -----------------------------------------------------------
  if (amount > next.available_balance) {
    return domain::makeTransition(
        next, Decision::reject(RejectReason::InsufficientBalance,
                               "Insufficient balance"));
  }

  // --- 8-9. Cooldowns -------------------------------------------------------
  if (next.last_order_ms) {
    const double since = minutes_between(*next.last_order_ms, now);
    if (since < config_.cooldown_between_orders_min) {
      return domain::makeTransition(
          next, Decision::reject(
                    RejectReason::CooldownActive,
                    waitMessage("Cooldown active",
                                config_.cooldown_between_orders_min - since)));
    }
  }

  if (next.last_loss_ms && next.consecutive_losses > 0) {
    const double since = minutes_between(*next.last_loss_ms, now);
    if (since < config_.cooldown_after_loss_min) {
      return domain::makeTransition(
          next, Decision::reject(
                    RejectReason::PostLossCooldownActive,
                    waitMessage("Post-loss cooldown active",
                                config_.cooldown_after_loss_min - since)));
    }
  }

  // --- Approved; advisory when close to the depth limit ---------------------
  if (next.current_dca_orders >= config_.max_dca_orders * kDepthWarningRatio) {
    std::ostringstream os;
    os << "Approaching max DCA orders (" << next.current_dca_orders << "/"
       << config_.max_dca_orders << ")";
    return domain::makeTransition(next, Decision::allowWithWarning(os.str()));
  }

  return domain::makeTransition(next, Decision::allow());
}

// -----------------------------------------------------------------------------
// canOpenNewPosition: existing symbols are always allowed to add
// -----------------------------------------------------------------------------
domain::Decision RiskGatekeeper::canOpenNewPosition(
    const domain::RiskState& state, const std::string& symbol,
    const std::vector<std::string>& existing_symbols) const {
  if (std::find(existing_symbols.begin(), existing_symbols.end(), symbol) !=
      existing_symbols.end()) {
    return domain::Decision::allow();
  }

  if (state.open_positions >= config_.max_open_positions) {
    std::ostringstream os;
    os << "Maximum open positions reached (" << config_.max_open_positions
       << ")";
    return domain::Decision::reject(
        domain::RejectReason::MaxOpenPositionsReached, os.str());
  }

  return domain::Decision::allow();
}

domain::RiskState RiskGatekeeper::recordPositionOpened(
    const domain::RiskState& state) const {
  domain::RiskState next = state;
  ++next.open_positions;
  return next;
}

domain::RiskState RiskGatekeeper::recordOrderOpened(
    const domain::RiskState& state, double amount) const {
  domain::RiskState next = state;
  ++next.current_dca_orders;
  next.total_invested += amount;
  next.last_order_ms = clock_.now_ms();
  return next;
}

// -----------------------------------------------------------------------------
// recordPositionClosed: book the close, then decide whether to arm
// -----------------------------------------------------------------------------
domain::RiskState RiskGatekeeper::recordPositionClosed(
    const domain::RiskState& state, double pnl, bool was_loss) const {
  domain::RiskState next = state;
  next.open_positions = std::max(0, next.open_positions - 1);
  next.current_dca_orders = 0;
  next.total_invested = 0.0;
  next.daily_pnl += pnl;

  if (!was_loss) {
    next.consecutive_losses = 0;
    return next;
  }

  next.daily_loss += std::abs(pnl);
  ++next.consecutive_losses;
  next.last_loss_ms = clock_.now_ms();

  if (config_.circuit_breaker_enabled &&
      next.consecutive_losses >= config_.circuit_breaker_losses) {
    next = armCircuitBreaker(std::move(next), "consecutive losses");
  }
  if (next.daily_loss >= config_.max_daily_loss) {
    next = armCircuitBreaker(std::move(next), "daily loss");
  }
  if (percentOfBalance(next.daily_loss, next.available_balance) >=
      config_.max_daily_loss_percent) {
    next = armCircuitBreaker(std::move(next), "daily loss percent");
  }

  return next;
}

// -----------------------------------------------------------------------------
// armCircuitBreaker: one-hour window; an unexpired window is not extended
// -----------------------------------------------------------------------------
domain::RiskState RiskGatekeeper::armCircuitBreaker(
    domain::RiskState state, const std::string& cause) const {
  const std::int64_t now = clock_.now_ms();
  if (state.circuit_breaker_active && state.circuit_breaker_until_ms &&
      now < *state.circuit_breaker_until_ms) {
    return state;
  }

  state.circuit_breaker_active = true;
  state.circuit_breaker_until_ms = now + kCircuitBreakerDurationMs;
  std::cerr << "[RiskGatekeeper] Circuit breaker armed (" << cause
            << ") until " << *state.circuit_breaker_until_ms << " ms\n";
  return state;
}

domain::Transition<domain::RiskState, domain::Decision>
RiskGatekeeper::updateDrawdown(const domain::RiskState& state,
                               double drawdown_percent) const {
  domain::RiskState next = state;
  next.current_drawdown = drawdown_percent;

  if (drawdown_percent >= config_.max_drawdown_percent) {
    std::ostringstream os;
    os << "Max drawdown reached (" << drawdown_percent
       << "% >= " << config_.max_drawdown_percent << "%)";
    return domain::makeTransition(
        next, domain::Decision::reject(domain::RejectReason::MaxDrawdownExceeded,
                                       os.str()));
  }

  return domain::makeTransition(next, domain::Decision::allow());
}

domain::RiskState RiskGatekeeper::updateBalance(const domain::RiskState& state,
                                                double available_balance) const {
  domain::RiskState next = state;
  next.available_balance = available_balance;
  return next;
}

domain::RiskState RiskGatekeeper::resetDaily(
    const domain::RiskState& state) const {
  domain::RiskState next = state;
  next.daily_pnl = 0.0;
  next.daily_loss = 0.0;
  return next;
}

domain::RiskState RiskGatekeeper::reset(const domain::RiskState& state) const {
  return initialState(state.available_balance);
}

}  // namespace tradectl
