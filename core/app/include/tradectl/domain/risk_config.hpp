#pragma once

namespace tradectl {
namespace domain {

// -----------------------------------------------------------------------------
// RiskConfig: per-strategy exposure limits, cooldowns and breaker threshold
// -----------------------------------------------------------------------------
//
// @brief  Immutable collection of thresholds applied by the RiskGatekeeper.
//
// @details
// Amounts are in quote currency (e.g. USDT). Percent values are plain
// percentages (20 means 20%), measured against the available balance the
// caller last reported. Cooldowns are in minutes.
//
// Values are copied into the RiskGatekeeper at construction and validated
// there; a negative cap throws ConfigError instead of silently disabling
// the check. Every field may be overridden from the "risk" section of the
// JSON configuration.
// -----------------------------------------------------------------------------
struct RiskConfig {
  /// Open positions allowed at once across the strategy.
  int max_open_positions{5};

  /// Maximum ladder depth (orders committed to one position).
  int max_dca_orders{10};

  /// Per-order cap, absolute and as a percent of balance.
  double max_position_size{1000.0};
  double max_position_percent{20.0};

  /// Aggregate cap on money committed to the active ladder.
  double max_total_invested{5000.0};
  double max_total_invested_percent{50.0};

  /// Unrealized drawdown at which updateDrawdown() asks for an emergency close.
  double max_drawdown_percent{30.0};

  /// Realized daily loss that arms the circuit breaker.
  double max_daily_loss{500.0};
  double max_daily_loss_percent{10.0};

  double cooldown_between_orders_min{5.0};
  double cooldown_after_loss_min{30.0};

  /// Consecutive losing closes that arm the circuit breaker.
  bool circuit_breaker_enabled{true};
  int circuit_breaker_losses{5};
};

}  // namespace domain
}  // namespace tradectl
