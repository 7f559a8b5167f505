#pragma once

#include <cstdint>
#include <optional>

namespace tradectl {
namespace domain {

// -----------------------------------------------------------------------------
// RiskState: running exposure picture evaluated by the RiskGatekeeper
// -----------------------------------------------------------------------------
//
// @details
// Plain value record. The gatekeeper takes it by const reference and
// returns the next record; it is never mutated in place.
//
// Circuit breaker:
//   Once circuit_breaker_until_ms is set it is authoritative until the
//   clock passes it. No timer clears the flag; the next gatekeeper call
//   that sees an expired window returns a state with the flag cleared.
// -----------------------------------------------------------------------------
struct RiskState {
  int open_positions{0};
  int current_dca_orders{0};     // Ladder depth of the active position
  double total_invested{0.0};    // Quote committed to the active ladder
  double current_drawdown{0.0};  // Last value passed to updateDrawdown()
  double daily_pnl{0.0};
  double daily_loss{0.0};        // Sum of |pnl| over today's losing closes
  int consecutive_losses{0};
  double available_balance{10000.0};

  std::optional<std::int64_t> last_order_ms;
  std::optional<std::int64_t> last_loss_ms;

  bool circuit_breaker_active{false};
  std::optional<std::int64_t> circuit_breaker_until_ms;
};

}  // namespace domain
}  // namespace tradectl
