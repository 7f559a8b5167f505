#include "tradectl/domain/decision.hpp"
#include "tradectl/domain/position_direction.hpp"
#include "tradectl/domain/safety_order.hpp"
#include "tradectl/domain/trailing_grid.hpp"

namespace tradectl {
namespace domain {

// -----------------------------------------------------------------------------
// toString(RejectReason): stable identifiers used in logs and in serialized
// state. state_json.cpp parses the same spellings back.
// -----------------------------------------------------------------------------
const char* toString(RejectReason reason) {
  switch (reason) {
    case RejectReason::CircuitBreakerActive:
      return "CircuitBreakerActive";
    case RejectReason::MaxDepthReached:
      return "MaxDepthReached";
    case RejectReason::OrderTooLarge:
      return "OrderTooLarge";
    case RejectReason::OrderPercentTooLarge:
      return "OrderPercentTooLarge";
    case RejectReason::AggregateCapExceeded:
      return "AggregateCapExceeded";
    case RejectReason::AggregatePercentExceeded:
      return "AggregatePercentExceeded";
    case RejectReason::InsufficientBalance:
      return "InsufficientBalance";
    case RejectReason::CooldownActive:
      return "CooldownActive";
    case RejectReason::PostLossCooldownActive:
      return "PostLossCooldownActive";
    case RejectReason::MaxDrawdownExceeded:
      return "MaxDrawdownExceeded";
    case RejectReason::MaxOpenPositionsReached:
      return "MaxOpenPositionsReached";
  }
  return "Unknown";
}

const char* toString(PositionDirection direction) {
  return direction == PositionDirection::Long ? "LONG" : "SHORT";
}

const char* toString(TrailDirection direction) {
  return direction == TrailDirection::Up ? "UP" : "DOWN";
}

const char* toString(SafetyOrderStatus status) {
  switch (status) {
    case SafetyOrderStatus::Pending:
      return "PENDING";
    case SafetyOrderStatus::Triggered:
      return "TRIGGERED";
    case SafetyOrderStatus::Filled:
      return "FILLED";
    case SafetyOrderStatus::Cancelled:
      return "CANCELLED";
  }
  return "UNKNOWN";
}

// -----------------------------------------------------------------------------
// canTransition: validate safety order state machine transitions
// -----------------------------------------------------------------------------
bool canTransition(SafetyOrderStatus current, SafetyOrderStatus next) {
  using S = SafetyOrderStatus;

  switch (current) {
    case S::Pending:
      return next == S::Triggered ||
             next == S::Cancelled;

    case S::Triggered:
      return next == S::Filled;

    case S::Filled:
    case S::Cancelled:
      return false;
  }

  return false;
}

}  // namespace domain
}  // namespace tradectl
