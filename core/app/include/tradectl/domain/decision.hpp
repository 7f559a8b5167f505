#pragma once

#include <optional>
#include <string>
#include <utility>

namespace tradectl {
namespace domain {

// -----------------------------------------------------------------------------
// RejectReason: machine-readable cause of a gatekeeper rejection
// -----------------------------------------------------------------------------
//
// @details
// The gatekeeper evaluates its rules in a fixed priority order and reports
// only the first one violated, so exactly one reason accompanies each
// rejection. The enumerator order below mirrors that priority for the
// averaging-order checks.
// -----------------------------------------------------------------------------
enum class RejectReason {
  CircuitBreakerActive,
  MaxDepthReached,
  OrderTooLarge,
  OrderPercentTooLarge,
  AggregateCapExceeded,
  AggregatePercentExceeded,
  InsufficientBalance,
  CooldownActive,
  PostLossCooldownActive,
  MaxDrawdownExceeded,
  MaxOpenPositionsReached,
};

const char* toString(RejectReason reason);

// -----------------------------------------------------------------------------
// Decision: structured approve/reject answer
// -----------------------------------------------------------------------------
//
// @brief  Returned by every gatekeeping operation. Never thrown.
//
// Invariants:
//   allowed == true   → reason is empty; warning may be set.
//   allowed == false  → reason is set; message describes the limit hit.
// -----------------------------------------------------------------------------
struct Decision {
  bool allowed{true};
  std::optional<RejectReason> reason;  // Set iff !allowed
  std::string message;                 // Human-readable detail for logs
  std::optional<std::string> warning;  // Advisory note on an approval

  static Decision allow() { return Decision{}; }

  static Decision allowWithWarning(std::string warning_text) {
    Decision d;
    d.warning = std::move(warning_text);
    return d;
  }

  static Decision reject(RejectReason why, std::string detail) {
    Decision d;
    d.allowed = false;
    d.reason = why;
    d.message = std::move(detail);
    return d;
  }
};

}  // namespace domain
}  // namespace tradectl
