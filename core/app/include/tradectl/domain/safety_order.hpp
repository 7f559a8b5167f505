#pragma once

#include "tradectl/domain/position_direction.hpp"

#include <cstdint>
#include <optional>
#include <vector>

namespace tradectl {
namespace domain {

// -----------------------------------------------------------------------------
// SafetyOrderStatus: safety order lifecycle
// -----------------------------------------------------------------------------
//
//   Pending ───> Triggered ───> Filled
//      │
//      └──────> Cancelled
//
// Terminal states: Filled, Cancelled. Triggered orders are never cancelled
// by the ladder; they are already with the execution collaborator.
// -----------------------------------------------------------------------------
enum class SafetyOrderStatus {
  Pending,    // Waiting for price to reach the trigger
  Triggered,  // Handed to execution, fill not yet reported
  Filled,     // Fill reported, terminal
  Cancelled,  // Position closed before the trigger, terminal
};

const char* toString(SafetyOrderStatus status);

// Legal transitions of the graph above. Self-transitions are not legal.
bool canTransition(SafetyOrderStatus current, SafetyOrderStatus next);

struct SafetyOrder {
  int index{0};                // 1-based position in the ladder
  double trigger_price{0.0};
  double amount{0.0};          // Quote currency committed
  double quantity{0.0};        // Base currency; 0 until triggered
  SafetyOrderStatus status{SafetyOrderStatus::Pending};
  std::optional<std::int64_t> triggered_at_ms;
  std::optional<std::int64_t> filled_at_ms;
  std::optional<double> filled_price;
};

// -----------------------------------------------------------------------------
// LadderConfig: safety-order ladder parameters
// -----------------------------------------------------------------------------
//
// Percent fields are plain percentages. safety_interval_min is the minimum
// number of minutes between two trigger batches.
// -----------------------------------------------------------------------------
struct LadderConfig {
  bool enabled{false};
  PositionDirection direction{PositionDirection::Long};
  double trigger_drawdown{5.0};          // % from entry to the first trigger
  double safety_amount{50.0};            // Quote amount of the first order
  double safety_amount_multiplier{1.5};  // Growth factor per order
  int max_safety_orders{5};
  double safety_interval_min{30.0};
  double price_deviation{3.0};           // % between consecutive triggers
};

struct LadderState {
  double entry_price{0.0};
  std::vector<SafetyOrder> orders;
  int triggered_count{0};
  double total_safety_invested{0.0};
  std::optional<std::int64_t> last_trigger_ms;
};

// Result of folding the filled safety orders into the base entry.
struct AverageEntry {
  double avg_entry_price{0.0};
  double total_quantity{0.0};
  double total_invested{0.0};
};

}  // namespace domain
}  // namespace tradectl
