#pragma once

#include <optional>
#include <set>

namespace tradectl {
namespace domain {

// One row of the per-level take-profit table. Level 0 is the base entry,
// level N applies once N safety orders have filled.
struct LevelTakeProfit {
  int dca_level{0};
  double tp_percent{0.0};       // Profit % over the average entry
  double close_percent{0.0};    // % of the remaining position to close
  bool trailing_after_hit{false};
};

struct LevelTPState {
  std::set<int> hit_levels;     // Monotone: levels are only ever added
  double last_price{0.0};
  int current_level{0};
  double avg_entry_price{0.0};
};

struct TPCheckResult {
  bool hit{false};
  std::optional<LevelTakeProfit> level;  // Set iff hit
};

struct TPTarget {
  double tp_percent{0.0};
  double close_percent{0.0};
};

}  // namespace domain
}  // namespace tradectl
