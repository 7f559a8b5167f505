#pragma once

#include <cstdint>
#include <optional>
#include <vector>

namespace tradectl {
namespace domain {

struct TrailingGridConfig {
  bool enabled{false};
  double trail_percent{5.0};         // Centre distance (%) that starts a trail
  double min_trail_distance{100.0};  // Smallest shift, in price units
  // Passed through on every TrailResult: whether the order collaborator
  // keeps grid orders that already filled when it re-posts the levels.
  bool keep_filled_levels{true};
  int max_trails{10};
};

enum class TrailDirection {
  Up,
  Down,
};

const char* toString(TrailDirection direction);

struct TrailShift {
  double from{0.0};
  double to{0.0};
  double price{0.0};  // Price that caused the shift
  std::int64_t time_ms{0};
};

struct TrailingGridState {
  double original_center{0.0};
  double current_center{0.0};
  int trail_count{0};
  std::optional<std::int64_t> last_trail_ms;
  std::vector<TrailShift> trail_history;
  std::vector<double> levels;
};

struct TrailResult {
  std::vector<double> new_levels;
  double shift{0.0};
  TrailDirection direction{TrailDirection::Up};
  bool keep_filled_levels{true};
};

}  // namespace domain
}  // namespace tradectl
