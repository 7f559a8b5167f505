#pragma once

#include "tradectl/domain/trailing_grid.hpp"
#include "tradectl/domain/transition.hpp"
#include "tradectl/time/i_time_provider.hpp"

#include <optional>
#include <vector>

namespace tradectl {

// -----------------------------------------------------------------------------
// TrailingGridManager: moves a grid of resting levels after price
// -----------------------------------------------------------------------------
//
// @brief  Decides when a grid has drifted too far from price and computes
//         the uniform shift that re-centres it.
//
// @details
// A trail fires when |price - centre| / centre exceeds trail_percent. The
// shift is half the distance from the centre to price, but never less than
// min_trail_distance in magnitude; the same shift is added to every level
// and to the centre, so the spacing between levels is preserved exactly.
// At most max_trails shifts happen per grid; reset() starts a new grid.
//
// The manager returns the new levels; re-posting the resting orders at those
// prices is the execution collaborator's job.
// -----------------------------------------------------------------------------
class TrailingGridManager {
 public:
  // @throws ConfigError  On a non-positive trail_percent, negative
  //                      min_trail_distance or negative max_trails.
  TrailingGridManager(const domain::TrailingGridConfig& config,
                      const ITimeProvider& clock);

  bool shouldTrail(const domain::TrailingGridState& state,
                   double current_price) const;

  // -------------------------------------------------------------------------
  // executeTrail(state, current_price)
  // -------------------------------------------------------------------------
  // @return Transition with an empty result (and unchanged state) unless
  //         shouldTrail(); otherwise the shifted state and the new levels,
  //         the signed shift and its direction.
  // -------------------------------------------------------------------------
  domain::Transition<domain::TrailingGridState,
                     std::optional<domain::TrailResult>>
  executeTrail(const domain::TrailingGridState& state,
               double current_price) const;

  // Replaces centre, levels and history wholesale for a recreated grid.
  domain::TrailingGridState reset(double center_price,
                                  std::vector<double> levels) const;

  const domain::TrailingGridConfig& config() const { return config_; }

  // Validated swap; an existing grid keeps its centre, levels and trail
  // count, and the new max_trails is compared against that count.
  void updateConfig(const domain::TrailingGridConfig& config);

  static void validate(const domain::TrailingGridConfig& config);

 private:
  domain::TrailingGridConfig config_;
  const ITimeProvider& clock_;
};

}  // namespace tradectl
