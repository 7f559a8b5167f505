#pragma once

#include "tradectl/domain/level_take_profit.hpp"
#include "tradectl/domain/position_direction.hpp"
#include "tradectl/domain/transition.hpp"

#include <optional>
#include <vector>

namespace tradectl {

// -----------------------------------------------------------------------------
// LevelTPManager: per-DCA-level partial take-profit
// -----------------------------------------------------------------------------
//
// @brief  Maps the position's current DCA level to a profit target and a
//         share of the position to close, and fires each level at most once.
//
// @details
// The applicable row is the highest configured dca_level that does not
// exceed the current level. Once a row has fired it stays in
// LevelTPState::hit_levels for the life of the position, so a price that
// keeps rising after a fire does not fire the same row again; only a
// deeper ladder (a higher applicable row) can produce the next fire.
//
// The table is sorted by dca_level at construction and validated:
// negative levels or targets, close percentages outside (0, 100] and
// duplicate levels throw ConfigError.
// -----------------------------------------------------------------------------
class LevelTPManager {
 public:
  explicit LevelTPManager(std::vector<domain::LevelTakeProfit> levels);

  // Default table: levels 0..5 with rising targets; trailing from level 3.
  static std::vector<domain::LevelTakeProfit> defaultLevels();

  domain::LevelTPState updateLevel(const domain::LevelTPState& state,
                                   int level) const;

  domain::LevelTPState updateAvgEntryPrice(const domain::LevelTPState& state,
                                           double avg_entry_price) const;

  // -------------------------------------------------------------------------
  // checkTP(state, current_price, direction)
  // -------------------------------------------------------------------------
  // @brief  Fires the applicable row iff it has not fired yet and the
  //         signed profit over the average entry meets its tp_percent.
  //
  // @details
  //   long:  profit% = (price - avg) / avg * 100
  //   short: profit% = (avg - price) / avg * 100
  // The returned state always records current_price as last_price, and
  // adds the row's level to hit_levels when it fires. With no average
  // entry yet (avg <= 0) nothing fires.
  // -------------------------------------------------------------------------
  domain::Transition<domain::LevelTPState, domain::TPCheckResult> checkTP(
      const domain::LevelTPState& state, double current_price,
      domain::PositionDirection direction) const;

  // total_quantity * close_percent / 100. The caller passes the quantity
  // remaining after earlier partial closes.
  static double calculateCloseQuantity(const domain::LevelTakeProfit& level,
                                       double total_quantity);

  bool shouldEnableTrailing(const domain::LevelTPState& state) const;

  // -------------------------------------------------------------------------
  // getNextTPTarget(state)
  // -------------------------------------------------------------------------
  // @brief  Target of the applicable row while it is unfired. After it has
  //         fired, the first row above it that is still within the current
  //         level; rows beyond the current level are not looked ahead to.
  // -------------------------------------------------------------------------
  std::optional<domain::TPTarget> getNextTPTarget(
      const domain::LevelTPState& state) const;

  domain::LevelTPState reset() const { return domain::LevelTPState{}; }

  const std::vector<domain::LevelTakeProfit>& levels() const { return levels_; }

  // Replaces the table after validating it. Fired levels recorded in a
  // LevelTPState are kept; on ConfigError the current table is kept.
  void updateConfig(std::vector<domain::LevelTakeProfit> levels);

  // Sorts `levels` by dca_level and throws ConfigError on an invalid row.
  static void validate(std::vector<domain::LevelTakeProfit>& levels);

 private:
  const domain::LevelTakeProfit* findApplicable(int current_level) const;

  std::vector<domain::LevelTakeProfit> levels_;
};

}  // namespace tradectl
