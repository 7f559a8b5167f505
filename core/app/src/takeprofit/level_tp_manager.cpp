#include "tradectl/takeprofit/level_tp_manager.hpp"

#include "tradectl/domain/config_error.hpp"

#include <algorithm>
#include <cstddef>
#include <iostream>
#include <string>
#include <utility>

namespace tradectl {

LevelTPManager::LevelTPManager(std::vector<domain::LevelTakeProfit> levels)
    : levels_(std::move(levels)) {
  validate(levels_);
}

void LevelTPManager::updateConfig(
    std::vector<domain::LevelTakeProfit> levels) {
  validate(levels);
  levels_ = std::move(levels);
}

void LevelTPManager::validate(std::vector<domain::LevelTakeProfit>& levels) {
  std::sort(levels.begin(), levels.end(),
            [](const domain::LevelTakeProfit& a,
               const domain::LevelTakeProfit& b) {
              return a.dca_level < b.dca_level;
            });

  for (std::size_t i = 0; i < levels.size(); ++i) {
    const auto& row = levels[i];
    if (row.dca_level < 0) {
      throw ConfigError("take_profit_levels: dca_level must not be negative");
    }
    if (row.tp_percent < 0.0) {
      throw ConfigError("take_profit_levels: tp_percent must not be negative");
    }
    if (row.close_percent <= 0.0 || row.close_percent > 100.0) {
      throw ConfigError("take_profit_levels: close_percent must be in (0, 100]");
    }
    if (i > 0 && levels[i - 1].dca_level == row.dca_level) {
      throw ConfigError("take_profit_levels: duplicate dca_level " +
                        std::to_string(row.dca_level));
    }
  }
}

std::vector<domain::LevelTakeProfit> LevelTPManager::defaultLevels() {
  return {
      {0, 5.0, 20.0, false},
      {1, 7.0, 20.0, false},
      {2, 10.0, 30.0, false},
      {3, 15.0, 30.0, true},
      {4, 20.0, 50.0, true},
      {5, 30.0, 100.0, true},
  };
}

domain::LevelTPState LevelTPManager::updateLevel(
    const domain::LevelTPState& state, int level) const {
  domain::LevelTPState next = state;
  next.current_level = level;
  return next;
}

domain::LevelTPState LevelTPManager::updateAvgEntryPrice(
    const domain::LevelTPState& state, double avg_entry_price) const {
  domain::LevelTPState next = state;
  next.avg_entry_price = avg_entry_price;
  return next;
}

// Highest configured row with dca_level <= current_level. levels_ is sorted.
const domain::LevelTakeProfit* LevelTPManager::findApplicable(
    int current_level) const {
  const domain::LevelTakeProfit* applicable = nullptr;
  for (const auto& row : levels_) {
    if (row.dca_level > current_level) {
      break;
    }
    applicable = &row;
  }
  return applicable;
}

// -----------------------------------------------------------------------------
// checkTP: at most one fire per row
// -----------------------------------------------------------------------------
domain::Transition<domain::LevelTPState, domain::TPCheckResult>
LevelTPManager::checkTP(const domain::LevelTPState& state, double current_price,
                        domain::PositionDirection direction) const {
  domain::LevelTPState next = state;
  next.last_price = current_price;

  const domain::LevelTakeProfit* row = findApplicable(next.current_level);
  if (row == nullptr || next.hit_levels.count(row->dca_level) > 0 ||
      next.avg_entry_price <= 0.0) {
    return domain::makeTransition(std::move(next), domain::TPCheckResult{});
  }

  const double avg = next.avg_entry_price;
  const double profit_percent =
      direction == domain::PositionDirection::Long
          ? ((current_price - avg) / avg) * 100.0
          : ((avg - current_price) / avg) * 100.0;

  if (profit_percent < row->tp_percent) {
    return domain::makeTransition(std::move(next), domain::TPCheckResult{});
  }

  next.hit_levels.insert(row->dca_level);
  std::cout << "[LevelTPManager] Level " << row->dca_level << " hit at "
            << current_price << " (profit " << profit_percent << "% >= "
            << row->tp_percent << "%), closing " << row->close_percent
            << "%\n";

  domain::TPCheckResult result;
  result.hit = true;
  result.level = *row;
  return domain::makeTransition(std::move(next), std::move(result));
}

double LevelTPManager::calculateCloseQuantity(
    const domain::LevelTakeProfit& level, double total_quantity) {
  return total_quantity * (level.close_percent / 100.0);
}

bool LevelTPManager::shouldEnableTrailing(
    const domain::LevelTPState& state) const {
  return std::any_of(levels_.begin(), levels_.end(),
                     [&state](const domain::LevelTakeProfit& row) {
                       return row.trailing_after_hit &&
                              state.hit_levels.count(row.dca_level) > 0;
                     });
}

std::optional<domain::TPTarget> LevelTPManager::getNextTPTarget(
    const domain::LevelTPState& state) const {
  const domain::LevelTakeProfit* row = findApplicable(state.current_level);
  if (row == nullptr) {
    return std::nullopt;
  }

  if (state.hit_levels.count(row->dca_level) == 0) {
    return domain::TPTarget{row->tp_percent, row->close_percent};
  }

  auto it = std::find_if(levels_.begin(), levels_.end(),
                         [row, &state](const domain::LevelTakeProfit& c) {
                           return c.dca_level > row->dca_level &&
                                  c.dca_level <= state.current_level;
                         });
  if (it == levels_.end()) {
    return std::nullopt;
  }
  return domain::TPTarget{it->tp_percent, it->close_percent};
}

}  // namespace tradectl
