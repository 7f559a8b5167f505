// =============================================================================
// replay_driver_test.cpp
// =============================================================================
// Tests for tradectl::ReplayDriver, the JSONL backtest harness.
//
// Validates:
//   - Malformed, blank and foreign-symbol lines are skipped
//   - Open → safety fill → take-profit on a short recorded series
//   - Emergency close, post-loss re-entry delay and day rollover
//   - Available balance handed to the gatekeeper
//   - Summary alone on stdout while logs are redirected
// =============================================================================

#include "tradectl/engine/log_redirect.hpp"
#include "tradectl/engine/replay_driver.hpp"
#include "tradectl/time/time_utils.hpp"

#include <gtest/gtest.h>

#include <cstdint>
#include <iostream>
#include <sstream>
#include <string>

namespace {

constexpr std::int64_t kT0 = 1'700'000'000'000;

std::string tickLine(std::int64_t ts, double price,
                     const std::string& symbol = "BTCUSDT") {
  std::ostringstream os;
  os << R"({"timestamp_ms": )" << ts << R"(, "symbol": ")" << symbol
     << R"(", "price": )" << price << "}";
  return os.str();
}

}  // namespace

class ReplayDriverTest : public ::testing::Test {
 protected:
  ReplayDriverTest() {
    config.initial_balance = 10000.0;
    config.risk.cooldown_between_orders_min = 0.0;
    config.safety_orders.enabled = true;
    config.safety_orders.max_safety_orders = 3;
    config.safety_orders.safety_interval_min = 0.0;
    config.take_profit_levels = tradectl::LevelTPManager::defaultLevels();
  }

  tradectl::ControlConfig config;
};

// -----------------------------------------------------------------------------
// 1. Input hygiene.
// -----------------------------------------------------------------------------
TEST_F(ReplayDriverTest, SkipsBadLines) {
  tradectl::ReplayDriver driver(config);

  EXPECT_FALSE(driver.processLine(""));
  EXPECT_FALSE(driver.processLine("not json"));
  EXPECT_FALSE(driver.processLine(R"({"timestamp_ms": 1, "symbol": "X"})"));
  EXPECT_FALSE(driver.processLine(
      R"({"timestamp_ms": "soon", "symbol": "X", "price": 1})"));
  EXPECT_EQ(driver.controller(), nullptr);

  EXPECT_TRUE(driver.processLine(tickLine(kT0, 100.0)));
  EXPECT_FALSE(driver.processLine(tickLine(kT0 + 1000, 3000.0, "ETHUSDT")));

  auto summary = driver.summary();
  EXPECT_EQ(summary.at("ticks_processed").get<int>(), 1);
  EXPECT_EQ(summary.at("ticks_skipped").get<int>(), 4);
}

// -----------------------------------------------------------------------------
// 2. Open, average down once, take partial profit.
// -----------------------------------------------------------------------------
TEST_F(ReplayDriverTest, OpenAverageAndTakeProfit) {
  tradectl::ReplayDriver driver(config);

  ASSERT_TRUE(driver.processLine(tickLine(kT0, 100.0)));
  const auto* pc = driver.controller();
  ASSERT_NE(pc, nullptr);
  EXPECT_EQ(pc->phase(), tradectl::PositionPhase::Open);
  EXPECT_DOUBLE_EQ(pc->remainingQuantity(), 0.5);  // 50 quote at 100
  EXPECT_DOUBLE_EQ(driver.availableBalance(), 9950.0);
  EXPECT_DOUBLE_EQ(pc->riskState().available_balance, 9950.0);

  ASSERT_TRUE(driver.processLine(tickLine(kT0 + 60'000, 94.0)));
  EXPECT_EQ(pc->phase(), tradectl::PositionPhase::Averaging);
  EXPECT_NEAR(pc->averageEntry(), 100.0 / (0.5 + 50.0 / 94.0), 1e-9);

  ASSERT_TRUE(driver.processLine(tickLine(kT0 + 120'000, 106.0)));
  EXPECT_EQ(pc->phase(), tradectl::PositionPhase::PartiallyClosed);
  EXPECT_GT(driver.totalRealizedPnl(), 0.0);

  auto summary = driver.summary();
  EXPECT_EQ(summary.at("positions_opened").get<int>(), 1);
  EXPECT_EQ(summary.at("safety_orders_filled").get<int>(), 1);
  EXPECT_EQ(summary.at("take_profits").get<int>(), 1);
  EXPECT_EQ(summary.at("position").at("phase").get<std::string>(),
            "PARTIALLY_CLOSED");
}

// -----------------------------------------------------------------------------
// 3. Emergency close, delayed re-entry, daily reset.
// -----------------------------------------------------------------------------
TEST_F(ReplayDriverTest, EmergencyCloseThenReentry) {
  tradectl::ReplayDriver driver(config);

  driver.processLine(tickLine(kT0, 100.0));
  driver.processLine(tickLine(kT0 + 60'000, 65.0));  // 35% drawdown

  const auto* pc = driver.controller();
  EXPECT_EQ(pc->phase(), tradectl::PositionPhase::Closed);
  EXPECT_DOUBLE_EQ(driver.totalRealizedPnl(), -17.5);
  EXPECT_DOUBLE_EQ(pc->riskState().daily_loss, 17.5);
  EXPECT_DOUBLE_EQ(driver.availableBalance(), 10000.0 - 17.5);

  // Post-loss cooldown (30 minutes by default) blocks re-entry.
  driver.processLine(tickLine(kT0 + 2 * 60'000, 66.0));
  EXPECT_EQ(pc->phase(), tradectl::PositionPhase::Closed);

  driver.processLine(tickLine(kT0 + 32 * 60'000, 66.0));
  EXPECT_EQ(pc->phase(), tradectl::PositionPhase::Open);

  auto summary = driver.summary();
  EXPECT_EQ(summary.at("positions_opened").get<int>(), 2);
  EXPECT_EQ(summary.at("emergency_closes").get<int>(), 1);
  EXPECT_GE(summary.at("rejections").get<int>(), 1);

  // Next UTC day clears the daily loss.
  driver.processLine(tickLine(kT0 + tradectl::kMillisPerDay, 66.0));
  EXPECT_DOUBLE_EQ(pc->riskState().daily_loss, 0.0);
}

// -----------------------------------------------------------------------------
// 4. While redirected, component logs leave stdout; the summary stays there.
// -----------------------------------------------------------------------------
TEST_F(ReplayDriverTest, StdoutCarriesOnlySummary) {
  testing::internal::CaptureStdout();
  testing::internal::CaptureStderr();
  {
    tradectl::StdoutLogRedirect logs;
    tradectl::ReplayDriver driver(config);
    driver.processLine(tickLine(kT0, 100.0));
    driver.processLine(tickLine(kT0 + 60'000, 94.0));
    logs.out() << driver.summary().dump() << "\n";
  }
  const std::string out = testing::internal::GetCapturedStdout();
  const std::string err = testing::internal::GetCapturedStderr();

  auto summary = nlohmann::json::parse(out);
  EXPECT_EQ(summary.at("ticks_processed").get<int>(), 2);
  EXPECT_NE(err.find("[PositionController]"), std::string::npos);

  // std::cout is restored afterwards.
  testing::internal::CaptureStdout();
  std::cout << "back" << std::flush;
  EXPECT_EQ(testing::internal::GetCapturedStdout(), "back");
}
