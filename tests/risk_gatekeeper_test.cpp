// =============================================================================
// risk_gatekeeper_test.cpp
// =============================================================================
// Unit tests for tradectl::RiskGatekeeper.
//
// Validates:
//   - Per-order, aggregate and balance caps with their reason codes
//   - Rule priority (first violation wins)
//   - Inter-order and post-loss cooldowns measured on the injected clock
//   - Circuit breaker: arming by loss streak and daily loss, one-hour
//     window, lazy expiry, no extension on re-arm
//   - Depth warning, new-position limit, drawdown advisory
//   - Config validation and validated limit updates
//
// Design: Each test builds its own gatekeeper on a SimulationTimeProvider.
// =============================================================================

#include "tradectl/domain/config_error.hpp"
#include "tradectl/risk/risk_gatekeeper.hpp"
#include "tradectl/time/simulation_time_provider.hpp"
#include "tradectl/time/time_utils.hpp"

#include <gtest/gtest.h>

#include <cstdint>

using tradectl::domain::RejectReason;

class RiskGatekeeperTest : public ::testing::Test {
 protected:
  static constexpr std::int64_t kStartMs = 1'700'000'000'000;

  RiskGatekeeperTest() : clock(kStartMs) {}

  // Limits with every cooldown and the loss breakers out of the way, so a
  // test only sees the rule it turns on.
  static tradectl::domain::RiskConfig quietConfig() {
    tradectl::domain::RiskConfig c;
    c.cooldown_between_orders_min = 0.0;
    c.cooldown_after_loss_min = 0.0;
    c.max_daily_loss = 1e9;
    c.max_daily_loss_percent = 1e9;
    return c;
  }

  void advanceMinutes(double minutes) {
    clock.advance_by(tradectl::minutes_to_ms(minutes));
  }

  tradectl::SimulationTimeProvider clock;
};

// -----------------------------------------------------------------------------
// 1. Aggregate cap: invested 150 with cap 200 rejects 60 and allows 50.
// -----------------------------------------------------------------------------
TEST_F(RiskGatekeeperTest, AggregateCapRejectsOverflowAndAllowsFit) {
  auto config = quietConfig();
  config.max_total_invested = 200.0;
  tradectl::RiskGatekeeper gk(config, clock);

  auto state = gk.initialState(10000.0);
  state.total_invested = 150.0;

  auto over = gk.canOpenAveragingOrder(state, 60.0, "BTCUSDT", {});
  EXPECT_FALSE(over.result.allowed);
  ASSERT_TRUE(over.result.reason.has_value());
  EXPECT_EQ(*over.result.reason, RejectReason::AggregateCapExceeded);

  auto fits = gk.canOpenAveragingOrder(state, 50.0, "BTCUSDT", {});
  EXPECT_TRUE(fits.result.allowed);
  EXPECT_FALSE(fits.result.reason.has_value());
}

// -----------------------------------------------------------------------------
// 2. Per-order and balance rules report their own reason codes.
// -----------------------------------------------------------------------------
TEST_F(RiskGatekeeperTest, PerOrderCapsAndBalance) {
  tradectl::RiskGatekeeper gk(quietConfig(), clock);

  auto rich = gk.initialState(10000.0);
  auto too_large = gk.canOpenAveragingOrder(rich, 1500.0, "X", {});
  EXPECT_EQ(*too_large.result.reason, RejectReason::OrderTooLarge);

  // 300 of 1000 is 30% > 20%.
  auto poor = gk.initialState(1000.0);
  auto too_big_share = gk.canOpenAveragingOrder(poor, 300.0, "X", {});
  EXPECT_EQ(*too_big_share.result.reason, RejectReason::OrderPercentTooLarge);

  // 4900 + 200 = 51% of balance > 50%.
  auto config = quietConfig();
  config.max_total_invested = 100000.0;
  tradectl::RiskGatekeeper wide(config, clock);
  auto invested = wide.initialState(10000.0);
  invested.total_invested = 4900.0;
  auto aggregate_pct = wide.canOpenAveragingOrder(invested, 200.0, "X", {});
  EXPECT_EQ(*aggregate_pct.result.reason,
            RejectReason::AggregatePercentExceeded);
}

TEST_F(RiskGatekeeperTest, InsufficientBalanceWhenPercentCapsAllowIt) {
  auto config = quietConfig();
  config.max_position_percent = 1000.0;
  config.max_total_invested_percent = 1000.0;
  tradectl::RiskGatekeeper gk(config, clock);

  auto state = gk.initialState(100.0);
  auto t = gk.canOpenAveragingOrder(state, 150.0, "X", {});
  EXPECT_FALSE(t.result.allowed);
  EXPECT_EQ(*t.result.reason, RejectReason::InsufficientBalance);
}

TEST_F(RiskGatekeeperTest, ZeroBalanceRejectsAnyPositiveAmount) {
  tradectl::RiskGatekeeper gk(quietConfig(), clock);
  auto state = gk.initialState(0.0);

  auto t = gk.canOpenAveragingOrder(state, 1.0, "X", {});
  EXPECT_FALSE(t.result.allowed);
  EXPECT_EQ(*t.result.reason, RejectReason::OrderPercentTooLarge);
}

// -----------------------------------------------------------------------------
// 3. Priority: the breaker outranks depth, depth outranks size.
// -----------------------------------------------------------------------------
TEST_F(RiskGatekeeperTest, FirstViolationWins) {
  tradectl::RiskGatekeeper gk(quietConfig(), clock);

  auto state = gk.initialState(10000.0);
  state.current_dca_orders = 10;

  auto depth = gk.canOpenAveragingOrder(state, 5000.0, "X", {});
  EXPECT_EQ(*depth.result.reason, RejectReason::MaxDepthReached);

  state.circuit_breaker_active = true;
  state.circuit_breaker_until_ms = kStartMs + 1000;
  auto breaker = gk.canOpenAveragingOrder(state, 5000.0, "X", {});
  EXPECT_EQ(*breaker.result.reason, RejectReason::CircuitBreakerActive);
}

// -----------------------------------------------------------------------------
// 4. Inter-order cooldown.
// -----------------------------------------------------------------------------
TEST_F(RiskGatekeeperTest, CooldownBetweenOrders) {
  auto config = quietConfig();
  config.cooldown_between_orders_min = 5.0;
  tradectl::RiskGatekeeper gk(config, clock);

  auto state = gk.recordOrderOpened(gk.initialState(10000.0), 50.0);
  EXPECT_EQ(state.current_dca_orders, 1);
  EXPECT_DOUBLE_EQ(state.total_invested, 50.0);
  ASSERT_TRUE(state.last_order_ms.has_value());
  EXPECT_EQ(*state.last_order_ms, kStartMs);

  advanceMinutes(2.0);
  auto early = gk.canOpenAveragingOrder(state, 50.0, "X", {});
  EXPECT_FALSE(early.result.allowed);
  EXPECT_EQ(*early.result.reason, RejectReason::CooldownActive);
  EXPECT_NE(early.result.message.find("Wait 3 minutes"), std::string::npos);

  advanceMinutes(3.0);
  auto later = gk.canOpenAveragingOrder(state, 50.0, "X", {});
  EXPECT_TRUE(later.result.allowed);
}

// -----------------------------------------------------------------------------
// 5. Post-loss cooldown applies only while a loss streak is running.
// -----------------------------------------------------------------------------
TEST_F(RiskGatekeeperTest, CooldownAfterLoss) {
  auto config = quietConfig();
  config.cooldown_after_loss_min = 30.0;
  tradectl::RiskGatekeeper gk(config, clock);

  auto state = gk.recordPositionClosed(gk.initialState(10000.0), -10.0, true);
  EXPECT_EQ(state.consecutive_losses, 1);

  advanceMinutes(10.0);
  auto early = gk.canOpenAveragingOrder(state, 50.0, "X", {});
  EXPECT_EQ(*early.result.reason, RejectReason::PostLossCooldownActive);

  // A win clears the streak and with it the post-loss cooldown.
  auto after_win = gk.recordPositionClosed(state, 25.0, false);
  EXPECT_EQ(after_win.consecutive_losses, 0);
  EXPECT_TRUE(gk.canOpenAveragingOrder(after_win, 50.0, "X", {}).result.allowed);

  advanceMinutes(20.0);
  EXPECT_TRUE(gk.canOpenAveragingOrder(state, 50.0, "X", {}).result.allowed);
}

// -----------------------------------------------------------------------------
// 6. Circuit breaker from a loss streak: one hour, then lazy expiry.
// -----------------------------------------------------------------------------
TEST_F(RiskGatekeeperTest, CircuitBreakerArmsOnStreakAndExpiresAfterAnHour) {
  auto config = quietConfig();
  config.circuit_breaker_losses = 3;
  tradectl::RiskGatekeeper gk(config, clock);

  auto state = gk.initialState(10000.0);
  for (int i = 0; i < 2; ++i) {
    state = gk.recordPositionClosed(state, -10.0, true);
    EXPECT_FALSE(state.circuit_breaker_active);
  }
  state = gk.recordPositionClosed(state, -10.0, true);
  ASSERT_TRUE(state.circuit_breaker_active);
  ASSERT_TRUE(state.circuit_breaker_until_ms.has_value());
  EXPECT_EQ(*state.circuit_breaker_until_ms,
            kStartMs + tradectl::RiskGatekeeper::kCircuitBreakerDurationMs);

  advanceMinutes(59.0);
  auto blocked = gk.canOpenAveragingOrder(state, 50.0, "X", {});
  EXPECT_FALSE(blocked.result.allowed);
  EXPECT_EQ(*blocked.result.reason, RejectReason::CircuitBreakerActive);
  EXPECT_TRUE(blocked.state.circuit_breaker_active);

  advanceMinutes(1.0);
  auto expired = gk.canOpenAveragingOrder(state, 50.0, "X", {});
  EXPECT_TRUE(expired.result.allowed);
  EXPECT_FALSE(expired.state.circuit_breaker_active);
  EXPECT_FALSE(expired.state.circuit_breaker_until_ms.has_value());
}

TEST_F(RiskGatekeeperTest, ExpiredBreakerStillEvaluatesOtherRules) {
  tradectl::RiskGatekeeper gk(quietConfig(), clock);

  auto state = gk.initialState(10000.0);
  state.circuit_breaker_active = true;
  state.circuit_breaker_until_ms = kStartMs - 1;

  auto t = gk.canOpenAveragingOrder(state, 1500.0, "X", {});
  EXPECT_EQ(*t.result.reason, RejectReason::OrderTooLarge);
  EXPECT_FALSE(t.state.circuit_breaker_active);
}

// -----------------------------------------------------------------------------
// 7. Daily loss arms the breaker even with the streak trigger disabled.
// -----------------------------------------------------------------------------
TEST_F(RiskGatekeeperTest, DailyLossArmsBreakerWithStreakTriggerDisabled) {
  auto config = quietConfig();
  config.circuit_breaker_enabled = false;
  config.max_daily_loss = 25.0;
  tradectl::RiskGatekeeper gk(config, clock);

  auto state = gk.initialState(10000.0);
  state = gk.recordPositionClosed(state, -10.0, true);
  state = gk.recordPositionClosed(state, -10.0, true);
  EXPECT_FALSE(state.circuit_breaker_active);
  EXPECT_DOUBLE_EQ(state.daily_loss, 20.0);

  state = gk.recordPositionClosed(state, -10.0, true);
  EXPECT_TRUE(state.circuit_breaker_active);
  EXPECT_DOUBLE_EQ(state.daily_pnl, -30.0);
}

TEST_F(RiskGatekeeperTest, DailyLossPercentArmsBreaker) {
  auto config = quietConfig();
  config.max_daily_loss_percent = 10.0;
  tradectl::RiskGatekeeper gk(config, clock);

  auto state = gk.recordPositionClosed(gk.initialState(1000.0), -100.0, true);
  EXPECT_TRUE(state.circuit_breaker_active);
}

TEST_F(RiskGatekeeperTest, RearmingDoesNotExtendWindow) {
  auto config = quietConfig();
  config.circuit_breaker_losses = 1;
  tradectl::RiskGatekeeper gk(config, clock);

  auto state = gk.recordPositionClosed(gk.initialState(10000.0), -10.0, true);
  const auto until = *state.circuit_breaker_until_ms;

  advanceMinutes(30.0);
  state = gk.recordPositionClosed(state, -10.0, true);
  EXPECT_EQ(*state.circuit_breaker_until_ms, until);
}

// -----------------------------------------------------------------------------
// 8. Depth warning at 80% of max_dca_orders.
// -----------------------------------------------------------------------------
TEST_F(RiskGatekeeperTest, DepthWarningOnApprovalNearLimit) {
  tradectl::RiskGatekeeper gk(quietConfig(), clock);

  auto state = gk.initialState(10000.0);
  state.current_dca_orders = 7;
  auto quiet = gk.canOpenAveragingOrder(state, 50.0, "X", {});
  EXPECT_TRUE(quiet.result.allowed);
  EXPECT_FALSE(quiet.result.warning.has_value());

  state.current_dca_orders = 8;
  auto warned = gk.canOpenAveragingOrder(state, 50.0, "X", {});
  EXPECT_TRUE(warned.result.allowed);
  ASSERT_TRUE(warned.result.warning.has_value());
  EXPECT_NE(warned.result.warning->find("8/10"), std::string::npos);
}

// -----------------------------------------------------------------------------
// 9. New positions: limit on distinct symbols; adding is always allowed.
// -----------------------------------------------------------------------------
TEST_F(RiskGatekeeperTest, CanOpenNewPosition) {
  tradectl::RiskGatekeeper gk(quietConfig(), clock);

  auto state = gk.initialState(10000.0);
  for (int i = 0; i < 5; ++i) {
    state = gk.recordPositionOpened(state);
  }
  EXPECT_EQ(state.open_positions, 5);

  auto full = gk.canOpenNewPosition(state, "ETHUSDT", {"BTCUSDT"});
  EXPECT_FALSE(full.allowed);
  EXPECT_EQ(*full.reason, RejectReason::MaxOpenPositionsReached);

  auto existing = gk.canOpenNewPosition(state, "BTCUSDT", {"BTCUSDT"});
  EXPECT_TRUE(existing.allowed);
}

// -----------------------------------------------------------------------------
// 10. Drawdown advisory.
// -----------------------------------------------------------------------------
TEST_F(RiskGatekeeperTest, UpdateDrawdown) {
  tradectl::RiskGatekeeper gk(quietConfig(), clock);
  auto state = gk.initialState(10000.0);

  auto ok = gk.updateDrawdown(state, 29.9);
  EXPECT_TRUE(ok.result.allowed);
  EXPECT_DOUBLE_EQ(ok.state.current_drawdown, 29.9);

  auto breach = gk.updateDrawdown(state, 30.0);
  EXPECT_FALSE(breach.result.allowed);
  EXPECT_EQ(*breach.result.reason, RejectReason::MaxDrawdownExceeded);
  EXPECT_DOUBLE_EQ(breach.state.current_drawdown, 30.0);
}

// -----------------------------------------------------------------------------
// 11. Bookkeeping on close, daily reset and full reset.
// -----------------------------------------------------------------------------
TEST_F(RiskGatekeeperTest, CloseResetsExposureAndFloorsOpenPositions) {
  tradectl::RiskGatekeeper gk(quietConfig(), clock);

  auto state = gk.initialState(10000.0);
  state = gk.recordOrderOpened(state, 100.0);
  state = gk.recordOrderOpened(state, 150.0);
  state = gk.recordPositionClosed(state, 40.0, false);

  EXPECT_EQ(state.open_positions, 0);
  EXPECT_EQ(state.current_dca_orders, 0);
  EXPECT_DOUBLE_EQ(state.total_invested, 0.0);
  EXPECT_DOUBLE_EQ(state.daily_pnl, 40.0);

  state = gk.resetDaily(state);
  EXPECT_DOUBLE_EQ(state.daily_pnl, 0.0);
  EXPECT_DOUBLE_EQ(state.daily_loss, 0.0);

  state = gk.updateBalance(state, 7500.0);
  state.consecutive_losses = 3;
  auto fresh = gk.reset(state);
  EXPECT_DOUBLE_EQ(fresh.available_balance, 7500.0);
  EXPECT_EQ(fresh.consecutive_losses, 0);
}

TEST_F(RiskGatekeeperTest, RejectionLeavesStateUntouched) {
  tradectl::RiskGatekeeper gk(quietConfig(), clock);

  auto state = gk.initialState(10000.0);
  state.total_invested = 123.0;
  state.current_dca_orders = 2;

  auto t = gk.canOpenAveragingOrder(state, 1500.0, "X", {});
  EXPECT_FALSE(t.result.allowed);
  EXPECT_DOUBLE_EQ(t.state.total_invested, 123.0);
  EXPECT_EQ(t.state.current_dca_orders, 2);
  EXPECT_FALSE(t.state.last_order_ms.has_value());
}

// -----------------------------------------------------------------------------
// 12. Config validation.
// -----------------------------------------------------------------------------
TEST_F(RiskGatekeeperTest, InvalidConfigThrows) {
  auto zero_depth = quietConfig();
  zero_depth.max_dca_orders = 0;
  EXPECT_THROW(tradectl::RiskGatekeeper(zero_depth, clock),
               tradectl::ConfigError);

  auto negative_cooldown = quietConfig();
  negative_cooldown.cooldown_between_orders_min = -1.0;
  EXPECT_THROW(tradectl::RiskGatekeeper(negative_cooldown, clock),
               tradectl::ConfigError);

  auto zero_streak = quietConfig();
  zero_streak.circuit_breaker_losses = 0;
  EXPECT_THROW(tradectl::RiskGatekeeper(zero_streak, clock),
               tradectl::ConfigError);

  zero_streak.circuit_breaker_enabled = false;
  EXPECT_NO_THROW(tradectl::RiskGatekeeper(zero_streak, clock));
}

// -----------------------------------------------------------------------------
// 13. Limit updates take effect on the next check; invalid ones are refused.
// -----------------------------------------------------------------------------
TEST_F(RiskGatekeeperTest, UpdateConfigSwapsLimits) {
  tradectl::RiskGatekeeper gk(quietConfig(), clock);
  auto state = gk.initialState(10000.0);
  state.current_dca_orders = 3;

  EXPECT_TRUE(gk.canOpenAveragingOrder(state, 50.0, "X", {}).result.allowed);

  auto tighter = quietConfig();
  tighter.max_dca_orders = 3;
  gk.updateConfig(tighter);
  EXPECT_EQ(gk.config().max_dca_orders, 3);

  auto t = gk.canOpenAveragingOrder(state, 50.0, "X", {});
  EXPECT_FALSE(t.result.allowed);
  EXPECT_EQ(*t.result.reason, RejectReason::MaxDepthReached);
}

TEST_F(RiskGatekeeperTest, InvalidUpdateKeepsLimits) {
  tradectl::RiskGatekeeper gk(quietConfig(), clock);

  auto bad = quietConfig();
  bad.max_total_invested = -1.0;
  EXPECT_THROW(gk.updateConfig(bad), tradectl::ConfigError);
  EXPECT_DOUBLE_EQ(gk.config().max_total_invested, 5000.0);
  EXPECT_EQ(gk.config().max_dca_orders, 10);
}
