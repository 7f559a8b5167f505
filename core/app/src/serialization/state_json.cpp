#include "tradectl/serialization/state_json.hpp"

#include <cstdint>
#include <optional>
#include <stdexcept>

namespace tradectl {
namespace domain {

namespace {

template <typename T>
nlohmann::json optionalToJson(const std::optional<T>& value) {
  return value ? nlohmann::json(*value) : nlohmann::json(nullptr);
}

template <typename T>
std::optional<T> optionalFromJson(const nlohmann::json& j, const char* key) {
  auto it = j.find(key);
  if (it == j.end() || it->is_null()) {
    return std::nullopt;
  }
  return it->get<T>();
}

}  // namespace

SafetyOrderStatus parseSafetyOrderStatus(const std::string& text) {
  for (auto status : {SafetyOrderStatus::Pending, SafetyOrderStatus::Triggered,
                      SafetyOrderStatus::Filled, SafetyOrderStatus::Cancelled}) {
    if (text == toString(status)) {
      return status;
    }
  }
  throw std::invalid_argument("unknown safety order status: " + text);
}

RejectReason parseRejectReason(const std::string& text) {
  for (int i = static_cast<int>(RejectReason::CircuitBreakerActive);
       i <= static_cast<int>(RejectReason::MaxOpenPositionsReached); ++i) {
    auto reason = static_cast<RejectReason>(i);
    if (text == toString(reason)) {
      return reason;
    }
  }
  throw std::invalid_argument("unknown reject reason: " + text);
}

PositionDirection parsePositionDirection(const std::string& text) {
  if (text == toString(PositionDirection::Long)) {
    return PositionDirection::Long;
  }
  if (text == toString(PositionDirection::Short)) {
    return PositionDirection::Short;
  }
  throw std::invalid_argument("unknown position direction: " + text);
}

// --- RiskState ----------------------------------------------------------------

void to_json(nlohmann::json& j, const RiskState& s) {
  j = nlohmann::json{
      {"open_positions", s.open_positions},
      {"current_dca_orders", s.current_dca_orders},
      {"total_invested", s.total_invested},
      {"current_drawdown", s.current_drawdown},
      {"daily_pnl", s.daily_pnl},
      {"daily_loss", s.daily_loss},
      {"consecutive_losses", s.consecutive_losses},
      {"available_balance", s.available_balance},
      {"last_order_ms", optionalToJson(s.last_order_ms)},
      {"last_loss_ms", optionalToJson(s.last_loss_ms)},
      {"circuit_breaker_active", s.circuit_breaker_active},
      {"circuit_breaker_until_ms", optionalToJson(s.circuit_breaker_until_ms)},
  };
}

void from_json(const nlohmann::json& j, RiskState& s) {
  j.at("open_positions").get_to(s.open_positions);
  j.at("current_dca_orders").get_to(s.current_dca_orders);
  j.at("total_invested").get_to(s.total_invested);
  j.at("current_drawdown").get_to(s.current_drawdown);
  j.at("daily_pnl").get_to(s.daily_pnl);
  j.at("daily_loss").get_to(s.daily_loss);
  j.at("consecutive_losses").get_to(s.consecutive_losses);
  j.at("available_balance").get_to(s.available_balance);
  s.last_order_ms = optionalFromJson<std::int64_t>(j, "last_order_ms");
  s.last_loss_ms = optionalFromJson<std::int64_t>(j, "last_loss_ms");
  j.at("circuit_breaker_active").get_to(s.circuit_breaker_active);
  s.circuit_breaker_until_ms =
      optionalFromJson<std::int64_t>(j, "circuit_breaker_until_ms");
}

// --- Safety orders ------------------------------------------------------------

void to_json(nlohmann::json& j, const SafetyOrder& o) {
  j = nlohmann::json{
      {"index", o.index},
      {"trigger_price", o.trigger_price},
      {"amount", o.amount},
      {"quantity", o.quantity},
      {"status", toString(o.status)},
      {"triggered_at_ms", optionalToJson(o.triggered_at_ms)},
      {"filled_at_ms", optionalToJson(o.filled_at_ms)},
      {"filled_price", optionalToJson(o.filled_price)},
  };
}

void from_json(const nlohmann::json& j, SafetyOrder& o) {
  j.at("index").get_to(o.index);
  j.at("trigger_price").get_to(o.trigger_price);
  j.at("amount").get_to(o.amount);
  j.at("quantity").get_to(o.quantity);
  o.status = parseSafetyOrderStatus(j.at("status").get<std::string>());
  o.triggered_at_ms = optionalFromJson<std::int64_t>(j, "triggered_at_ms");
  o.filled_at_ms = optionalFromJson<std::int64_t>(j, "filled_at_ms");
  o.filled_price = optionalFromJson<double>(j, "filled_price");
}

void to_json(nlohmann::json& j, const LadderState& s) {
  j = nlohmann::json{
      {"entry_price", s.entry_price},
      {"orders", s.orders},
      {"triggered_count", s.triggered_count},
      {"total_safety_invested", s.total_safety_invested},
      {"last_trigger_ms", optionalToJson(s.last_trigger_ms)},
  };
}

void from_json(const nlohmann::json& j, LadderState& s) {
  j.at("entry_price").get_to(s.entry_price);
  j.at("orders").get_to(s.orders);
  j.at("triggered_count").get_to(s.triggered_count);
  j.at("total_safety_invested").get_to(s.total_safety_invested);
  s.last_trigger_ms = optionalFromJson<std::int64_t>(j, "last_trigger_ms");
}

// --- Level take-profit --------------------------------------------------------

void to_json(nlohmann::json& j, const LevelTakeProfit& l) {
  j = nlohmann::json{
      {"dca_level", l.dca_level},
      {"tp_percent", l.tp_percent},
      {"close_percent", l.close_percent},
      {"trailing_after_hit", l.trailing_after_hit},
  };
}

void from_json(const nlohmann::json& j, LevelTakeProfit& l) {
  j.at("dca_level").get_to(l.dca_level);
  j.at("tp_percent").get_to(l.tp_percent);
  j.at("close_percent").get_to(l.close_percent);
  j.at("trailing_after_hit").get_to(l.trailing_after_hit);
}

void to_json(nlohmann::json& j, const LevelTPState& s) {
  j = nlohmann::json{
      {"hit_levels", s.hit_levels},
      {"last_price", s.last_price},
      {"current_level", s.current_level},
      {"avg_entry_price", s.avg_entry_price},
  };
}

void from_json(const nlohmann::json& j, LevelTPState& s) {
  j.at("hit_levels").get_to(s.hit_levels);
  j.at("last_price").get_to(s.last_price);
  j.at("current_level").get_to(s.current_level);
  j.at("avg_entry_price").get_to(s.avg_entry_price);
}

// --- Trailing grid ------------------------------------------------------------

void to_json(nlohmann::json& j, const TrailShift& t) {
  j = nlohmann::json{
      {"from", t.from},
      {"to", t.to},
      {"price", t.price},
      {"time_ms", t.time_ms},
  };
}

void from_json(const nlohmann::json& j, TrailShift& t) {
  j.at("from").get_to(t.from);
  j.at("to").get_to(t.to);
  j.at("price").get_to(t.price);
  j.at("time_ms").get_to(t.time_ms);
}

void to_json(nlohmann::json& j, const TrailingGridState& s) {
  j = nlohmann::json{
      {"original_center", s.original_center},
      {"current_center", s.current_center},
      {"trail_count", s.trail_count},
      {"last_trail_ms", optionalToJson(s.last_trail_ms)},
      {"trail_history", s.trail_history},
      {"levels", s.levels},
  };
}

void from_json(const nlohmann::json& j, TrailingGridState& s) {
  j.at("original_center").get_to(s.original_center);
  j.at("current_center").get_to(s.current_center);
  j.at("trail_count").get_to(s.trail_count);
  s.last_trail_ms = optionalFromJson<std::int64_t>(j, "last_trail_ms");
  j.at("trail_history").get_to(s.trail_history);
  j.at("levels").get_to(s.levels);
}

// --- Decision (outbound only) -------------------------------------------------

void to_json(nlohmann::json& j, const Decision& d) {
  j = nlohmann::json{
      {"allowed", d.allowed},
      {"reason", d.reason ? nlohmann::json(toString(*d.reason))
                          : nlohmann::json(nullptr)},
      {"message", d.message},
      {"warning", optionalToJson(d.warning)},
  };
}

}  // namespace domain
}  // namespace tradectl
