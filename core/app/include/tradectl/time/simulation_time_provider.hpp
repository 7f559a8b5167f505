#pragma once

#include "tradectl/time/i_time_provider.hpp"

#include <atomic>
#include <cstdint>

namespace tradectl {

// -----------------------------------------------------------------------------
// SimulationTimeProvider: externally-driven clock for replay and tests
// -----------------------------------------------------------------------------
//
// @brief  ITimeProvider whose "current time" is set explicitly rather than
//         read from the system clock.
//
// @details
// The replay driver calls advance_time() with each tick's timestamp before
// handing the price to the PositionController, so cooldowns and the circuit
// breaker window are measured in tick time. Tests use advance_by() to step
// over a cooldown without waiting for it.
//
// Internal storage is a std::atomic<int64_t> so that a driver thread may
// advance the clock while a reporting thread reads it.
// -----------------------------------------------------------------------------
class SimulationTimeProvider final : public ITimeProvider {
 public:
  // -------------------------------------------------------------------------
  // Constructor
  // -------------------------------------------------------------------------
  // @param  start_ms  Initial clock value in epoch milliseconds (default 0,
  //                   meaning "no tick replayed yet").
  // -------------------------------------------------------------------------
  explicit SimulationTimeProvider(std::int64_t start_ms = 0);

  std::int64_t now_ms() const override;

  // -------------------------------------------------------------------------
  // advance_time(new_time_ms)
  // -------------------------------------------------------------------------
  // @brief  Sets the clock to the given timestamp.
  //
  // @details
  // Monotonicity is the caller's responsibility and is not enforced;
  // tests occasionally need to set arbitrary times.
  // -------------------------------------------------------------------------
  void advance_time(std::int64_t new_time_ms);

  // -------------------------------------------------------------------------
  // advance_by(delta_ms)
  // -------------------------------------------------------------------------
  // @brief  Moves the clock forward by delta_ms milliseconds.
  // -------------------------------------------------------------------------
  void advance_by(std::int64_t delta_ms);

 private:
  std::atomic<std::int64_t> current_time_ms_{0};
};

}  // namespace tradectl
