#pragma once

#include <cstdint>

namespace tradectl {

// -----------------------------------------------------------------------------
// ITimeProvider: abstract time source interface
// -----------------------------------------------------------------------------
//
// @brief  Pure virtual interface that abstracts the concept of "current time"
//         away from std::chrono::system_clock.
//
// @details
// Every time-based rule in the control core (inter-order cooldown, post-loss
// cooldown, circuit-breaker window, safety-order interval) is expressed as a
// stored timestamp compared against now_ms(). None of them sleep or arm a
// timer. Injecting the clock means a tick that arrives every second and a
// tick that arrives every hour are evaluated by exactly the same code, and
// tests can jump the clock forward by an hour in one call.
//
// SimulationTimeProvider returns a value set by the replay driver or by a
// test. A live deployment supplies its own implementation backed by the
// venue's clock.
//
// Components receive `const ITimeProvider&` and call now_ms() whenever they
// need a timestamp.
//
// Ownership:
//   Components hold a const reference; they do NOT own the provider. The
//   provider's lifetime must exceed that of all components that reference it.
// -----------------------------------------------------------------------------
class ITimeProvider {
 public:
  virtual ~ITimeProvider() = default;

  // -------------------------------------------------------------------------
  // now_ms()
  // -------------------------------------------------------------------------
  // @brief  Returns the current time as milliseconds since the Unix epoch.
  //
  // @return int64_t  Epoch time in milliseconds. May be 0 before a
  //         simulation clock is first advanced.
  //
  // Side-effects:  None.
  // -------------------------------------------------------------------------
  virtual std::int64_t now_ms() const = 0;
};

}  // namespace tradectl
