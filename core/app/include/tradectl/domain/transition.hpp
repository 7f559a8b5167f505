#pragma once

#include <utility>

namespace tradectl {
namespace domain {

// -----------------------------------------------------------------------------
// Transition: next state plus the result of the operation that produced it
// -----------------------------------------------------------------------------
//
// @brief  Return type for every component operation that both advances a
//         state record and answers a question (e.g. a gatekeeper decision
//         that also clears an expired circuit breaker).
//
// @details
// Components never mutate the caller's state. The caller decides whether to
// commit `state`; the PositionController uses this to dry-run the ladder
// before the gatekeeper has approved the batch.
// -----------------------------------------------------------------------------
template <typename State, typename Result>
struct Transition {
  State state;
  Result result;
};

template <typename State, typename Result>
Transition<State, Result> makeTransition(State state, Result result) {
  return Transition<State, Result>{std::move(state), std::move(result)};
}

}  // namespace domain
}  // namespace tradectl
