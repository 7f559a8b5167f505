#pragma once

namespace tradectl {
namespace domain {

// Side of an open position. Long positions average down into falling prices
// and take profit above the average entry; short positions mirror both.
enum class PositionDirection {
  Long,
  Short,
};

const char* toString(PositionDirection direction);

}  // namespace domain
}  // namespace tradectl
