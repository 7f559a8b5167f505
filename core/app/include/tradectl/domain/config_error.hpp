#pragma once

#include <stdexcept>
#include <string>

namespace tradectl {

// -----------------------------------------------------------------------------
// ConfigError: invalid component configuration
// -----------------------------------------------------------------------------
//
// @brief  Thrown by component constructors and by the config loader when a
//         configuration value is out of range (non-positive multiplier,
//         negative cap, zero-length ladder with the ladder enabled, ...).
//
// @details
// Configuration problems fail fast at construction time. Business-rule
// violations at tick time are never exceptions; they are returned as a
// domain::Decision.
// -----------------------------------------------------------------------------
class ConfigError : public std::invalid_argument {
 public:
  explicit ConfigError(const std::string& what) : std::invalid_argument(what) {}
};

}  // namespace tradectl
