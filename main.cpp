// -----------------------------------------------------------------------------
// tradectl_sim: replay entry point.
//
// Usage:
//   tradectl_sim <config.json> [ticks.jsonl]
//
// Steps:
//   1) Load and validate the JSON configuration. Any ConfigError ends the
//      program with exit code 1 before a single tick is read.
//   2) Create the ReplayDriver, which owns the SimulationTimeProvider and
//      the PositionController for the first symbol seen.
//   3) Feed it one tick per line from the ticks file, or from stdin when no
//      file is given. Malformed lines are logged and skipped.
//   4) Print the final summary and position snapshot as JSON on stdout.
//      Every log line, including the components' informational ones, goes
//      to stderr so stdout holds the JSON document alone.
//
// Single-threaded: the clock only moves when a tick is processed.
// -----------------------------------------------------------------------------

#include "tradectl/config/config_loader.hpp"
#include "tradectl/domain/config_error.hpp"
#include "tradectl/engine/log_redirect.hpp"
#include "tradectl/engine/replay_driver.hpp"

#include <fstream>
#include <iostream>
#include <string>

static int usage(const char* argv0) {
  std::cerr << "usage: " << argv0 << " <config.json> [ticks.jsonl]\n";
  return 2;
}

int main(int argc, char** argv) {
  if (argc < 2 || argc > 3) {
    return usage(argv[0]);
  }

  tradectl::StdoutLogRedirect logs;

  // -------------------------------------------------------------------------
  // 1) Configuration.
  // -------------------------------------------------------------------------
  tradectl::ControlConfig config;
  try {
    config = tradectl::loadConfigFile(argv[1]);
  } catch (const tradectl::ConfigError& e) {
    std::cerr << "[main] Invalid configuration: " << e.what() << "\n";
    return 1;
  }

  std::cout << "[main] Loaded " << argv[1]
            << " (initial_balance=" << config.initial_balance
            << ", safety_orders=" << (config.safety_orders.enabled ? "on" : "off")
            << ", trailing_grid=" << (config.trailing_grid.enabled ? "on" : "off")
            << ")\n";

  // -------------------------------------------------------------------------
  // 2) Driver.
  // -------------------------------------------------------------------------
  tradectl::ReplayDriver driver(config);

  // -------------------------------------------------------------------------
  // 3) Tick source: file argument or stdin.
  // -------------------------------------------------------------------------
  std::ifstream tick_file;
  if (argc == 3) {
    tick_file.open(argv[2]);
    if (!tick_file) {
      std::cerr << "[main] Cannot open tick file " << argv[2] << "\n";
      return 1;
    }
  }
  std::istream& ticks = argc == 3 ? static_cast<std::istream&>(tick_file)
                                  : std::cin;

  std::string line;
  while (std::getline(ticks, line)) {
    driver.processLine(line);
  }

  // -------------------------------------------------------------------------
  // 4) Final state.
  // -------------------------------------------------------------------------
  logs.out() << driver.summary().dump(2) << "\n";
  return 0;
}
