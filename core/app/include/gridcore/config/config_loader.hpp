#pragma once

#include "gridcore/config/bot_config.hpp"

#include <functional>
#include <optional>
#include <string>

namespace gridcore {
namespace config {

// -----------------------------------------------------------------------------
// ConfigLoader
// -----------------------------------------------------------------------------
// @brief  Builds a validated BotConfig from a JSON document and environment
//         overrides.
//
// @details
// Resolution order (later wins):
//   1. Compiled defaults (BotConfig{}).
//   2. JSON file sections: trading, grid, dca, risk, supervisor, exchange,
//      tick, persistence, ipc. Unknown keys are ignored, wrong types are
//      a ConfigError.
//   3. Environment variables (SYMBOL, LEVERAGE, GRID_LEVELS, ...).
//
// The environment is read through an injectable lookup so tests never touch
// the real process environment.
// -----------------------------------------------------------------------------
class ConfigLoader {
 public:
  using EnvLookup =
      std::function<std::optional<std::string>(const std::string&)>;

  // Reads from the real process environment via std::getenv.
  static EnvLookup processEnvironment();

  explicit ConfigLoader(EnvLookup env = processEnvironment());

  // Missing file is a ConfigError; an empty path means "defaults only".
  BotConfig loadFile(const std::string& path) const;

  BotConfig loadString(const std::string& json_text) const;

  void applyEnvironmentOverrides(BotConfig& config) const;

 private:
  BotConfig finish(BotConfig config) const;

  EnvLookup env_;
};

}  // namespace config
}  // namespace gridcore
