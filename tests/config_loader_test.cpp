// =============================================================================
// config_loader_test.cpp
// =============================================================================
// Unit tests for gridcore::config::ConfigLoader and validate().
//
// Validates:
//   - Defaults when nothing is given
//   - JSON sections override defaults; unknown keys are ignored
//   - Environment variables override the file
//   - Invalid values and malformed input surface as ConfigError
// =============================================================================

#include "gridcore/config/config_loader.hpp"
#include "gridcore/errors/errors.hpp"

#include <gtest/gtest.h>

#include <map>
#include <optional>
#include <string>

using gridcore::ConfigError;
using gridcore::config::BotConfig;
using gridcore::config::ConfigLoader;

class ConfigLoaderTest : public ::testing::Test {
 protected:
  ConfigLoader loader() const {
    auto vars = env;
    return ConfigLoader([vars](const std::string& name)
                            -> std::optional<std::string> {
      auto it = vars.find(name);
      if (it == vars.end()) {
        return std::nullopt;
      }
      return it->second;
    });
  }

  std::map<std::string, std::string> env;
};

// -----------------------------------------------------------------------------
// 1. Defaults: the paper-trading profile.
// -----------------------------------------------------------------------------
TEST_F(ConfigLoaderTest, EmptyPathGivesDefaults) {
  BotConfig cfg = loader().loadFile("");
  EXPECT_EQ(cfg.trading.symbol, "BTCUSDT");
  EXPECT_EQ(cfg.trading.leverage, 10);
  EXPECT_EQ(cfg.grid.levels, 20);
  EXPECT_DOUBLE_EQ(cfg.grid.range_percent, 3.0);
  EXPECT_FALSE(cfg.grid.hasExplicitBounds());
  EXPECT_TRUE(cfg.dca.enabled);
  EXPECT_DOUBLE_EQ(cfg.risk.max_drawdown_percent, 20.0);
  EXPECT_EQ(cfg.supervisor.max_restarts_per_window, 10);
  EXPECT_EQ(cfg.supervisor.restart_window_ms, 3600000);
}

// -----------------------------------------------------------------------------
// 2. JSON values override defaults section by section.
// -----------------------------------------------------------------------------
TEST_F(ConfigLoaderTest, LoadsSections) {
  BotConfig cfg = loader().loadString(R"({
    "trading": {"symbol": "ETHUSDT", "leverage": 5, "initial_capital": 2500},
    "grid": {"lower_price": 90, "upper_price": 110, "levels": 5},
    "dca": {"direction": "short", "max_orders": 3},
    "risk": {"kill_switch_enabled": false},
    "tick": {"interval_ms": 1000},
    "comment": "ignored"
  })");

  EXPECT_EQ(cfg.trading.symbol, "ETHUSDT");
  EXPECT_EQ(cfg.trading.leverage, 5);
  EXPECT_DOUBLE_EQ(cfg.trading.initial_capital, 2500.0);
  ASSERT_TRUE(cfg.grid.hasExplicitBounds());
  EXPECT_DOUBLE_EQ(*cfg.grid.lower_price, 90.0);
  EXPECT_EQ(cfg.grid.levels, 5);
  EXPECT_EQ(cfg.dca.direction, gridcore::config::DcaDirection::Short);
  EXPECT_EQ(cfg.dca.max_orders, 3);
  EXPECT_FALSE(cfg.risk.kill_switch_enabled);
  EXPECT_EQ(cfg.tick.interval_ms, 1000);
  // Untouched keys keep their defaults.
  EXPECT_DOUBLE_EQ(cfg.grid.order_size, 0.01);
}

// -----------------------------------------------------------------------------
// 3. Environment wins over the file.
// -----------------------------------------------------------------------------
TEST_F(ConfigLoaderTest, EnvironmentOverridesFile) {
  env["SYMBOL"] = "SOLUSDT";
  env["GRID_LEVELS"] = "12";
  env["DCA_ENABLED"] = "false";
  env["MAX_DRAWDOWN_PERCENT"] = "15.5";

  BotConfig cfg = loader().loadString(
      R"({"trading": {"symbol": "ETHUSDT"}, "grid": {"levels": 40}})");
  EXPECT_EQ(cfg.trading.symbol, "SOLUSDT");
  EXPECT_EQ(cfg.grid.levels, 12);
  EXPECT_FALSE(cfg.dca.enabled);
  EXPECT_DOUBLE_EQ(cfg.risk.max_drawdown_percent, 15.5);
}

TEST_F(ConfigLoaderTest, UnparsableEnvironmentValueIsRejected) {
  env["GRID_LEVELS"] = "twelve";
  EXPECT_THROW(loader().loadFile(""), ConfigError);

  env["GRID_LEVELS"] = "12";
  env["DCA_ENABLED"] = "maybe";
  EXPECT_THROW(loader().loadFile(""), ConfigError);
}

// -----------------------------------------------------------------------------
// 4. Constraint violations name the offending key.
// -----------------------------------------------------------------------------
TEST_F(ConfigLoaderTest, ValidationErrors) {
  auto message_of = [this](const std::string& text) -> std::string {
    try {
      loader().loadString(text);
    } catch (const ConfigError& e) {
      return e.what();
    }
    return "";
  };

  EXPECT_NE(message_of(R"({"trading": {"leverage": 0}})").find("leverage"),
            std::string::npos);
  EXPECT_NE(message_of(R"({"grid": {"levels": 1}})").find("grid.levels"),
            std::string::npos);
  EXPECT_NE(message_of(R"({"grid": {"lower_price": 100}})").find("together"),
            std::string::npos);
  EXPECT_NE(
      message_of(R"({"grid": {"lower_price": 110, "upper_price": 90}})")
          .find("below"),
      std::string::npos);
  EXPECT_NE(message_of(R"({"risk": {"max_drawdown_percent": 150}})")
                .find("max_drawdown_percent"),
            std::string::npos);
  EXPECT_NE(message_of(R"({"dca": {"direction": "sideways"}})")
                .find("dca.direction"),
            std::string::npos);
}

// -----------------------------------------------------------------------------
// 5. Malformed input.
// Why: A typo in the file must stop the bot before it trades, not fall back
//      to defaults.
// -----------------------------------------------------------------------------
TEST_F(ConfigLoaderTest, MalformedInput) {
  EXPECT_THROW(loader().loadString("{not json"), ConfigError);
  EXPECT_THROW(loader().loadString("[1, 2]"), ConfigError);
  EXPECT_THROW(loader().loadString(R"({"grid": 5})"), ConfigError);
  EXPECT_THROW(loader().loadString(R"({"grid": {"levels": "many"}})"),
               ConfigError);
  EXPECT_THROW(loader().loadFile("/nonexistent/gridcore.json"), ConfigError);
}
