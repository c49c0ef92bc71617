#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace gridcore {
namespace config {

// -----------------------------------------------------------------------------
// BotConfig
// -----------------------------------------------------------------------------
// Typed configuration built once at startup (ConfigLoader) and handed by
// value to every component. Nothing reads configuration lazily or from
// global state after construction.
//
// Defaults follow the paper-trading profile the bot ships with: BTCUSDT,
// 10x leverage, 1000 USDT starting capital, 20-level 3% grid.
// -----------------------------------------------------------------------------

struct TradingConfig {
  std::string symbol{"BTCUSDT"};
  int leverage{10};               // 1..100
  double initial_capital{1000.0};
};

struct GridConfig {
  // Percent band around the seed price. Ignored when explicit bounds are
  // given (both lower_price and upper_price set).
  double range_percent{3.0};
  std::optional<double> lower_price;
  std::optional<double> upper_price;
  int levels{20};
  double order_size{0.01};
  // Replacement order offset from the filled level, in percent.
  double profit_offset_percent{0.5};
  int max_placement_retries{3};

  bool hasExplicitBounds() const {
    return lower_price.has_value() && upper_price.has_value();
  }
};

enum class DcaDirection {
  Long,   // Buys into drops
  Short,  // Sells into rallies
};

struct DcaConfig {
  bool enabled{true};
  double trigger_percent{2.0};
  double order_size{0.02};
  int max_orders{5};
  double scaling_factor{1.5};
  double recovery_percent{2.0};
  DcaDirection direction{DcaDirection::Long};
};

struct RiskConfig {
  bool kill_switch_enabled{true};
  double max_drawdown_percent{20.0};
  bool breakeven_enabled{true};
  // Unrealized profit (as % of position notional) required before the
  // breakeven stop is armed.
  double breakeven_buffer_percent{0.1};
  bool partial_profit_enabled{true};
  double partial_profit_percent{50.0};
  double partial_profit_multiple{2.0};
  // Margin in use as % of equity above which a warning alert is raised.
  double margin_warning_percent{80.0};
};

struct SupervisorConfig {
  std::int64_t health_check_interval_ms{5000};
  std::int64_t restart_delay_ms{5000};
  int max_restarts_per_window{10};
  std::int64_t restart_window_ms{3600000};
  int failure_threshold{3};
  std::int64_t stale_tick_timeout_ms{60000};
  std::int64_t backoff_initial_ms{30000};
  std::int64_t backoff_max_ms{600000};
};

struct ExchangeRetryConfig {
  int max_attempts{3};
  std::int64_t retry_initial_ms{200};
  std::int64_t retry_max_ms{2000};
};

struct TickConfig {
  std::int64_t interval_ms{5000};
};

struct PersistenceConfig {
  std::string state_file{"gridcore_state.json"};
  // Minimum spacing of equity journal records; 0 records every tick.
  std::int64_t equity_record_interval_ms{60000};
};

struct IpcConfig {
  std::string command_endpoint{"tcp://127.0.0.1:5556"};
  std::string telemetry_endpoint{"tcp://127.0.0.1:5557"};
  std::string price_feed_endpoint{"tcp://127.0.0.1:5555"};
};

struct BotConfig {
  TradingConfig trading;
  GridConfig grid;
  DcaConfig dca;
  RiskConfig risk;
  SupervisorConfig supervisor;
  ExchangeRetryConfig exchange;
  TickConfig tick;
  PersistenceConfig persistence;
  IpcConfig ipc;
};

// Throws ConfigError describing the first violated constraint.
void validate(const BotConfig& config);

}  // namespace config
}  // namespace gridcore
