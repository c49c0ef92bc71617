#include "gridcore/config/bot_config.hpp"
#include "gridcore/errors/errors.hpp"

#include <string>

namespace gridcore {
namespace config {

namespace {

void require(bool condition, const std::string& message) {
  if (!condition) {
    throw ConfigError(message);
  }
}

bool isPercent(double value) { return value > 0.0 && value <= 100.0; }

}  // namespace

void validate(const BotConfig& c) {
  require(!c.trading.symbol.empty(), "trading.symbol must not be empty");
  require(c.trading.leverage >= 1 && c.trading.leverage <= 100,
          "trading.leverage must be between 1 and 100");
  require(c.trading.initial_capital > 0.0,
          "trading.initial_capital must be positive");

  require(c.grid.levels >= 2, "grid.levels must be at least 2");
  require(c.grid.order_size > 0.0, "grid.order_size must be positive");
  require(c.grid.profit_offset_percent > 0.0 &&
              c.grid.profit_offset_percent < 100.0,
          "grid.profit_offset_percent must be in (0, 100)");
  require(c.grid.max_placement_retries >= 1,
          "grid.max_placement_retries must be at least 1");
  require(c.grid.lower_price.has_value() == c.grid.upper_price.has_value(),
          "grid.lower_price and grid.upper_price must be given together");
  if (c.grid.hasExplicitBounds()) {
    require(*c.grid.lower_price > 0.0, "grid.lower_price must be positive");
    require(*c.grid.lower_price < *c.grid.upper_price,
            "grid.lower_price must be below grid.upper_price");
  } else {
    require(c.grid.range_percent > 0.0 && c.grid.range_percent < 100.0,
            "grid.range_percent must be in (0, 100)");
  }

  require(c.dca.trigger_percent > 0.0 && c.dca.trigger_percent < 100.0,
          "dca.trigger_percent must be in (0, 100)");
  require(c.dca.order_size > 0.0, "dca.order_size must be positive");
  require(c.dca.max_orders >= 1, "dca.max_orders must be at least 1");
  require(c.dca.scaling_factor >= 1.0, "dca.scaling_factor must be >= 1");
  require(c.dca.recovery_percent > 0.0, "dca.recovery_percent must be positive");

  require(isPercent(c.risk.max_drawdown_percent),
          "risk.max_drawdown_percent must be in (0, 100]");
  require(c.risk.breakeven_buffer_percent >= 0.0,
          "risk.breakeven_buffer_percent must not be negative");
  require(isPercent(c.risk.partial_profit_percent),
          "risk.partial_profit_percent must be in (0, 100]");
  require(isPercent(c.risk.margin_warning_percent),
          "risk.margin_warning_percent must be in (0, 100]");
  require(c.risk.partial_profit_multiple > 1.0,
          "risk.partial_profit_multiple must be greater than 1");

  require(c.supervisor.health_check_interval_ms > 0,
          "supervisor.health_check_interval_ms must be positive");
  require(c.supervisor.restart_delay_ms >= 0,
          "supervisor.restart_delay_ms must not be negative");
  require(c.supervisor.max_restarts_per_window >= 1,
          "supervisor.max_restarts_per_window must be at least 1");
  require(c.supervisor.restart_window_ms > 0,
          "supervisor.restart_window_ms must be positive");
  require(c.supervisor.failure_threshold >= 1,
          "supervisor.failure_threshold must be at least 1");
  require(c.supervisor.backoff_initial_ms > 0 &&
              c.supervisor.backoff_initial_ms <= c.supervisor.backoff_max_ms,
          "supervisor backoff must satisfy 0 < initial <= max");

  require(c.exchange.max_attempts >= 1, "exchange.max_attempts must be >= 1");
  require(c.exchange.retry_initial_ms >= 0 &&
              c.exchange.retry_initial_ms <= c.exchange.retry_max_ms,
          "exchange retry backoff must satisfy 0 <= initial <= max");

  require(c.tick.interval_ms > 0, "tick.interval_ms must be positive");
  require(c.persistence.equity_record_interval_ms >= 0,
          "persistence.equity_record_interval_ms must not be negative");
}

}  // namespace config
}  // namespace gridcore
