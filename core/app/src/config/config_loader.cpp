#include "gridcore/config/config_loader.hpp"
#include "gridcore/errors/errors.hpp"

#include <nlohmann/json.hpp>

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <sstream>
#include <utility>

namespace gridcore {
namespace config {

namespace {

using nlohmann::json;

// Reads `key` from `section` into `target` if present. Leaves the default
// untouched otherwise.
template <typename T>
void read(const json& section, const char* key, T& target) {
  auto it = section.find(key);
  if (it != section.end() && !it->is_null()) {
    target = it->get<T>();
  }
}

void readOptional(const json& section, const char* key,
                  std::optional<double>& target) {
  auto it = section.find(key);
  if (it != section.end() && !it->is_null()) {
    target = it->get<double>();
  }
}

const json& sectionOf(const json& root, const char* name) {
  static const json kEmpty = json::object();
  auto it = root.find(name);
  if (it == root.end()) {
    return kEmpty;
  }
  if (!it->is_object()) {
    throw ConfigError(std::string("section '") + name + "' must be an object");
  }
  return *it;
}

DcaDirection parseDirection(const std::string& text) {
  if (text == "long" || text == "Long") {
    return DcaDirection::Long;
  }
  if (text == "short" || text == "Short") {
    return DcaDirection::Short;
  }
  throw ConfigError("dca.direction must be 'long' or 'short', got '" + text +
                    "'");
}

BotConfig fromJson(const json& root) {
  if (!root.is_object()) {
    throw ConfigError("configuration root must be a JSON object");
  }

  BotConfig cfg;

  const json& trading = sectionOf(root, "trading");
  read(trading, "symbol", cfg.trading.symbol);
  read(trading, "leverage", cfg.trading.leverage);
  read(trading, "initial_capital", cfg.trading.initial_capital);

  const json& grid = sectionOf(root, "grid");
  read(grid, "range_percent", cfg.grid.range_percent);
  readOptional(grid, "lower_price", cfg.grid.lower_price);
  readOptional(grid, "upper_price", cfg.grid.upper_price);
  read(grid, "levels", cfg.grid.levels);
  read(grid, "order_size", cfg.grid.order_size);
  read(grid, "profit_offset_percent", cfg.grid.profit_offset_percent);
  read(grid, "max_placement_retries", cfg.grid.max_placement_retries);

  const json& dca = sectionOf(root, "dca");
  read(dca, "enabled", cfg.dca.enabled);
  read(dca, "trigger_percent", cfg.dca.trigger_percent);
  read(dca, "order_size", cfg.dca.order_size);
  read(dca, "max_orders", cfg.dca.max_orders);
  read(dca, "scaling_factor", cfg.dca.scaling_factor);
  read(dca, "recovery_percent", cfg.dca.recovery_percent);
  if (auto it = dca.find("direction"); it != dca.end()) {
    cfg.dca.direction = parseDirection(it->get<std::string>());
  }

  const json& risk = sectionOf(root, "risk");
  read(risk, "kill_switch_enabled", cfg.risk.kill_switch_enabled);
  read(risk, "max_drawdown_percent", cfg.risk.max_drawdown_percent);
  read(risk, "breakeven_enabled", cfg.risk.breakeven_enabled);
  read(risk, "breakeven_buffer_percent", cfg.risk.breakeven_buffer_percent);
  read(risk, "partial_profit_enabled", cfg.risk.partial_profit_enabled);
  read(risk, "partial_profit_percent", cfg.risk.partial_profit_percent);
  read(risk, "partial_profit_multiple", cfg.risk.partial_profit_multiple);
  read(risk, "margin_warning_percent", cfg.risk.margin_warning_percent);

  const json& sup = sectionOf(root, "supervisor");
  read(sup, "health_check_interval_ms", cfg.supervisor.health_check_interval_ms);
  read(sup, "restart_delay_ms", cfg.supervisor.restart_delay_ms);
  read(sup, "max_restarts_per_window", cfg.supervisor.max_restarts_per_window);
  read(sup, "restart_window_ms", cfg.supervisor.restart_window_ms);
  read(sup, "failure_threshold", cfg.supervisor.failure_threshold);
  read(sup, "stale_tick_timeout_ms", cfg.supervisor.stale_tick_timeout_ms);
  read(sup, "backoff_initial_ms", cfg.supervisor.backoff_initial_ms);
  read(sup, "backoff_max_ms", cfg.supervisor.backoff_max_ms);

  const json& exchange = sectionOf(root, "exchange");
  read(exchange, "max_attempts", cfg.exchange.max_attempts);
  read(exchange, "retry_initial_ms", cfg.exchange.retry_initial_ms);
  read(exchange, "retry_max_ms", cfg.exchange.retry_max_ms);

  read(sectionOf(root, "tick"), "interval_ms", cfg.tick.interval_ms);
  const json& persistence = sectionOf(root, "persistence");
  read(persistence, "state_file", cfg.persistence.state_file);
  read(persistence, "equity_record_interval_ms",
       cfg.persistence.equity_record_interval_ms);

  const json& ipc = sectionOf(root, "ipc");
  read(ipc, "command_endpoint", cfg.ipc.command_endpoint);
  read(ipc, "telemetry_endpoint", cfg.ipc.telemetry_endpoint);
  read(ipc, "price_feed_endpoint", cfg.ipc.price_feed_endpoint);

  return cfg;
}

bool parseBool(const std::string& name, const std::string& value) {
  if (value == "true" || value == "1" || value == "yes" || value == "True") {
    return true;
  }
  if (value == "false" || value == "0" || value == "no" || value == "False") {
    return false;
  }
  throw ConfigError(name + " must be a boolean, got '" + value + "'");
}

double parseDouble(const std::string& name, const std::string& value) {
  try {
    std::size_t consumed = 0;
    double parsed = std::stod(value, &consumed);
    if (consumed == value.size()) {
      return parsed;
    }
  } catch (const std::logic_error&) {
    // Reported below with the variable name.
  }
  throw ConfigError(name + " must be a number, got '" + value + "'");
}

int parseInt(const std::string& name, const std::string& value) {
  try {
    std::size_t consumed = 0;
    int parsed = std::stoi(value, &consumed);
    if (consumed == value.size()) {
      return parsed;
    }
  } catch (const std::logic_error&) {
    // Reported below with the variable name.
  }
  throw ConfigError(name + " must be an integer, got '" + value + "'");
}

}  // namespace

ConfigLoader::EnvLookup ConfigLoader::processEnvironment() {
  return [](const std::string& name) -> std::optional<std::string> {
    const char* value = std::getenv(name.c_str());
    if (value == nullptr) {
      return std::nullopt;
    }
    return std::string(value);
  };
}

ConfigLoader::ConfigLoader(EnvLookup env) : env_(std::move(env)) {}

BotConfig ConfigLoader::loadFile(const std::string& path) const {
  if (path.empty()) {
    return finish(BotConfig{});
  }

  std::ifstream in(path);
  if (!in) {
    throw ConfigError("cannot open configuration file: " + path);
  }
  std::stringstream buffer;
  buffer << in.rdbuf();

  std::cout << "[ConfigLoader] loading " << path << "\n";
  return loadString(buffer.str());
}

BotConfig ConfigLoader::loadString(const std::string& json_text) const {
  BotConfig cfg;
  try {
    cfg = fromJson(json::parse(json_text));
  } catch (const nlohmann::json::exception& e) {
    throw ConfigError(std::string("malformed configuration: ") + e.what());
  }
  return finish(std::move(cfg));
}

void ConfigLoader::applyEnvironmentOverrides(BotConfig& cfg) const {
  auto get = [this](const char* name) { return env_(name); };

  if (auto v = get("SYMBOL")) cfg.trading.symbol = *v;
  if (auto v = get("LEVERAGE")) cfg.trading.leverage = parseInt("LEVERAGE", *v);
  if (auto v = get("INITIAL_CAPITAL")) {
    cfg.trading.initial_capital = parseDouble("INITIAL_CAPITAL", *v);
  }

  if (auto v = get("GRID_LEVELS")) cfg.grid.levels = parseInt("GRID_LEVELS", *v);
  if (auto v = get("GRID_ORDER_SIZE")) {
    cfg.grid.order_size = parseDouble("GRID_ORDER_SIZE", *v);
  }
  if (auto v = get("GRID_RANGE_PERCENT")) {
    cfg.grid.range_percent = parseDouble("GRID_RANGE_PERCENT", *v);
  }
  if (auto v = get("GRID_LOWER_PRICE")) {
    cfg.grid.lower_price = parseDouble("GRID_LOWER_PRICE", *v);
  }
  if (auto v = get("GRID_UPPER_PRICE")) {
    cfg.grid.upper_price = parseDouble("GRID_UPPER_PRICE", *v);
  }

  if (auto v = get("DCA_ENABLED")) cfg.dca.enabled = parseBool("DCA_ENABLED", *v);
  if (auto v = get("DCA_TRIGGER_PERCENT")) {
    cfg.dca.trigger_percent = parseDouble("DCA_TRIGGER_PERCENT", *v);
  }
  if (auto v = get("DCA_ORDER_SIZE")) {
    cfg.dca.order_size = parseDouble("DCA_ORDER_SIZE", *v);
  }
  if (auto v = get("DCA_MAX_ORDERS")) {
    cfg.dca.max_orders = parseInt("DCA_MAX_ORDERS", *v);
  }

  if (auto v = get("KILL_SWITCH_ENABLED")) {
    cfg.risk.kill_switch_enabled = parseBool("KILL_SWITCH_ENABLED", *v);
  }
  if (auto v = get("MAX_DRAWDOWN_PERCENT")) {
    cfg.risk.max_drawdown_percent = parseDouble("MAX_DRAWDOWN_PERCENT", *v);
  }
  if (auto v = get("BREAKEVEN_ENABLED")) {
    cfg.risk.breakeven_enabled = parseBool("BREAKEVEN_ENABLED", *v);
  }
  if (auto v = get("PARTIAL_PROFIT_ENABLED")) {
    cfg.risk.partial_profit_enabled = parseBool("PARTIAL_PROFIT_ENABLED", *v);
  }
  if (auto v = get("PARTIAL_PROFIT_PERCENT")) {
    cfg.risk.partial_profit_percent = parseDouble("PARTIAL_PROFIT_PERCENT", *v);
  }
}

BotConfig ConfigLoader::finish(BotConfig config) const {
  applyEnvironmentOverrides(config);
  validate(config);
  return config;
}

}  // namespace config
}  // namespace gridcore
