#include "gridcore/engine/control_commands.hpp"

#include "gridcore/errors/errors.hpp"
#include "gridcore/persistence/snapshot_json.hpp"

#include <nlohmann/json.hpp>

#include <iostream>

namespace gridcore {

namespace {

std::string trim(const std::string& text) {
  const char* ws = " \t\r\n";
  auto first = text.find_first_not_of(ws);
  if (first == std::string::npos) {
    return "";
  }
  auto last = text.find_last_not_of(ws);
  return text.substr(first, last - first + 1);
}

nlohmann::json statusJson(const TradingSession& session,
                          const Supervisor& supervisor) {
  nlohmann::json j;
  j["status"] = "ok";

  domain::HealthStatus health = supervisor.health();
  j["supervisor"] = {
      {"state", domain::toString(health.state)},
      {"connection", domain::toString(health.connection)},
      {"consecutive_failures", health.consecutive_failures},
      {"restarts_in_window", health.restarts_in_window},
      {"suppressed_restarts", supervisor.suppressedRestarts()},
      {"last_tick_ms", health.last_tick_ms},
      {"last_error", health.last_error},
  };

  auto snap = session.snapshot();
  j["symbol"] = session.config().trading.symbol;
  j["tick_sequence"] = snap->tick_sequence;
  j["last_price"] = snap->last_price;
  j["equity"] = snap->equity;

  j["position"] = {
      {"net_quantity", snap->position.net_quantity},
      {"average_price", snap->position.average_price},
      {"unrealized_pnl", snap->position.unrealized_pnl},
      {"realized_pnl", snap->position.realized_pnl},
  };

  j["risk"] = {
      {"peak_equity", snap->risk.peak_equity},
      {"drawdown_percent", snap->risk.drawdown_percent},
      {"breakeven_armed", snap->risk.breakeven_armed},
      {"partial_profit_taken", snap->risk.partial_profit_taken},
      {"max_drawdown_percent", snap->risk.max_drawdown_percent},
      {"margin_ratio_percent", snap->risk.margin_ratio_percent},
      {"kill_switch_armed", snap->risk.kill_switch_armed},
      {"wind_down_pending", snap->risk.wind_down_pending},
  };

  std::size_t open = 0;
  std::size_t parked = 0;
  std::size_t cycles = 0;
  for (const auto& level : snap->grid.levels) {
    if (level.state == domain::GridLevelState::Open) ++open;
    if (level.state == domain::GridLevelState::Parked) ++parked;
    cycles += static_cast<std::size_t>(level.cycles);
  }
  j["grid"] = {
      {"levels", snap->grid.levels.size()},
      {"open", open},
      {"parked", parked},
      {"completed_cycles", cycles},
      {"lower_price", snap->grid.lower_price},
      {"upper_price", snap->grid.upper_price},
  };

  std::size_t active = 0;
  for (const auto& entry : snap->dca.entries) {
    if (domain::isActive(entry)) ++active;
  }
  j["dca"] = {
      {"active_entries", active},
      {"reference_price", snap->dca.reference_price},
  };

  j["open_orders"] = snap->open_orders.size();
  return j;
}

constexpr std::size_t kRecentTrades = 10;

nlohmann::json performanceJson(TradingSession& session) {
  PerformanceReport r = session.performance();
  nlohmann::json j;
  j["status"] = "ok";
  j["symbol"] = r.symbol;
  j["tick_sequence"] = r.tick_sequence;
  j["initial_capital"] = r.initial_capital;
  j["balance"] = r.balance;
  j["equity"] = r.equity;
  j["total_return_percent"] = r.total_return_percent;
  j["unrealized_pnl"] = r.unrealized_pnl;
  j["realized_pnl"] = r.realized_pnl;
  j["peak_equity"] = r.peak_equity;
  j["drawdown_percent"] = r.drawdown_percent;
  j["max_drawdown_percent"] = r.max_drawdown_percent;
  j["margin_ratio_percent"] = r.margin_ratio_percent;
  j["window"] = {
      {"samples", r.window_samples},
      {"high_equity", r.window_high_equity},
      {"low_equity", r.window_low_equity},
  };
  j["trades_recorded"] = r.trades_recorded;

  // The report stays useful when the journal cannot be read.
  try {
    j["recent_trades"] = session.recentTrades(kRecentTrades);
  } catch (const StateStoreError& e) {
    std::cerr << "[Control] trade journal unavailable: " << e.what() << "\n";
    j["recent_trades"] = nlohmann::json::array();
    j["journal_error"] = e.what();
  }
  return j;
}

}  // namespace

std::string handleControlCommand(const std::string& command,
                                 TradingSession& session,
                                 Supervisor& supervisor) {
  std::string cmd = trim(command);
  nlohmann::json response;

  if (cmd == "PING") {
    response["status"] = "ok";
    response["response"] = "PONG";
  } else if (cmd == "STATUS") {
    response = statusJson(session, supervisor);
  } else if (cmd == "PERFORMANCE") {
    response = performanceJson(session);
  } else if (cmd == "HALT") {
    std::cout << "[Control] HALT received\n";
    session.requestHalt("operator halt");
    response["status"] = "ok";
    response["response"] = "Kill switch requested";
  } else if (cmd == "STOP") {
    std::cout << "[Control] STOP received\n";
    supervisor.requestStop();
    response["status"] = "ok";
    response["response"] = "Shutdown requested";
  } else {
    response["status"] = "error";
    response["response"] = "Unknown command: " + cmd;
  }

  return response.dump();
}

}  // namespace gridcore
