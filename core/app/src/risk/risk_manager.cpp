#include "gridcore/risk/risk_manager.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <sstream>
#include <utility>

namespace gridcore {

namespace {

constexpr double kPercentEpsilon = 1e-9;

int signOf(const domain::Position& position) {
  if (position.isFlat()) {
    return 0;
  }
  return position.net_quantity > 0.0 ? 1 : -1;
}

bool differs(double a, double b) {
  return std::abs(a - b) > 1e-9 * std::max(1.0, std::abs(b));
}

domain::Side closingSide(const domain::Position& position) {
  return position.isLong() ? domain::Side::Sell : domain::Side::Buy;
}

}  // namespace

RiskManager::RiskManager(std::string symbol, config::RiskConfig config)
    : symbol_(std::move(symbol)), config_(std::move(config)) {}

RiskDecision RiskManager::evaluate(const domain::Position& position,
                                   const EquityHistory& equity) {
  updateEquity(equity);

  if (state_.kill_switch_armed) {
    return RiskDecision{};
  }

  if (config_.kill_switch_enabled &&
      state_.drawdown_percent + kPercentEpsilon >=
          config_.max_drawdown_percent) {
    std::ostringstream reason;
    reason << "drawdown " << state_.drawdown_percent << "% >= "
           << config_.max_drawdown_percent << "%";
    return killSwitch(reason.str(), position);
  }

  RiskDecision decision = evaluatePosition(position);
  decision.warning = checkMargin(position);
  return decision;
}

RiskDecision RiskManager::evaluatePosition(const domain::Position& position) {
  // A closed or flipped position starts over: flags are per position. The
  // first tick after a restore adopts the restored flags instead.
  int sign = signOf(position);
  if (sign != position_sign_) {
    bool restored = position_sign_ == kRestoredSign;
    position_sign_ = sign;
    if (!restored || sign == 0) {
      RiskDecision cleanup;
      if (state_.breakeven_stop_order_id != 0) {
        cleanup.intents.push_back(cancelStopIntent("position changed"));
      }
      clearPositionFlags();
      if (sign == 0 || !cleanup.intents.empty()) {
        return cleanup;
      }
    }
  }
  if (sign == 0) {
    return RiskDecision{};
  }

  double buffer = position.notional() * config_.breakeven_buffer_percent / 100.0;
  if (config_.breakeven_enabled && !state_.breakeven_armed &&
      position.unrealized_pnl > buffer) {
    state_.breakeven_armed = true;
    state_.breakeven_stop_price = position.average_price;
    state_.breakeven_stop_quantity = std::abs(position.net_quantity);
    stop_rejections_ = 0;

    RiskDecision decision;
    decision.action = domain::RiskAction::ArmBreakeven;
    decision.reason = "unrealized pnl above breakeven buffer";
    decision.current_value = position.unrealized_pnl;
    decision.limit_value = buffer;
    decision.intents.push_back(stopIntent(position));
    return decision;
  }

  if (config_.partial_profit_enabled && !state_.partial_profit_taken &&
      partialProfitReached(position)) {
    state_.partial_profit_taken = true;

    domain::OrderIntent intent;
    intent.kind = domain::OrderIntent::Kind::Place;
    intent.source = domain::IntentSource::Risk;
    intent.slot = kPartialProfitSlot;
    intent.request.symbol = symbol_;
    intent.request.side = closingSide(position);
    intent.request.type = domain::OrderType::Market;
    intent.request.quantity = std::abs(position.net_quantity) *
                              config_.partial_profit_percent / 100.0;
    intent.request.reduce_only = true;
    intent.reason = "partial profit";

    RiskDecision decision;
    decision.action = domain::RiskAction::TakePartialProfit;
    decision.reason = "mark reached partial profit target";
    decision.current_value = position.mark_price;
    decision.limit_value =
        position.isLong()
            ? position.average_price * config_.partial_profit_multiple
            : position.average_price / config_.partial_profit_multiple;
    decision.intents.push_back(std::move(intent));
    return decision;
  }

  // Keep the armed stop in line with the position.
  if (state_.breakeven_armed && stop_rejections_ < kMaxStopRejections) {
    double quantity = std::abs(position.net_quantity);
    bool moved = differs(state_.breakeven_stop_price, position.average_price) ||
                 differs(state_.breakeven_stop_quantity, quantity);
    bool missing = state_.breakeven_stop_order_id == 0;
    if (moved || missing) {
      RiskDecision maintenance;
      if (!missing) {
        maintenance.intents.push_back(cancelStopIntent("entry moved"));
      }
      state_.breakeven_stop_price = position.average_price;
      state_.breakeven_stop_quantity = quantity;
      maintenance.intents.push_back(stopIntent(position));
      return maintenance;
    }
  }

  return RiskDecision{};
}

RiskDecision RiskManager::triggerKillSwitch(const std::string& reason,
                                            const domain::Position& position) {
  if (state_.kill_switch_armed) {
    return RiskDecision{};
  }
  return killSwitch(reason, position);
}

RiskDecision RiskManager::killSwitch(const std::string& reason,
                                     const domain::Position& position) {
  state_.kill_switch_armed = true;

  std::cerr << "[RiskManager] CRITICAL: kill switch fired: " << reason
            << "\n";

  state_.wind_down_pending = true;

  RiskDecision decision;
  decision.action = domain::RiskAction::KillSwitch;
  decision.reason = reason;
  decision.current_value = state_.drawdown_percent;
  decision.limit_value = config_.max_drawdown_percent;
  decision.intents = windDown(position);

  // Every open order goes with CancelAll, including the breakeven stop.
  state_.breakeven_stop_order_id = 0;
  return decision;
}

std::vector<domain::OrderIntent> RiskManager::windDown(
    const domain::Position& position) const {
  std::vector<domain::OrderIntent> intents;

  domain::OrderIntent cancel_all;
  cancel_all.kind = domain::OrderIntent::Kind::CancelAll;
  cancel_all.source = domain::IntentSource::Risk;
  cancel_all.request.symbol = symbol_;
  cancel_all.reason = "kill switch";
  intents.push_back(std::move(cancel_all));

  if (!position.isFlat()) {
    domain::OrderIntent flatten;
    flatten.kind = domain::OrderIntent::Kind::Flatten;
    flatten.source = domain::IntentSource::Risk;
    flatten.slot = kFlattenSlot;
    flatten.request.symbol = symbol_;
    flatten.request.side = closingSide(position);
    flatten.request.type = domain::OrderType::Market;
    flatten.request.quantity = std::abs(position.net_quantity);
    flatten.request.reduce_only = true;
    flatten.reason = "kill switch";
    intents.push_back(std::move(flatten));
  }
  return intents;
}

void RiskManager::onWindDownComplete() {
  if (state_.wind_down_pending) {
    std::cout << "[RiskManager] kill switch wind-down confirmed: flat, no "
                 "open orders\n";
  }
  state_.wind_down_pending = false;
}

void RiskManager::onStopPlaced(domain::OrderId order_id) {
  state_.breakeven_stop_order_id = order_id;
  stop_rejections_ = 0;
}

void RiskManager::onStopRejected(const std::string& reason) {
  state_.breakeven_stop_order_id = 0;
  ++stop_rejections_;
  std::cerr << "[RiskManager] breakeven stop rejected (" << stop_rejections_
            << "/" << kMaxStopRejections << "): " << reason << "\n";
}

void RiskManager::onOrderMissing(domain::OrderId order_id) {
  if (order_id != 0 && order_id == state_.breakeven_stop_order_id) {
    state_.breakeven_stop_order_id = 0;
  }
}

void RiskManager::resetSession(double equity) {
  state_ = domain::RiskState{};
  state_.peak_equity = equity;
  state_.current_equity = equity;
  position_sign_ = 0;
  stop_rejections_ = 0;
  margin_warning_active_ = false;
  std::cout << "[RiskManager] session reset, peak equity " << equity << "\n";
}

void RiskManager::restore(const domain::RiskState& state) {
  state_ = state;
  // Flags describe the position that was open when the state was saved.
  position_sign_ = kRestoredSign;
  stop_rejections_ = 0;
}

void RiskManager::updateEquity(const EquityHistory& equity) {
  if (equity.empty()) {
    return;
  }
  double current = equity.latest().equity;
  state_.current_equity = current;
  state_.peak_equity = std::max(state_.peak_equity, current);
  state_.drawdown_percent =
      state_.peak_equity > 0.0
          ? std::max(0.0, (state_.peak_equity - current) / state_.peak_equity *
                              100.0)
          : 0.0;
  state_.max_drawdown_percent =
      std::max(state_.max_drawdown_percent, state_.drawdown_percent);
}

std::string RiskManager::checkMargin(const domain::Position& position) {
  double price =
      position.mark_price > 0.0 ? position.mark_price : position.average_price;
  double margin = std::abs(position.net_quantity) * price /
                  static_cast<double>(std::max(1, position.leverage));
  state_.margin_ratio_percent =
      state_.current_equity > 0.0 ? margin / state_.current_equity * 100.0
                                  : 0.0;

  bool high = state_.margin_ratio_percent > config_.margin_warning_percent;
  if (!high) {
    margin_warning_active_ = false;
    return "";
  }
  if (margin_warning_active_) {
    return "";
  }
  margin_warning_active_ = true;
  std::ostringstream warning;
  warning << "high margin usage: " << state_.margin_ratio_percent << "% > "
          << config_.margin_warning_percent << "%";
  std::cerr << "[RiskManager] WARNING: " << warning.str() << "\n";
  return warning.str();
}

bool RiskManager::partialProfitReached(const domain::Position& position) const {
  if (!(position.average_price > 0.0) || !(position.mark_price > 0.0)) {
    return false;
  }
  if (position.isLong()) {
    return position.mark_price >=
           position.average_price * config_.partial_profit_multiple;
  }
  return position.mark_price <=
         position.average_price / config_.partial_profit_multiple;
}

domain::OrderIntent RiskManager::stopIntent(
    const domain::Position& position) const {
  domain::OrderIntent intent;
  intent.kind = domain::OrderIntent::Kind::Place;
  intent.source = domain::IntentSource::Risk;
  intent.slot = kBreakevenStopSlot;
  intent.request.symbol = symbol_;
  intent.request.side = closingSide(position);
  intent.request.type = domain::OrderType::Stop;
  intent.request.price = position.average_price;
  intent.request.quantity = std::abs(position.net_quantity);
  intent.request.reduce_only = true;
  intent.reason = "breakeven stop";
  return intent;
}

domain::OrderIntent RiskManager::cancelStopIntent(
    const std::string& reason) const {
  domain::OrderIntent intent;
  intent.kind = domain::OrderIntent::Kind::Cancel;
  intent.source = domain::IntentSource::Risk;
  intent.slot = kBreakevenStopSlot;
  intent.cancel_id = state_.breakeven_stop_order_id;
  intent.request.symbol = symbol_;
  intent.reason = reason;
  return intent;
}

void RiskManager::clearPositionFlags() {
  state_.breakeven_armed = false;
  state_.partial_profit_taken = false;
  state_.breakeven_stop_price = 0.0;
  state_.breakeven_stop_quantity = 0.0;
  state_.breakeven_stop_order_id = 0;
  stop_rejections_ = 0;
}

}  // namespace gridcore
