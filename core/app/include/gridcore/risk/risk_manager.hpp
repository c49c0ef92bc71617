#pragma once

#include "gridcore/config/bot_config.hpp"
#include "gridcore/domain/order_intent.hpp"
#include "gridcore/domain/position.hpp"
#include "gridcore/domain/risk_state.hpp"
#include "gridcore/risk/equity_history.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace gridcore {

// Outcome of one risk evaluation. `intents` may be non-empty with action
// None: replacing the breakeven stop after the entry moved, or cancelling a
// stop left behind by a closed position.
struct RiskDecision {
  domain::RiskAction action{domain::RiskAction::None};
  std::vector<domain::OrderIntent> intents;
  std::string reason;
  double current_value{0.0};
  double limit_value{0.0};
  // Raised alongside any action; the session turns it into a warning alert.
  std::string warning;
};

// -----------------------------------------------------------------------------
// RiskManager: threshold risk controls
// -----------------------------------------------------------------------------
//
// @brief  Drawdown kill switch, breakeven stop and one-shot partial profit,
//         evaluated once per tick after the engines have produced intents.
//
// @details
// At most one action per evaluation, by precedence:
//
//   KillSwitch         drawdown (peak - equity) / peak >= max_drawdown_percent.
//                      Fires once and latches until resetSession(). Intents:
//                      CancelAll, then Flatten (reduce-only market order for
//                      the whole position, omitted when flat).
//   ArmBreakeven       unrealized pnl above breakeven_buffer_percent of the
//                      position notional. Places a reduce-only stop at the
//                      average entry, once per position.
//   TakePartialProfit  mark >= entry * multiple (long) or
//                      mark <= entry / multiple (short). Reduce-only market
//                      order for partial_profit_percent of the position,
//                      once per position.
//
// While the breakeven stop is armed it follows the position: if the entry
// price or the size changes, the stop is replaced (Cancel + Place). When
// the position returns to flat the per-position flags are cleared.
//
// Kill switch state lives in RiskState so it survives restarts; a restored
// session that had fired the kill switch stays halted. Firing also sets
// wind_down_pending: until the session confirms a flat position and an
// empty book (onWindDownComplete), windDown() rebuilds the cancel and
// flatten intents from the latest exchange position.
//
// Margin usage (position margin / equity) is tracked every evaluation. A
// warning is attached to the decision when it first rises above
// margin_warning_percent, and again only after it has dropped back below.
//
// Thread model: tick thread only.
// -----------------------------------------------------------------------------
class RiskManager {
 public:
  // Slots identifying risk-owned orders in OrderIntent::slot.
  static constexpr std::size_t kBreakevenStopSlot = 0;
  static constexpr std::size_t kPartialProfitSlot = 1;
  static constexpr std::size_t kFlattenSlot = 2;

  RiskManager(std::string symbol, config::RiskConfig config);

  RiskDecision evaluate(const domain::Position& position,
                        const EquityHistory& equity);

  // Operator emergency stop. Returns action None if already latched.
  RiskDecision triggerKillSwitch(const std::string& reason,
                                 const domain::Position& position);

  // CancelAll, plus Flatten unless `position` is flat.
  std::vector<domain::OrderIntent> windDown(
      const domain::Position& position) const;
  void onWindDownComplete();
  bool windDownPending() const { return state_.wind_down_pending; }

  void onStopPlaced(domain::OrderId order_id);
  void onStopRejected(const std::string& reason);
  // The stop vanished on the exchange; it is re-placed on the next tick.
  void onOrderMissing(domain::OrderId order_id);

  // Clears the latch and every per-position flag, re-seeds the peak.
  void resetSession(double equity);

  void restore(const domain::RiskState& state);
  const domain::RiskState& state() const { return state_; }
  bool killSwitchArmed() const { return state_.kill_switch_armed; }

 private:
  static constexpr int kMaxStopRejections = 3;
  static constexpr int kRestoredSign = 2;

  RiskDecision evaluatePosition(const domain::Position& position);
  void updateEquity(const EquityHistory& equity);
  std::string checkMargin(const domain::Position& position);
  RiskDecision killSwitch(const std::string& reason,
                          const domain::Position& position);
  bool partialProfitReached(const domain::Position& position) const;
  domain::OrderIntent stopIntent(const domain::Position& position) const;
  domain::OrderIntent cancelStopIntent(const std::string& reason) const;
  void clearPositionFlags();

  const std::string symbol_;
  const config::RiskConfig config_;
  domain::RiskState state_;
  int position_sign_{0};  // -1, 0, +1 as seen last tick, or kRestoredSign
  int stop_rejections_{0};
  bool margin_warning_active_{false};
};

}  // namespace gridcore
