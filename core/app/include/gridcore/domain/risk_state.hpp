#pragma once

#include "gridcore/domain/order.hpp"

namespace gridcore {
namespace domain {

// -----------------------------------------------------------------------------
// RiskState
// -----------------------------------------------------------------------------
// Persisted state of the RiskManager.
//
// Invariants:
//   - peak_equity never decreases until RiskManager::resetSession().
//   - once kill_switch_armed is true it stays true until resetSession().
//   - breakeven_armed / partial_profit_taken are per position; they are
//     cleared when the position returns to flat.
//   - max_drawdown_percent is the deepest drawdown seen this session.
//   - wind_down_pending: the kill switch fired but the exchange has not yet
//     confirmed a flat position with no open orders. Cleared only by that
//     confirmation.
// -----------------------------------------------------------------------------
struct RiskState {
  double peak_equity{0.0};
  double current_equity{0.0};
  double drawdown_percent{0.0};
  double max_drawdown_percent{0.0};
  double margin_ratio_percent{0.0};  // position margin / equity
  bool breakeven_armed{false};
  bool partial_profit_taken{false};
  bool kill_switch_armed{false};
  bool wind_down_pending{false};
  double breakeven_stop_price{0.0};
  double breakeven_stop_quantity{0.0};
  OrderId breakeven_stop_order_id{0};
};

inline bool operator==(const RiskState& a, const RiskState& b) {
  return a.peak_equity == b.peak_equity &&
         a.current_equity == b.current_equity &&
         a.drawdown_percent == b.drawdown_percent &&
         a.max_drawdown_percent == b.max_drawdown_percent &&
         a.margin_ratio_percent == b.margin_ratio_percent &&
         a.breakeven_armed == b.breakeven_armed &&
         a.partial_profit_taken == b.partial_profit_taken &&
         a.kill_switch_armed == b.kill_switch_armed &&
         a.wind_down_pending == b.wind_down_pending &&
         a.breakeven_stop_price == b.breakeven_stop_price &&
         a.breakeven_stop_quantity == b.breakeven_stop_quantity &&
         a.breakeven_stop_order_id == b.breakeven_stop_order_id;
}

enum class RiskAction {
  None,
  ArmBreakeven,
  TakePartialProfit,
  KillSwitch,
};

inline const char* toString(RiskAction a) {
  switch (a) {
    case RiskAction::None:              return "None";
    case RiskAction::ArmBreakeven:      return "ArmBreakeven";
    case RiskAction::TakePartialProfit: return "TakePartialProfit";
    case RiskAction::KillSwitch:        return "KillSwitch";
  }
  return "Unknown";
}

}  // namespace domain
}  // namespace gridcore
