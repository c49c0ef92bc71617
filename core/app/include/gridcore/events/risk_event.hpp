#pragma once

#include "gridcore/domain/risk_state.hpp"
#include "gridcore/events/event_types.hpp"

#include <string>

namespace gridcore {

// -----------------------------------------------------------------------------
// RiskEvent
// -----------------------------------------------------------------------------
// Published by TradingSession whenever RiskManager::evaluate() returns an
// action other than None. current_value / limit_value carry the metric that
// crossed its threshold (drawdown %, unrealized pnl, mark price).
// -----------------------------------------------------------------------------
struct RiskEvent {
  std::string symbol;
  domain::RiskAction action{domain::RiskAction::None};
  std::string reason;
  double current_value{0.0};
  double limit_value{0.0};
  Timestamp timestamp{};
};

}  // namespace gridcore
