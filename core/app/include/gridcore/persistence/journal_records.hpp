#pragma once

#include "gridcore/domain/market.hpp"
#include "gridcore/domain/order_intent.hpp"

#include <cstdint>

namespace gridcore {

// -----------------------------------------------------------------------------
// Journal records
// -----------------------------------------------------------------------------
// Append-only history kept next to the snapshot: one TradeRecord per fill
// the session saw, one EquityRecord per equity sample. Neither is read back
// on restore; they exist for reporting.
// -----------------------------------------------------------------------------

struct TradeRecord {
  domain::Fill fill;
  // Engine that owned the order; meaningless when owned is false.
  domain::IntentSource owner{domain::IntentSource::Grid};
  bool owned{false};
};

struct EquityRecord {
  std::int64_t timestamp_ms{0};
  double balance{0.0};  // equity without unrealized PnL
  double equity{0.0};
  double unrealized_pnl{0.0};
  double realized_pnl{0.0};
  double drawdown_percent{0.0};
  double margin_ratio_percent{0.0};
};

}  // namespace gridcore
