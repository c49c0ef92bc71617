#pragma once

#include "gridcore/domain/position.hpp"
#include "gridcore/domain/risk_state.hpp"
#include "gridcore/state/order_book_state.hpp"
#include "gridcore/strategy/dca_engine.hpp"
#include "gridcore/strategy/grid_engine.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace gridcore {

// -----------------------------------------------------------------------------
// SessionSnapshot
// -----------------------------------------------------------------------------
// Everything needed to resume a session after a restart, and the immutable
// value published to readers (IPC STATUS) at the end of every tick.
//
// Saved through IStateStore after each state-changing tick. Restoring a
// snapshot and saving it again must produce an identical value: doubles are
// stored in shortest round-trip form.
// -----------------------------------------------------------------------------
struct SessionSnapshot {
  std::string symbol;
  std::uint64_t tick_sequence{0};
  std::int64_t timestamp_ms{0};
  double last_price{0.0};
  double equity{0.0};
  domain::Position position;
  domain::RiskState risk;
  GridSnapshot grid;
  DcaSnapshot dca;
  std::vector<TrackedOrder> open_orders;
};

inline bool operator==(const SessionSnapshot& a, const SessionSnapshot& b) {
  return a.symbol == b.symbol && a.tick_sequence == b.tick_sequence &&
         a.timestamp_ms == b.timestamp_ms && a.last_price == b.last_price &&
         a.equity == b.equity && a.position == b.position &&
         a.risk == b.risk && a.grid == b.grid && a.dca == b.dca &&
         a.open_orders == b.open_orders;
}

inline bool operator!=(const SessionSnapshot& a, const SessionSnapshot& b) {
  return !(a == b);
}

}  // namespace gridcore
