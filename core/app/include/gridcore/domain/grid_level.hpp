#pragma once

#include "gridcore/domain/order.hpp"

#include <cstddef>

namespace gridcore {
namespace domain {

// -----------------------------------------------------------------------------
// GridLevelState
// -----------------------------------------------------------------------------
// Finite state machine of a single grid level:
//
//   Pending ──placed──▶ Open ──filled──▶ Filled ──replace──▶ Pending (flipped)
//      ▲                 │
//      │              rejected / vanished
//      │                 ▼
//      └──retry──── Cancelled ──retries exhausted──▶ Parked
//
// Filled is only observable for the instant between the fill and the
// replacement; GridEngine performs both inside one call.
// -----------------------------------------------------------------------------
enum class GridLevelState {
  Pending,    // Needs an order, none live
  Open,       // Exactly one live order (order_id != 0)
  Filled,
  Cancelled,  // Placement failed or the order vanished; will be retried
  Parked,     // Retries exhausted; never placed again until reset
};

inline const char* toString(GridLevelState s) {
  switch (s) {
    case GridLevelState::Pending:   return "Pending";
    case GridLevelState::Open:      return "Open";
    case GridLevelState::Filled:    return "Filled";
    case GridLevelState::Cancelled: return "Cancelled";
    case GridLevelState::Parked:    return "Parked";
  }
  return "Unknown";
}

struct GridLevel {
  std::size_t index{0};
  double price{0.0};
  Side side{Side::Buy};
  double size{0.0};
  OrderId order_id{0};
  GridLevelState state{GridLevelState::Pending};
  double filled_quantity{0.0};
  int rejections{0};
  int cycles{0};  // Completed fill-and-flip round trips
};

inline bool operator==(const GridLevel& a, const GridLevel& b) {
  return a.index == b.index && a.price == b.price && a.side == b.side &&
         a.size == b.size && a.order_id == b.order_id && a.state == b.state &&
         a.filled_quantity == b.filled_quantity &&
         a.rejections == b.rejections && a.cycles == b.cycles;
}

}  // namespace domain
}  // namespace gridcore
