#pragma once

#include "gridcore/domain/order.hpp"

#include <cstddef>

namespace gridcore {
namespace domain {

enum class DcaEntryStatus {
  Pending,   // Intent emitted, exchange has not answered yet
  Open,      // Market order accepted, waiting for the fill report
  Filled,
  Rejected,  // Parked: does not count toward max_orders
};

inline const char* toString(DcaEntryStatus s) {
  switch (s) {
    case DcaEntryStatus::Pending:  return "Pending";
    case DcaEntryStatus::Open:     return "Open";
    case DcaEntryStatus::Filled:   return "Filled";
    case DcaEntryStatus::Rejected: return "Rejected";
  }
  return "Unknown";
}

// One rung of the DCA ladder. `sequence` starts at 1 and the size of rung i
// is base_size * scaling_factor^(i-1), recorded here as size_multiplier.
struct DcaLadderEntry {
  std::size_t sequence{1};
  double trigger_price{0.0};
  double size_multiplier{1.0};
  double size{0.0};
  OrderId order_id{0};
  DcaEntryStatus status{DcaEntryStatus::Pending};
  double filled_quantity{0.0};
};

inline bool isActive(const DcaLadderEntry& e) {
  return e.status != DcaEntryStatus::Rejected;
}

inline bool operator==(const DcaLadderEntry& a, const DcaLadderEntry& b) {
  return a.sequence == b.sequence && a.trigger_price == b.trigger_price &&
         a.size_multiplier == b.size_multiplier && a.size == b.size &&
         a.order_id == b.order_id && a.status == b.status &&
         a.filled_quantity == b.filled_quantity;
}

}  // namespace domain
}  // namespace gridcore
