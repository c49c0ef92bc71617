#pragma once

#include "gridcore/domain/order.hpp"

#include <cstdint>
#include <string>

namespace gridcore {
namespace domain {

// Price observed at one tick. Immutable once the tick has started.
struct PriceSnapshot {
  std::string symbol;
  double price{0.0};
  std::int64_t timestamp_ms{0};
};

// One execution reported by the exchange's fill stream. A single order may
// produce several fills (partial fills); quantities are per-fill, not
// cumulative.
struct Fill {
  OrderId order_id{0};
  std::string symbol;
  Side side{Side::Buy};
  double price{0.0};
  double quantity{0.0};
  std::int64_t timestamp_ms{0};
};

}  // namespace domain
}  // namespace gridcore
