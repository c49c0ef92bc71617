#pragma once

#include <cmath>
#include <string>

namespace gridcore {
namespace domain {

// -----------------------------------------------------------------------------
// Position
// -----------------------------------------------------------------------------
// Open exposure for one symbol as reported by the exchange. The core never
// computes a position on its own: OrderBookState only overwrites its copy
// during reconciliation so the exchange stays the source of truth.
//
// Sign convention: net_quantity > 0 long, < 0 short, == 0 flat.
// -----------------------------------------------------------------------------
struct Position {
  std::string symbol;
  double net_quantity{0.0};
  double average_price{0.0};   // Weighted avg entry of the open quantity
  double mark_price{0.0};
  double unrealized_pnl{0.0};
  double realized_pnl{0.0};
  int leverage{1};

  bool isFlat() const { return std::abs(net_quantity) < 1e-12; }
  bool isLong() const { return net_quantity > 0.0 && !isFlat(); }
  bool isShort() const { return net_quantity < 0.0 && !isFlat(); }
  double notional() const { return std::abs(net_quantity) * average_price; }
};

inline bool operator==(const Position& a, const Position& b) {
  return a.symbol == b.symbol && a.net_quantity == b.net_quantity &&
         a.average_price == b.average_price && a.mark_price == b.mark_price &&
         a.unrealized_pnl == b.unrealized_pnl &&
         a.realized_pnl == b.realized_pnl && a.leverage == b.leverage;
}

}  // namespace domain
}  // namespace gridcore
