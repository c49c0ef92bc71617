#pragma once

namespace gridcore {
namespace domain {

// -----------------------------------------------------------------------------
// OrderStatus
// -----------------------------------------------------------------------------
// Lifecycle of an exchange order as seen by OrderBookState. Orders enter as
// Accepted once the exchange returned an id for them; the grid/DCA/risk
// engines never see the intermediate network round-trip.
// -----------------------------------------------------------------------------
enum class OrderStatus {
  Accepted,         // Resting on the exchange book
  PartiallyFilled,  // Some quantity filled, remainder still resting
  Filled,           // Fully filled, terminal
  Canceled,         // Canceled by us or vanished on the exchange, terminal
  Rejected,         // Refused by the exchange, terminal
};

inline const char* toString(OrderStatus s) {
  switch (s) {
    case OrderStatus::Accepted:        return "Accepted";
    case OrderStatus::PartiallyFilled: return "PartiallyFilled";
    case OrderStatus::Filled:          return "Filled";
    case OrderStatus::Canceled:        return "Canceled";
    case OrderStatus::Rejected:        return "Rejected";
  }
  return "Unknown";
}

inline bool isTerminal(OrderStatus s) {
  return s == OrderStatus::Filled || s == OrderStatus::Canceled ||
         s == OrderStatus::Rejected;
}

}  // namespace domain
}  // namespace gridcore
