#pragma once

#include "gridcore/domain/order_status.hpp"

#include <cstdint>
#include <string>

namespace gridcore {
namespace domain {

// Exchange-assigned order identifier. 0 means "no order" (an empty grid
// level, an entry that has not been placed yet).
using OrderId = std::uint64_t;

enum class Side {
  Buy,
  Sell,
};

enum class OrderType {
  Limit,   // Rests at price until crossed
  Market,  // Fills immediately at the mark
  Stop,    // Becomes a market order once the mark touches price
};

inline Side opposite(Side s) {
  return s == Side::Buy ? Side::Sell : Side::Buy;
}

inline const char* toString(Side s) {
  switch (s) {
    case Side::Buy:  return "Buy";
    case Side::Sell: return "Sell";
  }
  return "Unknown";
}

inline const char* toString(OrderType t) {
  switch (t) {
    case OrderType::Limit:  return "Limit";
    case OrderType::Market: return "Market";
    case OrderType::Stop:   return "Stop";
  }
  return "Unknown";
}

// -----------------------------------------------------------------------------
// OrderRequest
// -----------------------------------------------------------------------------
// What the core asks the exchange to do. `price` is ignored for Market
// orders and is the trigger price for Stop orders. `reduce_only` orders can
// only shrink the open position (flatten, partial take-profit, breakeven
// stop).
// -----------------------------------------------------------------------------
struct OrderRequest {
  std::string symbol;
  Side side{Side::Buy};
  OrderType type{OrderType::Limit};
  double quantity{0.0};
  double price{0.0};
  bool reduce_only{false};
};

// -----------------------------------------------------------------------------
// Order
// -----------------------------------------------------------------------------
// An order acknowledged by the exchange.
// -----------------------------------------------------------------------------
struct Order {
  OrderId id{};
  std::string symbol;
  Side side{Side::Buy};
  OrderType type{OrderType::Limit};
  double quantity{0.0};
  double price{0.0};
  bool reduce_only{false};
  OrderStatus status{OrderStatus::Accepted};
  double filled_quantity{0.0};  // Cumulative (partial fills)
};

inline Order makeOrder(OrderId id, const OrderRequest& request) {
  Order order;
  order.id = id;
  order.symbol = request.symbol;
  order.side = request.side;
  order.type = request.type;
  order.quantity = request.quantity;
  order.price = request.price;
  order.reduce_only = request.reduce_only;
  return order;
}

inline bool operator==(const Order& a, const Order& b) {
  return a.id == b.id && a.symbol == b.symbol && a.side == b.side &&
         a.type == b.type && a.quantity == b.quantity && a.price == b.price &&
         a.reduce_only == b.reduce_only && a.status == b.status &&
         a.filled_quantity == b.filled_quantity;
}

}  // namespace domain
}  // namespace gridcore
