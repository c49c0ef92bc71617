#pragma once

#include "gridcore/domain/market.hpp"
#include "gridcore/domain/order.hpp"
#include "gridcore/domain/order_intent.hpp"
#include "gridcore/domain/order_status.hpp"
#include "gridcore/domain/position.hpp"
#include "gridcore/notify/i_notifier.hpp"
#include "gridcore/time/i_time_provider.hpp"

#include <cstddef>
#include <map>
#include <optional>
#include <vector>

namespace gridcore {

// An open order together with the component that owns it. `slot` is the
// owner's handle for the order (grid level index, DCA entry sequence).
struct TrackedOrder {
  domain::Order order;
  domain::IntentSource owner{domain::IntentSource::Grid};
  std::size_t slot{0};
};

inline bool operator==(const TrackedOrder& a, const TrackedOrder& b) {
  return a.order == b.order && a.owner == b.owner && a.slot == b.slot;
}

// -----------------------------------------------------------------------------
// OrderBookState: the core's view of its open orders and the position
// -----------------------------------------------------------------------------
//
// @brief  Tracks every order placed by the core from acceptance to a
//         terminal state and holds the last reconciled position.
//
// @details
// Orders enter through track() after the exchange accepted them (or
// hydrate() when restored from persistence) and leave when they reach a
// terminal state: fully filled, canceled, or found missing during
// reconciliation. Every status change passes through transitionStatus();
// illegal transitions are logged and ignored, leaving the order as it was.
//
// The position is never derived from fills here. reconcilePosition()
// overwrites it with what the exchange reports, once per tick.
//
// Each accepted transition is recorded as an OrderUpdateEvent on the
// notifier (if one is given).
//
// Thread model: single writer, the tick thread (or the supervisor thread
// while the tick loop is stopped). No internal locking. Other threads read
// the published SessionSnapshot instead.
// -----------------------------------------------------------------------------
class OrderBookState {
 public:
  struct ReconcileResult {
    std::vector<TrackedOrder> missing;       // tracked here, gone on exchange
    std::vector<domain::Order> untracked;    // on exchange, unknown here
  };

  OrderBookState(const ITimeProvider& clock, INotifier* notifier = nullptr);

  OrderBookState(const OrderBookState&) = delete;
  OrderBookState& operator=(const OrderBookState&) = delete;

  // Registers an order the exchange just accepted.
  void track(const domain::Order& order, domain::IntentSource owner,
             std::size_t slot);

  // Restores a previously tracked order without emitting an event.
  void hydrate(const TrackedOrder& tracked);

  // -------------------------------------------------------------------------
  // applyFill(fill)
  // -------------------------------------------------------------------------
  // @brief  Accumulates a fill on its order.
  //
  // @return The updated order (with owner) or std::nullopt when the order id
  //         is not tracked (foreign order, duplicate fill of a finished
  //         order). A fully filled order is removed before returning.
  // -------------------------------------------------------------------------
  std::optional<TrackedOrder> applyFill(const domain::Fill& fill);

  // Moves an order to Canceled and forgets it. Returns false if untracked.
  bool markCanceled(domain::OrderId id);

  // Compares tracked orders with the exchange's open orders. Orders that
  // vanished are marked Canceled, removed and returned.
  ReconcileResult reconcileOpenOrders(
      const std::vector<domain::Order>& exchange_open);

  // Overwrites the position. Returns true if anything changed.
  bool reconcilePosition(const domain::Position& position);

  const domain::Position& position() const { return position_; }

  const TrackedOrder* find(domain::OrderId id) const;

  std::vector<TrackedOrder> openOrders() const;

  std::size_t size() const { return orders_.size(); }

  void clear();

  // Legal transitions:
  //   Accepted        -> PartiallyFilled, Filled, Canceled, Rejected
  //   PartiallyFilled -> PartiallyFilled, Filled, Canceled
  //   terminal        -> (none)
  static bool transitionStatus(domain::OrderStatus current,
                               domain::OrderStatus next);

 private:
  bool advance(TrackedOrder& tracked, domain::OrderStatus next);
  void publish(const TrackedOrder& tracked, domain::OrderStatus previous);

  const ITimeProvider& clock_;
  INotifier* notifier_;
  std::map<domain::OrderId, TrackedOrder> orders_;
  domain::Position position_;
};

}  // namespace gridcore
