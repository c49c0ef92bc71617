#pragma once

#include "gridcore/domain/order.hpp"
#include "gridcore/domain/order_intent.hpp"
#include "gridcore/domain/order_status.hpp"
#include "gridcore/events/event_types.hpp"

namespace gridcore {

// -----------------------------------------------------------------------------
// OrderUpdateEvent
// -----------------------------------------------------------------------------
// Published by OrderBookState on every accepted lifecycle transition. For a
// newly tracked order previous_status equals order.status.
// -----------------------------------------------------------------------------
struct OrderUpdateEvent {
  domain::Order order;
  domain::OrderStatus previous_status{domain::OrderStatus::Accepted};
  domain::IntentSource owner{domain::IntentSource::Grid};
  Timestamp timestamp{};
};

}  // namespace gridcore
