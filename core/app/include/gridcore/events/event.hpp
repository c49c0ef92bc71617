#pragma once

#include "gridcore/events/event_types.hpp"
#include "gridcore/events/health_event.hpp"
#include "gridcore/events/order_update_event.hpp"
#include "gridcore/events/position_update_event.hpp"
#include "gridcore/events/risk_event.hpp"

#include <variant>

namespace gridcore {

// -----------------------------------------------------------------------------
// Event
// -----------------------------------------------------------------------------
// Closed set of audit-trail events. Subscribers pick the alternatives they
// care about with EventBus::subscribe<T>() (std::get_if under the hood);
// adding an alternative never breaks existing subscribers.
// -----------------------------------------------------------------------------
using Event = std::variant<
    TickEvent,
    OrderUpdateEvent,
    FillEvent,
    PositionUpdateEvent,
    RiskEvent,
    HealthEvent,
    AlertEvent>;

}  // namespace gridcore
