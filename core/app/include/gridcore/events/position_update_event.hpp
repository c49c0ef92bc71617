#pragma once

#include "gridcore/domain/position.hpp"
#include "gridcore/events/event_types.hpp"

namespace gridcore {

// Reconciled exchange position, published when it differs from the last
// reconciled value.
struct PositionUpdateEvent {
  domain::Position position;
  double equity{0.0};
  Timestamp timestamp{};
};

}  // namespace gridcore
