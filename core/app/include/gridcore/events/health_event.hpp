#pragma once

#include "gridcore/domain/health_status.hpp"
#include "gridcore/events/event_types.hpp"

#include <string>

namespace gridcore {

// One Supervisor state transition (or a suppressed restart, in which case
// previous_state == status.state).
struct HealthEvent {
  domain::SupervisorState previous_state{domain::SupervisorState::Starting};
  domain::HealthStatus status;
  std::string message;
  Timestamp timestamp{};
};

}  // namespace gridcore
