#pragma once

#include "gridcore/events/event.hpp"

namespace gridcore {

// -----------------------------------------------------------------------------
// INotifier
// -----------------------------------------------------------------------------
// Fire-and-forget sink for the audit trail and operator alerts. The core
// never waits for, or depends on, delivery: implementations must return
// promptly and must not throw.
// -----------------------------------------------------------------------------
class INotifier {
 public:
  virtual ~INotifier() = default;

  virtual void record(const Event& event) = 0;

  virtual void alert(const AlertEvent& alert) = 0;
};

}  // namespace gridcore
