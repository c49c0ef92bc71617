#pragma once

#include "gridcore/eventbus/event_bus.hpp"
#include "gridcore/notify/i_notifier.hpp"

namespace gridcore {

// -----------------------------------------------------------------------------
// EventBusNotifier
// -----------------------------------------------------------------------------
// Bridges INotifier onto an EventBus so any number of sinks (console log,
// IPC telemetry, tests) can observe the same stream. Alerts are published
// as the AlertEvent alternative.
//
// Ownership: holds a reference; the bus must outlive the notifier.
// -----------------------------------------------------------------------------
class EventBusNotifier final : public INotifier {
 public:
  explicit EventBusNotifier(EventBus& bus) : bus_(bus) {}

  void record(const Event& event) override { bus_.publish(event); }

  void alert(const AlertEvent& alert) override { bus_.publish(alert); }

 private:
  EventBus& bus_;
};

}  // namespace gridcore
