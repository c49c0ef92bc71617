#pragma once

#include "gridcore/events/event.hpp"

#include <cstddef>
#include <functional>
#include <mutex>
#include <utility>
#include <vector>

namespace gridcore {

// -----------------------------------------------------------------------------
// EventBus
// -----------------------------------------------------------------------------
// @brief  Synchronous in-process publish/subscribe for audit events.
//
// @details
// publish() invokes every subscriber on the publishing thread, in
// subscription order. The subscriber list is copied under the lock and
// callbacks run without it, so a callback may subscribe or unsubscribe
// without deadlocking (the change takes effect on the next publish).
//
// Subscribers must be cheap and must not throw: the tick thread publishes
// and a slow sink would stretch the tick. Sinks that do I/O (the IPC
// telemetry socket) only enqueue.
//
// Thread-safety: subscribe/unsubscribe/publish are safe from any thread.
// -----------------------------------------------------------------------------
class EventBus {
 public:
  using GenericCallback = std::function<void(const Event&)>;
  using SubscriptionId = std::size_t;

  EventBus() = default;

  EventBus(const EventBus&) = delete;
  EventBus& operator=(const EventBus&) = delete;

  SubscriptionId subscribe(GenericCallback callback);

  // Receives only events holding the EventType alternative.
  template <typename EventType>
  SubscriptionId subscribe(std::function<void(const EventType&)> callback);

  void unsubscribe(SubscriptionId id);

  void publish(const Event& event);

  std::size_t subscriberCount() const;

 private:
  using SubscriberEntry = std::pair<SubscriptionId, GenericCallback>;

  mutable std::mutex mutex_;
  SubscriptionId next_id_{0};
  std::vector<SubscriberEntry> subscribers_;
};

template <typename EventType>
EventBus::SubscriptionId EventBus::subscribe(
    std::function<void(const EventType&)> callback) {
  GenericCallback filtered = [cb = std::move(callback)](const Event& event) {
    if (const auto* typed = std::get_if<EventType>(&event)) {
      cb(*typed);
    }
  };
  return subscribe(std::move(filtered));
}

}  // namespace gridcore
