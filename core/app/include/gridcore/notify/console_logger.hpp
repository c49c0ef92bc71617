#pragma once

#include "gridcore/eventbus/event_bus.hpp"

#include <iosfwd>
#include <mutex>
#include <string>

namespace gridcore {

// -----------------------------------------------------------------------------
// ConsoleLogger
// -----------------------------------------------------------------------------
// @brief  Prints every audit event as one human-readable line.
//
// @details
// Subscribes to the whole Event variant in the constructor and unsubscribes
// in the destructor (RAII). Info events go to `out`, Warning/Critical
// alerts and risk actions to `err`. Lines carry a [Component] prefix.
//
// Thread model: the callback runs on whichever thread publishes (tick
// thread, supervisor thread). Writes to a single stream are line-buffered
// by a private mutex so lines from two threads never interleave.
// -----------------------------------------------------------------------------
class ConsoleLogger {
 public:
  ConsoleLogger(EventBus& bus, std::ostream& out, std::ostream& err);

  ~ConsoleLogger();

  ConsoleLogger(const ConsoleLogger&) = delete;
  ConsoleLogger& operator=(const ConsoleLogger&) = delete;
  ConsoleLogger(ConsoleLogger&&) = delete;
  ConsoleLogger& operator=(ConsoleLogger&&) = delete;

  // Formats a single event; exposed for tests.
  static std::string format(const Event& event);

 private:
  void onEvent(const Event& event);

  EventBus& bus_;
  std::ostream& out_;
  std::ostream& err_;
  std::mutex write_mutex_;
  EventBus::SubscriptionId subscription_id_{0};
};

}  // namespace gridcore
