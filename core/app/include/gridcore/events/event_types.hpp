#pragma once

#include "gridcore/domain/market.hpp"
#include "gridcore/domain/order_intent.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

namespace gridcore {

using Timestamp = std::chrono::system_clock::time_point;

// -----------------------------------------------------------------------------
// TickEvent
// -----------------------------------------------------------------------------
// Emitted once at the end of every completed tick. Carries counters only;
// the full state is in the published SessionSnapshot.
// -----------------------------------------------------------------------------
struct TickEvent {
  std::string symbol;
  double price{0.0};
  std::uint64_t tick_sequence{0};
  std::size_t fills{0};
  std::size_t intents_submitted{0};
  std::size_t intents_failed{0};
  Timestamp timestamp{};
};

// A fill routed to the component that owns the order.
struct FillEvent {
  domain::Fill fill;
  domain::IntentSource owner{domain::IntentSource::Grid};
  bool owned{true};  // false when the order id was unknown to OrderBookState
  Timestamp timestamp{};
};

enum class AlertSeverity {
  Info,
  Warning,
  Critical,
};

inline const char* toString(AlertSeverity s) {
  switch (s) {
    case AlertSeverity::Info:     return "Info";
    case AlertSeverity::Warning:  return "Warning";
    case AlertSeverity::Critical: return "Critical";
  }
  return "Unknown";
}

// Something an operator must see: kill switch, restart budget exhausted,
// unrecoverable error. Delivered through INotifier::alert().
struct AlertEvent {
  AlertSeverity severity{AlertSeverity::Warning};
  std::string source;
  std::string message;
  Timestamp timestamp{};
};

}  // namespace gridcore
