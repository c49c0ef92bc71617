#pragma once

#include "gridcore/domain/order.hpp"

#include <cstddef>
#include <string>

namespace gridcore {
namespace domain {

// Component that asked for an order. Also the owner recorded in
// OrderBookState so fills can be routed back.
enum class IntentSource {
  Grid,
  Dca,
  Risk,
};

inline const char* toString(IntentSource s) {
  switch (s) {
    case IntentSource::Grid: return "Grid";
    case IntentSource::Dca:  return "Dca";
    case IntentSource::Risk: return "Risk";
  }
  return "Unknown";
}

// -----------------------------------------------------------------------------
// OrderIntent
// -----------------------------------------------------------------------------
// A decision produced by an engine during a tick. Engines never talk to the
// exchange directly; TradingSession executes intents and reports the
// outcome back to the owning engine using `slot` (grid level index, DCA
// entry sequence).
//
//   Place      request is submitted as a new order
//   Cancel     cancel_id is canceled
//   CancelAll  every open order for request.symbol is canceled
//   Flatten    request is a reduce-only market order closing the position
// -----------------------------------------------------------------------------
struct OrderIntent {
  enum class Kind { Place, Cancel, CancelAll, Flatten };

  Kind kind{Kind::Place};
  IntentSource source{IntentSource::Grid};
  OrderRequest request;
  OrderId cancel_id{0};
  std::size_t slot{0};
  std::string reason;
};

inline const char* toString(OrderIntent::Kind k) {
  switch (k) {
    case OrderIntent::Kind::Place:     return "Place";
    case OrderIntent::Kind::Cancel:    return "Cancel";
    case OrderIntent::Kind::CancelAll: return "CancelAll";
    case OrderIntent::Kind::Flatten:   return "Flatten";
  }
  return "Unknown";
}

}  // namespace domain
}  // namespace gridcore
