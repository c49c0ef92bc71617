#pragma once

#include "gridcore/config/bot_config.hpp"
#include "gridcore/domain/dca_entry.hpp"
#include "gridcore/domain/order_intent.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace gridcore {

// Persisted form of the DCA ladder.
struct DcaSnapshot {
  double reference_price{0.0};
  std::size_t next_sequence{1};
  std::vector<domain::DcaLadderEntry> entries;
};

inline bool operator==(const DcaSnapshot& a, const DcaSnapshot& b) {
  return a.reference_price == b.reference_price &&
         a.next_sequence == b.next_sequence && a.entries == b.entries;
}

// -----------------------------------------------------------------------------
// DcaEngine: trend-following averaging ladder
// -----------------------------------------------------------------------------
//
// @brief  Adds to the position with market orders each time price moves
//         trigger_percent against it from the trend reference.
//
// @details
// Long ladder: displacement = (reference - price) / reference.
// Short ladder: displacement = (price - reference) / reference.
//
// When displacement >= trigger_percent / 100 and fewer than max_orders
// entries are active, one market order sized
//   order_size * scaling_factor^(i - 1)      (i = active entries + 1)
// is emitted, the entry appended and the reference ratcheted to the current
// price. At max_orders further triggers are no-ops until reset().
//
// Recovery: once price comes back recovery_percent past the latest entry's
// trigger price the ladder is reset around the current price.
//
// Entry sequences run 1..max_orders within one ladder and start over at 1
// after reset(). Rejected entries are parked (status Rejected); they do not
// count toward max_orders, so the next entry reuses the parked sequence.
//
// Thread model: tick thread only.
// -----------------------------------------------------------------------------
class DcaEngine {
 public:
  DcaEngine(std::string symbol, config::DcaConfig config);

  void start(double reference_price);

  std::vector<domain::OrderIntent> onTick(double current_price,
                                          double trend_reference_price);

  // Uses the engine's own (ratcheted) reference.
  std::vector<domain::OrderIntent> onTick(double current_price);

  void onOrderPlaced(std::size_t sequence, domain::OrderId order_id);
  void onOrderRejected(std::size_t sequence, const std::string& reason);
  void onFill(domain::OrderId order_id, double quantity);

  // Clears the ladder and re-seeds the reference.
  void reset(double new_reference_price);

  void restore(const DcaSnapshot& snapshot);
  DcaSnapshot snapshot() const;

  bool started() const { return started_; }
  bool enabled() const { return config_.enabled; }
  double referencePrice() const { return reference_price_; }
  std::size_t activeEntries() const;
  const std::vector<domain::DcaLadderEntry>& entries() const {
    return entries_;
  }

 private:
  double displacement(double current_price) const;
  bool recovered(double current_price) const;
  domain::DcaLadderEntry* entryFor(std::size_t sequence);

  const std::string symbol_;
  const config::DcaConfig config_;

  bool started_{false};
  double reference_price_{0.0};
  std::size_t next_sequence_{1};
  std::vector<domain::DcaLadderEntry> entries_;
};

}  // namespace gridcore
