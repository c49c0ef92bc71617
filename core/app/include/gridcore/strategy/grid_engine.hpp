#pragma once

#include "gridcore/config/bot_config.hpp"
#include "gridcore/domain/grid_level.hpp"
#include "gridcore/domain/market.hpp"
#include "gridcore/domain/order.hpp"
#include "gridcore/domain/order_intent.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace gridcore {

// Price band of a grid: either a percent band around the seed price or
// explicit inclusive bounds.
struct GridRange {
  bool explicit_bounds{false};
  double range_percent{0.0};
  double lower{0.0};
  double upper{0.0};

  static GridRange percent(double range_percent) {
    GridRange r;
    r.range_percent = range_percent;
    return r;
  }

  static GridRange bounds(double lower, double upper) {
    GridRange r;
    r.explicit_bounds = true;
    r.lower = lower;
    r.upper = upper;
    return r;
  }

  static GridRange fromConfig(const config::GridConfig& cfg) {
    return cfg.hasExplicitBounds() ? bounds(*cfg.lower_price, *cfg.upper_price)
                                   : percent(cfg.range_percent);
  }
};

// Persisted form of the grid.
struct GridSnapshot {
  double reference_price{0.0};
  double lower_price{0.0};
  double upper_price{0.0};
  std::vector<domain::GridLevel> levels;
};

inline bool operator==(const GridSnapshot& a, const GridSnapshot& b) {
  return a.reference_price == b.reference_price &&
         a.lower_price == b.lower_price && a.upper_price == b.upper_price &&
         a.levels == b.levels;
}

// -----------------------------------------------------------------------------
// GridEngine: ladder of limit orders that buys low and sells high
// -----------------------------------------------------------------------------
//
// @brief  Maintains a fixed set of price levels and, for each, at most one
//         live order. A filled level is immediately replaced by an order on
//         the opposite side, offset by the configured profit margin.
//
// @details
// Level generation (initialize):
//   Percent band  level_count + 1 equally spaced points over
//                 [ref*(1-p), ref*(1+p)], minus the point nearest the
//                 reference (ties: the upper one). With an even count the
//                 dropped point is the reference itself, so the grid is
//                 symmetric: 60000 / 3% / 20 gives 10 buys 58200..59820 and
//                 10 sells 60180..61800, step 180.
//   Bounds        level_count points, both bounds included.
//   Levels priced below the reference buy, the rest sell.
//
// Per-tick flow (onTick):
//   1. Fills matching an Open level's order id accumulate. A level whose
//      size is fully filled becomes Filled and is replaced in the same step:
//      opposite side, price * (1 +/- offset), order id cleared, Pending.
//      A fill that matches no Open level is ignored, so a stale or
//      duplicated fill can never flip a level twice.
//   2. Cancelled levels are re-armed (Pending).
//   3. Every Pending level yields one Place intent (limit order).
//
// Placement outcome (reported by the session, same tick):
//   onOrderPlaced    Pending -> Open
//   onOrderRejected  Pending -> Cancelled, or Parked once rejections
//                    reach max_placement_retries
// A placement that timed out is reported as neither: the level stays
// Pending until reconciliation either adopts the order it finds on the
// exchange (pendingLevelFor + onOrderPlaced) or finds none, in which case
// the level is placed again.
//
// Thread model: tick thread only. Not thread-safe.
// -----------------------------------------------------------------------------
class GridEngine {
 public:
  GridEngine(std::string symbol, config::GridConfig config);

  // Throws std::invalid_argument for a non-positive reference or size, fewer
  // than two levels, or an empty band.
  void initialize(double reference_price, const GridRange& range,
                  int level_count, double order_size);

  // Same, with range, count and size taken from the configuration.
  void initialize(double reference_price);

  std::vector<domain::OrderIntent> onTick(
      double current_price, const std::vector<domain::Fill>& fills);

  void onOrderPlaced(std::size_t level_index, domain::OrderId order_id);

  void onOrderRejected(std::size_t level_index, const std::string& reason);

  // The level's order disappeared from the exchange (reconciliation).
  void onOrderMissing(domain::OrderId order_id);

  // Index of the Pending level an untracked exchange order would fill: same
  // side, same limit price, same size.
  std::optional<std::size_t> pendingLevelFor(const domain::Order& order) const;

  // Cancel intents for every live order; the ladder is cleared.
  std::vector<domain::OrderIntent> reset();

  void restore(const GridSnapshot& snapshot);

  GridSnapshot snapshot() const;

  bool initialized() const { return initialized_; }
  const std::vector<domain::GridLevel>& levels() const { return levels_; }
  std::size_t countInState(domain::GridLevelState state) const;
  std::size_t countOnSide(domain::Side side) const;
  double referencePrice() const { return reference_price_; }

 private:
  void applyFill(const domain::Fill& fill);
  void flip(domain::GridLevel& level);
  domain::GridLevel* levelAt(std::size_t index, const char* caller);

  const std::string symbol_;
  const config::GridConfig config_;

  bool initialized_{false};
  double reference_price_{0.0};
  double lower_price_{0.0};
  double upper_price_{0.0};
  std::vector<domain::GridLevel> levels_;
};

}  // namespace gridcore
