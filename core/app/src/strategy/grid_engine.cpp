#include "gridcore/strategy/grid_engine.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <stdexcept>
#include <utility>

namespace gridcore {

namespace {

constexpr double kQtyEpsilon = 1e-9;

std::vector<double> percentBandPrices(double reference, double range_percent,
                                      int level_count) {
  double lower = reference * (1.0 - range_percent / 100.0);
  double upper = reference * (1.0 + range_percent / 100.0);
  double step = (upper - lower) / level_count;

  std::vector<double> points;
  points.reserve(static_cast<std::size_t>(level_count) + 1);
  for (int k = 0; k <= level_count; ++k) {
    points.push_back(k == level_count ? upper : lower + step * k);
  }

  // Drop the point nearest the reference; on a tie the later (upper) one.
  std::size_t nearest = 0;
  double best = std::abs(points[0] - reference);
  double tolerance = reference * 1e-12;
  for (std::size_t i = 1; i < points.size(); ++i) {
    double distance = std::abs(points[i] - reference);
    if (distance <= best + tolerance) {
      nearest = i;
      best = std::min(best, distance);
    }
  }
  points.erase(points.begin() + static_cast<std::ptrdiff_t>(nearest));
  return points;
}

std::vector<double> boundedPrices(double lower, double upper,
                                  int level_count) {
  double step = (upper - lower) / (level_count - 1);
  std::vector<double> points;
  points.reserve(static_cast<std::size_t>(level_count));
  for (int k = 0; k < level_count; ++k) {
    points.push_back(k == level_count - 1 ? upper : lower + step * k);
  }
  return points;
}

}  // namespace

GridEngine::GridEngine(std::string symbol, config::GridConfig config)
    : symbol_(std::move(symbol)), config_(std::move(config)) {}

void GridEngine::initialize(double reference_price) {
  initialize(reference_price, GridRange::fromConfig(config_), config_.levels,
             config_.order_size);
}

void GridEngine::initialize(double reference_price, const GridRange& range,
                            int level_count, double order_size) {
  if (!(reference_price > 0.0)) {
    throw std::invalid_argument("grid reference price must be positive");
  }
  if (level_count < 2) {
    throw std::invalid_argument("grid needs at least two levels");
  }
  if (!(order_size > 0.0)) {
    throw std::invalid_argument("grid order size must be positive");
  }

  std::vector<double> prices;
  if (range.explicit_bounds) {
    if (!(range.lower > 0.0) || !(range.lower < range.upper)) {
      throw std::invalid_argument("grid bounds must satisfy 0 < lower < upper");
    }
    prices = boundedPrices(range.lower, range.upper, level_count);
    lower_price_ = range.lower;
    upper_price_ = range.upper;
  } else {
    if (!(range.range_percent > 0.0) || !(range.range_percent < 100.0)) {
      throw std::invalid_argument("grid range percent must be in (0, 100)");
    }
    prices = percentBandPrices(reference_price, range.range_percent,
                               level_count);
    lower_price_ = prices.front();
    upper_price_ = prices.back();
  }

  levels_.clear();
  levels_.reserve(prices.size());
  for (std::size_t i = 0; i < prices.size(); ++i) {
    domain::GridLevel level;
    level.index = i;
    level.price = prices[i];
    level.side = prices[i] < reference_price ? domain::Side::Buy
                                             : domain::Side::Sell;
    level.size = order_size;
    levels_.push_back(level);
  }

  reference_price_ = reference_price;
  initialized_ = true;

  std::cout << "[GridEngine] initialized " << levels_.size() << " levels "
            << lower_price_ << " .. " << upper_price_ << " around "
            << reference_price << " (" << countOnSide(domain::Side::Buy)
            << " buy / " << countOnSide(domain::Side::Sell) << " sell)\n";
}

std::vector<domain::OrderIntent> GridEngine::onTick(
    double /*current_price*/, const std::vector<domain::Fill>& fills) {
  std::vector<domain::OrderIntent> intents;
  if (!initialized_) {
    return intents;
  }

  for (const auto& fill : fills) {
    applyFill(fill);
  }

  for (auto& level : levels_) {
    if (level.state == domain::GridLevelState::Cancelled) {
      level.state = domain::GridLevelState::Pending;
    }
  }

  for (const auto& level : levels_) {
    if (level.state != domain::GridLevelState::Pending) {
      continue;
    }
    domain::OrderIntent intent;
    intent.kind = domain::OrderIntent::Kind::Place;
    intent.source = domain::IntentSource::Grid;
    intent.slot = level.index;
    intent.request.symbol = symbol_;
    intent.request.side = level.side;
    intent.request.type = domain::OrderType::Limit;
    intent.request.quantity = level.size;
    intent.request.price = level.price;
    intent.reason = "grid level " + std::to_string(level.index);
    intents.push_back(std::move(intent));
  }
  return intents;
}

void GridEngine::applyFill(const domain::Fill& fill) {
  for (auto& level : levels_) {
    if (level.state != domain::GridLevelState::Open ||
        level.order_id == 0 || level.order_id != fill.order_id) {
      continue;
    }
    level.filled_quantity += fill.quantity;
    if (level.filled_quantity + kQtyEpsilon >= level.size) {
      level.state = domain::GridLevelState::Filled;
      flip(level);
    }
    return;
  }
}

void GridEngine::flip(domain::GridLevel& level) {
  double offset = config_.profit_offset_percent / 100.0;
  double filled_price = level.price;
  domain::Side filled_side = level.side;

  level.side = domain::opposite(filled_side);
  level.price = filled_side == domain::Side::Buy ? filled_price * (1.0 + offset)
                                                 : filled_price * (1.0 - offset);
  level.order_id = 0;
  level.filled_quantity = 0.0;
  level.rejections = 0;
  level.state = domain::GridLevelState::Pending;
  ++level.cycles;

  std::cout << "[GridEngine] level " << level.index << " "
            << domain::toString(filled_side) << " filled at " << filled_price
            << ", replaced by " << domain::toString(level.side) << " at "
            << level.price << "\n";
}

void GridEngine::onOrderPlaced(std::size_t level_index,
                               domain::OrderId order_id) {
  domain::GridLevel* level = levelAt(level_index, "onOrderPlaced");
  if (level == nullptr) {
    return;
  }
  if (level->state != domain::GridLevelState::Pending) {
    std::cerr << "[GridEngine] WARNING: order " << order_id
              << " placed for level " << level_index << " in state "
              << domain::toString(level->state) << "\n";
    return;
  }
  level->order_id = order_id;
  level->filled_quantity = 0.0;
  level->state = domain::GridLevelState::Open;
}

void GridEngine::onOrderRejected(std::size_t level_index,
                                 const std::string& reason) {
  domain::GridLevel* level = levelAt(level_index, "onOrderRejected");
  if (level == nullptr || level->state != domain::GridLevelState::Pending) {
    return;
  }
  level->order_id = 0;
  ++level->rejections;
  if (level->rejections >= config_.max_placement_retries) {
    level->state = domain::GridLevelState::Parked;
    std::cerr << "[GridEngine] level " << level_index << " parked after "
              << level->rejections << " rejections: " << reason << "\n";
  } else {
    level->state = domain::GridLevelState::Cancelled;
    std::cerr << "[GridEngine] level " << level_index << " rejected ("
              << level->rejections << "/" << config_.max_placement_retries
              << "): " << reason << "\n";
  }
}

void GridEngine::onOrderMissing(domain::OrderId order_id) {
  for (auto& level : levels_) {
    if (level.state == domain::GridLevelState::Open &&
        level.order_id == order_id) {
      level.order_id = 0;
      level.filled_quantity = 0.0;
      level.state = domain::GridLevelState::Cancelled;
      return;
    }
  }
}

std::optional<std::size_t> GridEngine::pendingLevelFor(
    const domain::Order& order) const {
  if (order.type != domain::OrderType::Limit) {
    return std::nullopt;
  }
  for (const auto& level : levels_) {
    if (level.state != domain::GridLevelState::Pending ||
        level.side != order.side) {
      continue;
    }
    double tolerance = 1e-9 * std::max(1.0, std::abs(level.price));
    if (std::abs(level.price - order.price) <= tolerance &&
        std::abs(level.size - order.quantity) <= kQtyEpsilon) {
      return level.index;
    }
  }
  return std::nullopt;
}

std::vector<domain::OrderIntent> GridEngine::reset() {
  std::vector<domain::OrderIntent> intents;
  for (const auto& level : levels_) {
    if (level.state != domain::GridLevelState::Open || level.order_id == 0) {
      continue;
    }
    domain::OrderIntent intent;
    intent.kind = domain::OrderIntent::Kind::Cancel;
    intent.source = domain::IntentSource::Grid;
    intent.cancel_id = level.order_id;
    intent.slot = level.index;
    intent.request.symbol = symbol_;
    intent.reason = "grid reset";
    intents.push_back(std::move(intent));
  }
  levels_.clear();
  initialized_ = false;
  return intents;
}

void GridEngine::restore(const GridSnapshot& snapshot) {
  levels_ = snapshot.levels;
  reference_price_ = snapshot.reference_price;
  lower_price_ = snapshot.lower_price;
  upper_price_ = snapshot.upper_price;
  initialized_ = !levels_.empty();
}

GridSnapshot GridEngine::snapshot() const {
  return GridSnapshot{reference_price_, lower_price_, upper_price_, levels_};
}

std::size_t GridEngine::countInState(domain::GridLevelState state) const {
  std::size_t count = 0;
  for (const auto& level : levels_) {
    if (level.state == state) {
      ++count;
    }
  }
  return count;
}

std::size_t GridEngine::countOnSide(domain::Side side) const {
  std::size_t count = 0;
  for (const auto& level : levels_) {
    if (level.side == side) {
      ++count;
    }
  }
  return count;
}

domain::GridLevel* GridEngine::levelAt(std::size_t index, const char* caller) {
  if (index >= levels_.size()) {
    std::cerr << "[GridEngine] " << caller << ": no level " << index << "\n";
    return nullptr;
  }
  return &levels_[index];
}

}  // namespace gridcore
