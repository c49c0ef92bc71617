#include "gridcore/strategy/dca_engine.hpp"

#include <cmath>
#include <iostream>
#include <utility>

namespace gridcore {

namespace {

// Tolerance for the trigger comparison so an exact 2.00% move is not lost
// to rounding (1200 / 60000 is not exactly 0.02 in binary).
constexpr double kTriggerEpsilon = 1e-9;

}  // namespace

DcaEngine::DcaEngine(std::string symbol, config::DcaConfig config)
    : symbol_(std::move(symbol)), config_(std::move(config)) {}

void DcaEngine::start(double reference_price) {
  reference_price_ = reference_price;
  started_ = true;
}

std::vector<domain::OrderIntent> DcaEngine::onTick(
    double current_price, double trend_reference_price) {
  reference_price_ = trend_reference_price;
  started_ = true;
  return onTick(current_price);
}

std::vector<domain::OrderIntent> DcaEngine::onTick(double current_price) {
  std::vector<domain::OrderIntent> intents;
  if (!config_.enabled || !started_ || !(reference_price_ > 0.0)) {
    return intents;
  }

  if (recovered(current_price)) {
    std::cout << "[DcaEngine] price recovered to " << current_price
              << ", resetting ladder of " << activeEntries() << " entries\n";
    reset(current_price);
    return intents;
  }

  if (displacement(current_price) + kTriggerEpsilon <
      config_.trigger_percent / 100.0) {
    return intents;
  }

  std::size_t active = activeEntries();
  if (active >= static_cast<std::size_t>(config_.max_orders)) {
    return intents;
  }

  domain::DcaLadderEntry entry;
  entry.sequence = active + 1;
  entry.trigger_price = current_price;
  entry.size_multiplier =
      std::pow(config_.scaling_factor, static_cast<double>(active));
  entry.size = config_.order_size * entry.size_multiplier;
  entry.status = domain::DcaEntryStatus::Pending;
  entries_.push_back(entry);
  next_sequence_ = entry.sequence + 1;

  domain::OrderIntent intent;
  intent.kind = domain::OrderIntent::Kind::Place;
  intent.source = domain::IntentSource::Dca;
  intent.slot = entry.sequence;
  intent.request.symbol = symbol_;
  intent.request.side = config_.direction == config::DcaDirection::Long
                            ? domain::Side::Buy
                            : domain::Side::Sell;
  intent.request.type = domain::OrderType::Market;
  intent.request.quantity = entry.size;
  intent.reason = "dca entry " + std::to_string(active + 1) + "/" +
                  std::to_string(config_.max_orders);
  intents.push_back(std::move(intent));

  std::cout << "[DcaEngine] entry " << active + 1 << " triggered at "
            << current_price << " (reference " << reference_price_
            << "), size " << entry.size << "\n";

  reference_price_ = current_price;
  return intents;
}

void DcaEngine::onOrderPlaced(std::size_t sequence, domain::OrderId order_id) {
  if (auto* entry = entryFor(sequence)) {
    entry->order_id = order_id;
    if (entry->status == domain::DcaEntryStatus::Pending) {
      entry->status = domain::DcaEntryStatus::Open;
    }
  }
}

void DcaEngine::onOrderRejected(std::size_t sequence,
                                const std::string& reason) {
  if (auto* entry = entryFor(sequence)) {
    entry->status = domain::DcaEntryStatus::Rejected;
    next_sequence_ = activeEntries() + 1;
    std::cerr << "[DcaEngine] entry #" << sequence << " parked: " << reason
              << "\n";
  }
}

void DcaEngine::onFill(domain::OrderId order_id, double quantity) {
  for (auto& entry : entries_) {
    if (entry.order_id != order_id || entry.order_id == 0) {
      continue;
    }
    entry.filled_quantity += quantity;
    if (entry.filled_quantity + 1e-9 >= entry.size) {
      entry.status = domain::DcaEntryStatus::Filled;
    }
    return;
  }
}

void DcaEngine::reset(double new_reference_price) {
  entries_.clear();
  next_sequence_ = 1;
  reference_price_ = new_reference_price;
}

void DcaEngine::restore(const DcaSnapshot& snapshot) {
  reference_price_ = snapshot.reference_price;
  next_sequence_ = snapshot.next_sequence;
  entries_ = snapshot.entries;
  started_ = reference_price_ > 0.0;
}

DcaSnapshot DcaEngine::snapshot() const {
  return DcaSnapshot{reference_price_, next_sequence_, entries_};
}

std::size_t DcaEngine::activeEntries() const {
  std::size_t count = 0;
  for (const auto& entry : entries_) {
    if (domain::isActive(entry)) {
      ++count;
    }
  }
  return count;
}

double DcaEngine::displacement(double current_price) const {
  double move = config_.direction == config::DcaDirection::Long
                    ? reference_price_ - current_price
                    : current_price - reference_price_;
  return move / reference_price_;
}

bool DcaEngine::recovered(double current_price) const {
  const domain::DcaLadderEntry* last = nullptr;
  for (const auto& entry : entries_) {
    if (domain::isActive(entry)) {
      last = &entry;
    }
  }
  if (last == nullptr) {
    return false;
  }
  double threshold = config_.recovery_percent / 100.0;
  if (config_.direction == config::DcaDirection::Long) {
    return current_price >= last->trigger_price * (1.0 + threshold);
  }
  return current_price <= last->trigger_price * (1.0 - threshold);
}

// A parked entry can share its sequence with the one that replaced it; the
// newest entry wins.
domain::DcaLadderEntry* DcaEngine::entryFor(std::size_t sequence) {
  for (auto it = entries_.rbegin(); it != entries_.rend(); ++it) {
    if (it->sequence == sequence) {
      return &*it;
    }
  }
  std::cerr << "[DcaEngine] no ladder entry #" << sequence << "\n";
  return nullptr;
}

}  // namespace gridcore
