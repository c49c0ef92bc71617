#include "gridcore/state/order_book_state.hpp"
#include "gridcore/events/order_update_event.hpp"
#include "gridcore/time/time_utils.hpp"

#include <iostream>
#include <set>

namespace gridcore {

namespace {

constexpr double kQtyEpsilon = 1e-9;

}  // namespace

OrderBookState::OrderBookState(const ITimeProvider& clock, INotifier* notifier)
    : clock_(clock), notifier_(notifier) {}

void OrderBookState::track(const domain::Order& order,
                           domain::IntentSource owner, std::size_t slot) {
  TrackedOrder tracked{order, owner, slot};
  tracked.order.status = domain::OrderStatus::Accepted;
  auto [it, inserted] = orders_.insert_or_assign(order.id, tracked);
  if (!inserted) {
    std::cerr << "[OrderBookState] WARNING: order " << order.id
              << " tracked twice, replacing previous entry\n";
  }
  publish(it->second, domain::OrderStatus::Accepted);
}

void OrderBookState::hydrate(const TrackedOrder& tracked) {
  orders_[tracked.order.id] = tracked;
}

std::optional<TrackedOrder> OrderBookState::applyFill(
    const domain::Fill& fill) {
  auto it = orders_.find(fill.order_id);
  if (it == orders_.end()) {
    return std::nullopt;
  }

  TrackedOrder& tracked = it->second;
  tracked.order.filled_quantity += fill.quantity;

  bool complete =
      tracked.order.filled_quantity >= tracked.order.quantity - kQtyEpsilon;
  if (!advance(tracked, complete ? domain::OrderStatus::Filled
                                 : domain::OrderStatus::PartiallyFilled)) {
    return std::nullopt;
  }

  TrackedOrder result = tracked;
  if (domain::isTerminal(tracked.order.status)) {
    orders_.erase(it);
  }
  return result;
}

bool OrderBookState::markCanceled(domain::OrderId id) {
  auto it = orders_.find(id);
  if (it == orders_.end()) {
    return false;
  }
  advance(it->second, domain::OrderStatus::Canceled);
  orders_.erase(it);
  return true;
}

OrderBookState::ReconcileResult OrderBookState::reconcileOpenOrders(
    const std::vector<domain::Order>& exchange_open) {
  ReconcileResult result;

  std::set<domain::OrderId> live;
  for (const auto& order : exchange_open) {
    live.insert(order.id);
    if (orders_.find(order.id) == orders_.end()) {
      result.untracked.push_back(order);
    }
  }

  for (auto it = orders_.begin(); it != orders_.end();) {
    if (live.count(it->first) != 0) {
      ++it;
      continue;
    }
    advance(it->second, domain::OrderStatus::Canceled);
    result.missing.push_back(it->second);
    it = orders_.erase(it);
  }

  if (!result.missing.empty() || !result.untracked.empty()) {
    std::cout << "[OrderBookState] reconciliation: " << result.missing.size()
              << " missing, " << result.untracked.size() << " untracked\n";
  }
  return result;
}

bool OrderBookState::reconcilePosition(const domain::Position& position) {
  if (position == position_) {
    return false;
  }
  position_ = position;
  return true;
}

const TrackedOrder* OrderBookState::find(domain::OrderId id) const {
  auto it = orders_.find(id);
  return it != orders_.end() ? &it->second : nullptr;
}

std::vector<TrackedOrder> OrderBookState::openOrders() const {
  std::vector<TrackedOrder> result;
  result.reserve(orders_.size());
  for (const auto& [id, tracked] : orders_) {
    result.push_back(tracked);
  }
  return result;
}

void OrderBookState::clear() {
  orders_.clear();
  position_ = domain::Position{};
}

bool OrderBookState::transitionStatus(domain::OrderStatus current,
                                      domain::OrderStatus next) {
  using S = domain::OrderStatus;
  switch (current) {
    case S::Accepted:
      return next == S::PartiallyFilled || next == S::Filled ||
             next == S::Canceled || next == S::Rejected;
    case S::PartiallyFilled:
      return next == S::PartiallyFilled || next == S::Filled ||
             next == S::Canceled;
    case S::Filled:
    case S::Canceled:
    case S::Rejected:
      return false;
  }
  return false;
}

bool OrderBookState::advance(TrackedOrder& tracked, domain::OrderStatus next) {
  domain::OrderStatus previous = tracked.order.status;
  if (!transitionStatus(previous, next)) {
    std::cerr << "[OrderBookState] illegal transition for order "
              << tracked.order.id << ": " << domain::toString(previous)
              << " -> " << domain::toString(next) << "\n";
    return false;
  }
  tracked.order.status = next;
  publish(tracked, previous);
  return true;
}

void OrderBookState::publish(const TrackedOrder& tracked,
                             domain::OrderStatus previous) {
  if (notifier_ == nullptr) {
    return;
  }
  OrderUpdateEvent update;
  update.order = tracked.order;
  update.previous_status = previous;
  update.owner = tracked.owner;
  update.timestamp = ms_to_timestamp(clock_.now_ms());
  notifier_->record(update);
}

}  // namespace gridcore
