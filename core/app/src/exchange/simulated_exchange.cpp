#include "gridcore/exchange/simulated_exchange.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <utility>

namespace gridcore {

namespace {

constexpr double kQtyEpsilon = 1e-12;

}  // namespace

SimulatedExchange::SimulatedExchange(std::string symbol,
                                     double initial_capital, int leverage,
                                     const ITimeProvider& clock)
    : symbol_(std::move(symbol)),
      leverage_(leverage),
      clock_(clock),
      balance_(initial_capital) {
  position_.symbol = symbol_;
  position_.leverage = leverage_;
}

// -----------------------------------------------------------------------------
// Connection
// -----------------------------------------------------------------------------

void SimulatedExchange::connect() {
  std::lock_guard lock(mutex_);
  maybeFail(Operation::Connect);
  if (reject_auth_) {
    throw ExchangeError(ExchangeErrorKind::AuthError, "invalid API key");
  }
  connected_ = true;
}

void SimulatedExchange::disconnect() {
  std::lock_guard lock(mutex_);
  connected_ = false;
}

bool SimulatedExchange::isConnected() const {
  std::lock_guard lock(mutex_);
  return connected_;
}

void SimulatedExchange::dropConnection() {
  std::lock_guard lock(mutex_);
  connected_ = false;
  std::cerr << "[SimulatedExchange] connection dropped\n";
}

void SimulatedExchange::rejectAuth(bool reject) {
  std::lock_guard lock(mutex_);
  reject_auth_ = reject;
}

void SimulatedExchange::failNext(Operation op, ExchangeErrorKind kind,
                                 int count) {
  std::lock_guard lock(mutex_);
  failures_.push_back(InjectedFailure{op, kind, count});
}

void SimulatedExchange::maybeFail(Operation op) {
  for (auto it = failures_.begin(); it != failures_.end(); ++it) {
    if (it->op != op && it->op != Operation::Any) {
      continue;
    }
    ExchangeErrorKind kind = it->kind;
    if (--it->remaining <= 0) {
      failures_.erase(it);
    }
    if (kind == ExchangeErrorKind::Disconnected) {
      connected_ = false;
    }
    throw ExchangeError(kind, "injected failure");
  }
}

void SimulatedExchange::requireConnected(const char* operation) const {
  if (!connected_) {
    throw ExchangeError(ExchangeErrorKind::Disconnected,
                        std::string(operation) + " while disconnected");
  }
}

void SimulatedExchange::requireSymbol(const std::string& symbol) const {
  if (symbol != symbol_) {
    throw ExchangeError(ExchangeErrorKind::Rejected,
                        "unknown symbol " + symbol);
  }
}

// -----------------------------------------------------------------------------
// Queries
// -----------------------------------------------------------------------------

domain::PriceSnapshot SimulatedExchange::getPrice(const std::string& symbol) {
  std::lock_guard lock(mutex_);
  maybeFail(Operation::GetPrice);
  requireConnected("getPrice");
  requireSymbol(symbol);
  if (mark_price_ <= 0.0) {
    throw ExchangeError(ExchangeErrorKind::NetworkError,
                        "no price received yet for " + symbol);
  }
  return domain::PriceSnapshot{symbol_, mark_price_, clock_.now_ms()};
}

domain::Position SimulatedExchange::getPosition(const std::string& symbol) {
  std::lock_guard lock(mutex_);
  maybeFail(Operation::GetPosition);
  requireConnected("getPosition");
  requireSymbol(symbol);
  domain::Position pos = position_;
  pos.mark_price = mark_price_;
  pos.unrealized_pnl = unrealizedPnl();
  return pos;
}

double SimulatedExchange::getEquity() {
  std::lock_guard lock(mutex_);
  maybeFail(Operation::GetEquity);
  requireConnected("getEquity");
  return equity();
}

std::vector<domain::Order> SimulatedExchange::getOpenOrders(
    const std::string& symbol) {
  std::lock_guard lock(mutex_);
  maybeFail(Operation::GetOpenOrders);
  requireConnected("getOpenOrders");
  requireSymbol(symbol);
  std::vector<domain::Order> open;
  open.reserve(orders_.size());
  for (const auto& [id, order] : orders_) {
    open.push_back(order);
  }
  return open;
}

std::vector<domain::Fill> SimulatedExchange::drainFills() {
  std::lock_guard lock(mutex_);
  maybeFail(Operation::DrainFills);
  requireConnected("drainFills");
  std::vector<domain::Fill> fills;
  fills.swap(pending_fills_);
  return fills;
}

double SimulatedExchange::markPrice() const {
  std::lock_guard lock(mutex_);
  return mark_price_;
}

// -----------------------------------------------------------------------------
// Orders
// -----------------------------------------------------------------------------

domain::OrderId SimulatedExchange::placeOrder(
    const domain::OrderRequest& request) {
  std::lock_guard lock(mutex_);
  maybeFail(Operation::PlaceOrder);
  requireConnected("placeOrder");
  requireSymbol(request.symbol);

  if (!(request.quantity > 0.0)) {
    throw ExchangeError(ExchangeErrorKind::Rejected,
                        "quantity must be positive");
  }
  if (request.type != domain::OrderType::Market && !(request.price > 0.0)) {
    throw ExchangeError(ExchangeErrorKind::Rejected, "price must be positive");
  }
  if (mark_price_ <= 0.0) {
    throw ExchangeError(ExchangeErrorKind::Rejected, "market not open");
  }

  if (request.reduce_only) {
    bool reduces = (request.side == domain::Side::Sell && position_.isLong()) ||
                   (request.side == domain::Side::Buy && position_.isShort());
    if (!reduces) {
      throw ExchangeError(ExchangeErrorKind::Rejected,
                          "reduce-only order would increase position");
    }
  } else {
    double reference = request.type == domain::OrderType::Limit
                           ? request.price
                           : mark_price_;
    double required = request.quantity * reference / leverage_;
    double available = equity() - usedMargin();
    if (required > available + kQtyEpsilon) {
      throw ExchangeError(ExchangeErrorKind::InsufficientBalance,
                          "required margin " + std::to_string(required) +
                              " exceeds available " +
                              std::to_string(available));
    }
  }

  domain::Order order = domain::makeOrder(id_gen_.next_id(), request);
  domain::OrderId id = order.id;

  // Market orders and marketable limits/stops execute right away at the mark.
  if (isTriggered(order)) {
    execute(order, mark_price_);
    return id;
  }
  orders_.emplace(id, std::move(order));
  return id;
}

void SimulatedExchange::cancelOrder(domain::OrderId id) {
  std::lock_guard lock(mutex_);
  maybeFail(Operation::CancelOrder);
  requireConnected("cancelOrder");
  auto it = orders_.find(id);
  if (it == orders_.end()) {
    throw ExchangeError(ExchangeErrorKind::NotFound,
                        "order " + std::to_string(id) + " not open");
  }
  orders_.erase(it);
}

void SimulatedExchange::setMarkPrice(double price) {
  std::lock_guard lock(mutex_);
  mark_price_ = price;
  matchOrders();
}

bool SimulatedExchange::isTriggered(const domain::Order& order) const {
  using domain::OrderType;
  using domain::Side;
  switch (order.type) {
    case OrderType::Market:
      return true;
    case OrderType::Limit:
      return order.side == Side::Buy ? mark_price_ <= order.price
                                     : mark_price_ >= order.price;
    case OrderType::Stop:
      return order.side == Side::Buy ? mark_price_ >= order.price
                                     : mark_price_ <= order.price;
  }
  return false;
}

void SimulatedExchange::matchOrders() {
  for (auto it = orders_.begin(); it != orders_.end();) {
    domain::Order& order = it->second;
    if (!isTriggered(order)) {
      ++it;
      continue;
    }

    // Resting limits fill at their own price, triggered stops at the mark.
    execute(order, order.type == domain::OrderType::Limit ? order.price
                                                          : mark_price_);
    it = orders_.erase(it);
  }
}

void SimulatedExchange::execute(domain::Order& order, double price) {
  double qty = order.quantity - order.filled_quantity;

  if (order.reduce_only) {
    bool reduces = (order.side == domain::Side::Sell && position_.isLong()) ||
                   (order.side == domain::Side::Buy && position_.isShort());
    if (!reduces) {
      std::cout << "[SimulatedExchange] reduce-only order " << order.id
                << " canceled: nothing to reduce\n";
      return;
    }
    qty = std::min(qty, std::abs(position_.net_quantity));
  }

  double signed_qty = order.side == domain::Side::Buy ? qty : -qty;
  double realized_before = position_.realized_pnl;
  applyFill(position_, signed_qty, price);
  balance_ += position_.realized_pnl - realized_before;

  order.filled_quantity += qty;
  order.status = domain::OrderStatus::Filled;

  pending_fills_.push_back(domain::Fill{order.id, order.symbol, order.side,
                                        price, qty, clock_.now_ms()});
}

// Weighted-average position accounting for a linear contract. Handles the
// four cases: opening from flat, adding, reducing, and flipping through
// zero (close the old side, open the remainder at the fill price).
void SimulatedExchange::applyFill(domain::Position& pos, double signed_qty,
                                  double price) {
  double current = pos.net_quantity;

  if (std::abs(current) < kQtyEpsilon) {
    pos.net_quantity = signed_qty;
    pos.average_price = price;
    return;
  }

  bool adding = (current > 0.0) == (signed_qty > 0.0);
  if (adding) {
    double total = current + signed_qty;
    pos.average_price =
        (current * pos.average_price + signed_qty * price) / total;
    pos.net_quantity = total;
    return;
  }

  double direction = current > 0.0 ? 1.0 : -1.0;
  double closing = std::min(std::abs(signed_qty), std::abs(current));
  pos.realized_pnl += closing * (price - pos.average_price) * direction;

  double remaining = current + signed_qty;
  if (std::abs(remaining) < kQtyEpsilon) {
    pos.net_quantity = 0.0;
    pos.average_price = 0.0;
  } else if ((remaining > 0.0) == (current > 0.0)) {
    pos.net_quantity = remaining;  // reduced, entry unchanged
  } else {
    pos.net_quantity = remaining;  // flipped
    pos.average_price = price;
  }
}

double SimulatedExchange::unrealizedPnl() const {
  if (position_.isFlat() || mark_price_ <= 0.0) {
    return 0.0;
  }
  return (mark_price_ - position_.average_price) * position_.net_quantity;
}

double SimulatedExchange::equity() const { return balance_ + unrealizedPnl(); }

double SimulatedExchange::usedMargin() const {
  double margin = position_.notional() / leverage_;
  for (const auto& [id, order] : orders_) {
    if (order.reduce_only) {
      continue;
    }
    double reference =
        order.type == domain::OrderType::Limit ? order.price : mark_price_;
    margin += (order.quantity - order.filled_quantity) * reference / leverage_;
  }
  return margin;
}

}  // namespace gridcore
