#pragma once

#include "gridcore/concurrent/order_id_generator.hpp"
#include "gridcore/errors/errors.hpp"
#include "gridcore/exchange/i_exchange_client.hpp"
#include "gridcore/time/i_time_provider.hpp"

#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace gridcore {

// -----------------------------------------------------------------------------
// SimulatedExchange: in-process paper exchange for one linear perpetual
// -----------------------------------------------------------------------------
//
// @brief  Implements IExchangeClient against a local order book so the bot
//         can paper-trade and tests can drive complete sessions.
//
// @details
// Matching model (evaluated on placement and on every setMarkPrice()):
//   Market  fills immediately at the mark.
//   Limit   buy fills when mark <= price, sell when mark >= price, at the
//           limit price. A marketable limit fills at the mark.
//   Stop    buy triggers when mark >= price, sell when mark <= price, and
//           fills at the mark.
//   Reduce-only orders are clamped to the open position and canceled if
//   the position is flat or on the same side when they would execute.
//
// Margin: a non-reduce-only order needs quantity * price / leverage of free
// margin (equity minus margin of the position and of resting orders),
// otherwise InsufficientBalance.
//
// Position accounting uses weighted-average entry; realized pnl is added to
// the wallet balance, equity = balance + unrealized pnl.
//
// Failure injection (tests and chaos runs):
//   failNext(op, kind, count)  the next `count` calls of `op` throw kind
//   dropConnection()           simulate a lost websocket/REST session
//   rejectAuth(true)           connect() throws AuthError
//
// The fill stream survives disconnects: fills produced while disconnected
// are returned by the first drainFills() after reconnecting.
//
// Thread-safety: all public members lock one mutex. The price feed thread
// calls setMarkPrice() while the tick thread places orders.
// -----------------------------------------------------------------------------
class SimulatedExchange final : public IExchangeClient {
 public:
  enum class Operation {
    Any,
    Connect,
    GetPrice,
    PlaceOrder,
    CancelOrder,
    GetPosition,
    GetEquity,
    GetOpenOrders,
    DrainFills,
  };

  SimulatedExchange(std::string symbol, double initial_capital, int leverage,
                    const ITimeProvider& clock);

  SimulatedExchange(const SimulatedExchange&) = delete;
  SimulatedExchange& operator=(const SimulatedExchange&) = delete;
  SimulatedExchange(SimulatedExchange&&) = delete;
  SimulatedExchange& operator=(SimulatedExchange&&) = delete;

  // IExchangeClient
  void connect() override;
  void disconnect() override;
  bool isConnected() const override;
  domain::PriceSnapshot getPrice(const std::string& symbol) override;
  domain::OrderId placeOrder(const domain::OrderRequest& request) override;
  void cancelOrder(domain::OrderId id) override;
  domain::Position getPosition(const std::string& symbol) override;
  double getEquity() override;
  std::vector<domain::Order> getOpenOrders(const std::string& symbol) override;
  std::vector<domain::Fill> drainFills() override;

  // Market simulation
  void setMarkPrice(double price);
  double markPrice() const;

  // Failure injection
  void failNext(Operation op, ExchangeErrorKind kind, int count = 1);
  void dropConnection();
  void rejectAuth(bool reject);

  // Position math shared with tests: applies a signed fill to `pos`.
  static void applyFill(domain::Position& pos, double signed_qty, double price);

 private:
  struct InjectedFailure {
    Operation op;
    ExchangeErrorKind kind;
    int remaining;
  };

  void maybeFail(Operation op);
  void requireConnected(const char* operation) const;
  void requireSymbol(const std::string& symbol) const;

  void matchOrders();
  bool isTriggered(const domain::Order& order) const;
  void execute(domain::Order& order, double price);

  double unrealizedPnl() const;
  double equity() const;
  double usedMargin() const;

  const std::string symbol_;
  const int leverage_;
  const ITimeProvider& clock_;

  mutable std::mutex mutex_;
  bool connected_{false};
  bool reject_auth_{false};
  double mark_price_{0.0};
  double balance_;
  domain::Position position_;
  std::map<domain::OrderId, domain::Order> orders_;  // all orders, by id
  std::vector<domain::Fill> pending_fills_;
  std::vector<InjectedFailure> failures_;
  OrderIdGenerator id_gen_;
};

}  // namespace gridcore
