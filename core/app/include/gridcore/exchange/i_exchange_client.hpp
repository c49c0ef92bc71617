#pragma once

#include "gridcore/domain/market.hpp"
#include "gridcore/domain/order.hpp"
#include "gridcore/domain/position.hpp"

#include <string>
#include <vector>

namespace gridcore {

// -----------------------------------------------------------------------------
// IExchangeClient
// -----------------------------------------------------------------------------
// @brief  Contract the core needs from an exchange. The wire protocol stays
//         behind this interface.
//
// @details
// Every method may throw ExchangeError; the kind tells the caller how to
// react (see errors.hpp). Implementations bound every network call by a
// timeout and report it as ExchangeErrorKind::Timeout.
//
// drainFills() is the restartable fill stream: each call returns the fills
// produced since the previous call, oldest first. After a reconnect the
// stream resumes without losing fills that happened while disconnected.
//
// Thread model: called from the tick thread, and from the supervisor
// thread during recovery while the tick loop is stopped. Never
// concurrently by the core.
// -----------------------------------------------------------------------------
class IExchangeClient {
 public:
  virtual ~IExchangeClient() = default;

  virtual void connect() = 0;
  virtual void disconnect() = 0;
  virtual bool isConnected() const = 0;

  virtual domain::PriceSnapshot getPrice(const std::string& symbol) = 0;

  // Returns the exchange-assigned id (never 0).
  virtual domain::OrderId placeOrder(const domain::OrderRequest& request) = 0;

  // NotFound when the order is unknown or already terminal.
  virtual void cancelOrder(domain::OrderId id) = 0;

  virtual domain::Position getPosition(const std::string& symbol) = 0;

  // Wallet balance plus unrealized pnl.
  virtual double getEquity() = 0;

  virtual std::vector<domain::Order> getOpenOrders(const std::string& symbol) = 0;

  virtual std::vector<domain::Fill> drainFills() = 0;
};

}  // namespace gridcore
