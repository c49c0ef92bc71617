// =============================================================================
// simulated_exchange_test.cpp
// =============================================================================
// Unit tests for gridcore::SimulatedExchange, the paper-trading venue.
//
// Validates:
//   - Limit orders rest until the mark crosses them, then fill at their price
//   - Market orders fill at the mark; stops trigger on touch
//   - Position accounting: open, add, reduce, flip, realized pnl
//   - Reduce-only and margin checks
//   - Connection state and failure injection
// =============================================================================

#include "gridcore/exchange/simulated_exchange.hpp"
#include "gridcore/time/simulation_time_provider.hpp"

#include <gtest/gtest.h>

#include <functional>

using gridcore::ExchangeError;
using gridcore::ExchangeErrorKind;
using gridcore::SimulatedExchange;
using namespace gridcore::domain;

class SimulatedExchangeTest : public ::testing::Test {
 protected:
  void SetUp() override {
    exchange.connect();
    exchange.setMarkPrice(100.0);
  }

  static OrderRequest request(Side side, OrderType type, double qty,
                              double price = 0.0, bool reduce_only = false) {
    OrderRequest r;
    r.symbol = "TEST";
    r.side = side;
    r.type = type;
    r.quantity = qty;
    r.price = price;
    r.reduce_only = reduce_only;
    return r;
  }

  static ExchangeErrorKind kindOf(const std::function<void()>& fn) {
    try {
      fn();
    } catch (const ExchangeError& e) {
      return e.kind();
    }
    ADD_FAILURE() << "expected ExchangeError";
    return ExchangeErrorKind::Timeout;
  }

  gridcore::SimulationTimeProvider clock{5000};
  SimulatedExchange exchange{"TEST", 1000.0, 10, clock};
};

// -----------------------------------------------------------------------------
// 1. A buy limit below the mark rests, then fills at its own price when the
//    mark trades through it.
// -----------------------------------------------------------------------------
TEST_F(SimulatedExchangeTest, LimitRestsThenFillsAtItsPrice) {
  auto id = exchange.placeOrder(request(Side::Buy, OrderType::Limit, 1.0, 95.0));
  EXPECT_EQ(exchange.getOpenOrders("TEST").size(), 1u);
  EXPECT_TRUE(exchange.drainFills().empty());

  exchange.setMarkPrice(94.0);
  auto fills = exchange.drainFills();
  ASSERT_EQ(fills.size(), 1u);
  EXPECT_EQ(fills[0].order_id, id);
  EXPECT_DOUBLE_EQ(fills[0].price, 95.0);
  EXPECT_DOUBLE_EQ(fills[0].quantity, 1.0);
  EXPECT_EQ(fills[0].timestamp_ms, 5000);
  EXPECT_TRUE(exchange.getOpenOrders("TEST").empty());

  Position p = exchange.getPosition("TEST");
  EXPECT_DOUBLE_EQ(p.net_quantity, 1.0);
  EXPECT_DOUBLE_EQ(p.average_price, 95.0);
  EXPECT_DOUBLE_EQ(p.unrealized_pnl, -1.0);
  EXPECT_DOUBLE_EQ(exchange.getEquity(), 999.0);

  // Fills are delivered once.
  EXPECT_TRUE(exchange.drainFills().empty());
}

// -----------------------------------------------------------------------------
// 2. Market fills at the mark; a sell stop triggers when the mark falls to it.
// -----------------------------------------------------------------------------
TEST_F(SimulatedExchangeTest, MarketAndStopOrders) {
  exchange.placeOrder(request(Side::Buy, OrderType::Market, 2.0));
  auto fills = exchange.drainFills();
  ASSERT_EQ(fills.size(), 1u);
  EXPECT_DOUBLE_EQ(fills[0].price, 100.0);

  exchange.placeOrder(request(Side::Sell, OrderType::Stop, 2.0, 98.0, true));
  exchange.setMarkPrice(99.0);
  EXPECT_TRUE(exchange.drainFills().empty());
  exchange.setMarkPrice(97.5);
  fills = exchange.drainFills();
  ASSERT_EQ(fills.size(), 1u);
  EXPECT_DOUBLE_EQ(fills[0].price, 97.5);

  Position p = exchange.getPosition("TEST");
  EXPECT_TRUE(p.isFlat());
  EXPECT_DOUBLE_EQ(p.realized_pnl, -5.0);
  EXPECT_DOUBLE_EQ(exchange.getEquity(), 995.0);
}

// -----------------------------------------------------------------------------
// 3. Position math: add, reduce, flip through zero.
// -----------------------------------------------------------------------------
TEST_F(SimulatedExchangeTest, PositionAccounting) {
  Position p;
  SimulatedExchange::applyFill(p, 1.0, 100.0);
  SimulatedExchange::applyFill(p, 1.0, 110.0);
  EXPECT_DOUBLE_EQ(p.net_quantity, 2.0);
  EXPECT_DOUBLE_EQ(p.average_price, 105.0);

  SimulatedExchange::applyFill(p, -0.5, 115.0);
  EXPECT_DOUBLE_EQ(p.net_quantity, 1.5);
  EXPECT_DOUBLE_EQ(p.average_price, 105.0);
  EXPECT_DOUBLE_EQ(p.realized_pnl, 5.0);

  SimulatedExchange::applyFill(p, -2.5, 100.0);
  EXPECT_DOUBLE_EQ(p.net_quantity, -1.0);
  EXPECT_DOUBLE_EQ(p.average_price, 100.0);
  EXPECT_DOUBLE_EQ(p.realized_pnl, 5.0 - 7.5);
}

// -----------------------------------------------------------------------------
// 4. Order checks: reduce-only needs something to reduce, margin is bounded
//    by leverage, bad requests are rejected.
// -----------------------------------------------------------------------------
TEST_F(SimulatedExchangeTest, RejectsInvalidOrders) {
  EXPECT_EQ(kindOf([&] {
              exchange.placeOrder(
                  request(Side::Sell, OrderType::Market, 1.0, 0.0, true));
            }),
            ExchangeErrorKind::Rejected);

  // 1000 capital x 10 leverage covers 100 units at 100, not 101.
  EXPECT_EQ(kindOf([&] {
              exchange.placeOrder(
                  request(Side::Buy, OrderType::Limit, 101.0, 100.0));
            }),
            ExchangeErrorKind::InsufficientBalance);

  EXPECT_EQ(kindOf([&] {
              exchange.placeOrder(request(Side::Buy, OrderType::Limit, 0.0, 90.0));
            }),
            ExchangeErrorKind::Rejected);
  EXPECT_EQ(kindOf([&] {
              exchange.placeOrder(request(Side::Buy, OrderType::Limit, 1.0, 0.0));
            }),
            ExchangeErrorKind::Rejected);

  auto other = request(Side::Buy, OrderType::Limit, 1.0, 90.0);
  other.symbol = "OTHER";
  EXPECT_EQ(kindOf([&] { exchange.placeOrder(other); }),
            ExchangeErrorKind::Rejected);
}

// -----------------------------------------------------------------------------
// 5. Cancel removes the order; a second cancel is NotFound.
// -----------------------------------------------------------------------------
TEST_F(SimulatedExchangeTest, Cancel) {
  auto id = exchange.placeOrder(request(Side::Buy, OrderType::Limit, 1.0, 90.0));
  exchange.cancelOrder(id);
  EXPECT_TRUE(exchange.getOpenOrders("TEST").empty());
  EXPECT_EQ(kindOf([&] { exchange.cancelOrder(id); }),
            ExchangeErrorKind::NotFound);
}

// -----------------------------------------------------------------------------
// 6. Connection loss and injected failures.
// -----------------------------------------------------------------------------
TEST_F(SimulatedExchangeTest, ConnectionAndInjectedFailures) {
  exchange.dropConnection();
  EXPECT_FALSE(exchange.isConnected());
  EXPECT_EQ(kindOf([&] { exchange.getPrice("TEST"); }),
            ExchangeErrorKind::Disconnected);

  exchange.connect();
  exchange.failNext(SimulatedExchange::Operation::GetPrice,
                    ExchangeErrorKind::RateLimited, 2);
  EXPECT_EQ(kindOf([&] { exchange.getPrice("TEST"); }),
            ExchangeErrorKind::RateLimited);
  EXPECT_EQ(kindOf([&] { exchange.getPrice("TEST"); }),
            ExchangeErrorKind::RateLimited);
  EXPECT_DOUBLE_EQ(exchange.getPrice("TEST").price, 100.0);

  exchange.failNext(SimulatedExchange::Operation::Any,
                    ExchangeErrorKind::Disconnected);
  EXPECT_EQ(kindOf([&] { exchange.getEquity(); }),
            ExchangeErrorKind::Disconnected);
  EXPECT_FALSE(exchange.isConnected());

  exchange.rejectAuth(true);
  EXPECT_EQ(kindOf([&] { exchange.connect(); }), ExchangeErrorKind::AuthError);
}
