// =============================================================================
// order_book_state_test.cpp
// =============================================================================
// Unit tests for gridcore::OrderBookState.
//
// Validates:
//   - Status transition table (legal and illegal moves)
//   - Fill accumulation, removal of completed orders, owner routing
//   - Reconciliation against the exchange's open orders
//   - OrderUpdateEvent emission
// =============================================================================

#include "gridcore/state/order_book_state.hpp"
#include "gridcore/time/simulation_time_provider.hpp"
#include "support/recording_notifier.hpp"

#include <gtest/gtest.h>

using gridcore::OrderBookState;
using gridcore::TrackedOrder;
using gridcore::domain::IntentSource;
using gridcore::domain::Order;
using gridcore::domain::OrderStatus;

class OrderBookStateTest : public ::testing::Test {
 protected:
  gridcore::SimulationTimeProvider clock{1000};
  gridcore::test::RecordingNotifier notifier;
  OrderBookState book{clock, &notifier};

  static Order limitOrder(gridcore::domain::OrderId id, double qty) {
    Order o;
    o.id = id;
    o.symbol = "BTCUSDT";
    o.side = gridcore::domain::Side::Buy;
    o.type = gridcore::domain::OrderType::Limit;
    o.quantity = qty;
    o.price = 59640.0;
    return o;
  }

  static gridcore::domain::Fill fillOf(gridcore::domain::OrderId id,
                                       double qty) {
    gridcore::domain::Fill f;
    f.order_id = id;
    f.symbol = "BTCUSDT";
    f.price = 59640.0;
    f.quantity = qty;
    return f;
  }
};

// -----------------------------------------------------------------------------
// 1. Transition table.
// -----------------------------------------------------------------------------
TEST_F(OrderBookStateTest, TransitionTable) {
  using S = OrderStatus;
  EXPECT_TRUE(OrderBookState::transitionStatus(S::Accepted, S::PartiallyFilled));
  EXPECT_TRUE(OrderBookState::transitionStatus(S::Accepted, S::Filled));
  EXPECT_TRUE(OrderBookState::transitionStatus(S::Accepted, S::Canceled));
  EXPECT_TRUE(OrderBookState::transitionStatus(S::Accepted, S::Rejected));
  EXPECT_TRUE(
      OrderBookState::transitionStatus(S::PartiallyFilled, S::PartiallyFilled));
  EXPECT_TRUE(OrderBookState::transitionStatus(S::PartiallyFilled, S::Filled));
  EXPECT_FALSE(
      OrderBookState::transitionStatus(S::PartiallyFilled, S::Rejected));

  for (S terminal : {S::Filled, S::Canceled, S::Rejected}) {
    for (S next : {S::Accepted, S::PartiallyFilled, S::Filled, S::Canceled,
                   S::Rejected}) {
      EXPECT_FALSE(OrderBookState::transitionStatus(terminal, next))
          << gridcore::domain::toString(terminal) << " -> "
          << gridcore::domain::toString(next);
    }
  }
}

// -----------------------------------------------------------------------------
// 2. Partial then full fill: owner and slot come back with every fill and the
//    order is forgotten once complete.
// -----------------------------------------------------------------------------
TEST_F(OrderBookStateTest, FillsAccumulateAndCompleteOrdersAreRemoved) {
  book.track(limitOrder(7, 0.01), IntentSource::Grid, 8);
  ASSERT_EQ(book.size(), 1u);

  auto first = book.applyFill(fillOf(7, 0.004));
  ASSERT_TRUE(first.has_value());
  EXPECT_EQ(first->owner, IntentSource::Grid);
  EXPECT_EQ(first->slot, 8u);
  EXPECT_EQ(first->order.status, OrderStatus::PartiallyFilled);
  EXPECT_EQ(book.size(), 1u);

  auto second = book.applyFill(fillOf(7, 0.006));
  ASSERT_TRUE(second.has_value());
  EXPECT_EQ(second->order.status, OrderStatus::Filled);
  EXPECT_NEAR(second->order.filled_quantity, 0.01, 1e-12);
  EXPECT_EQ(book.size(), 0u);
  EXPECT_EQ(book.find(7), nullptr);
}

// -----------------------------------------------------------------------------
// 3. Fills for unknown or finished orders are not routed anywhere.
// Why: A duplicated fill would otherwise flip a grid level twice.
// -----------------------------------------------------------------------------
TEST_F(OrderBookStateTest, UnknownAndDuplicateFillsAreIgnored) {
  EXPECT_FALSE(book.applyFill(fillOf(99, 1.0)).has_value());

  book.track(limitOrder(7, 0.01), IntentSource::Dca, 1);
  ASSERT_TRUE(book.applyFill(fillOf(7, 0.01)).has_value());
  EXPECT_FALSE(book.applyFill(fillOf(7, 0.01)).has_value());
}

// -----------------------------------------------------------------------------
// 4. markCanceled() forgets the order and reports unknown ids.
// -----------------------------------------------------------------------------
TEST_F(OrderBookStateTest, MarkCanceled) {
  book.track(limitOrder(3, 1.0), IntentSource::Risk, 0);
  EXPECT_TRUE(book.markCanceled(3));
  EXPECT_FALSE(book.markCanceled(3));
  EXPECT_EQ(book.size(), 0u);
}

// -----------------------------------------------------------------------------
// 5. Reconciliation: tracked orders missing on the exchange are returned as
//    missing and dropped; exchange orders we never placed are reported as
//    untracked and left alone.
// -----------------------------------------------------------------------------
TEST_F(OrderBookStateTest, ReconcileOpenOrders) {
  book.track(limitOrder(1, 1.0), IntentSource::Grid, 0);
  book.track(limitOrder(2, 1.0), IntentSource::Grid, 1);
  book.track(limitOrder(3, 1.0), IntentSource::Risk, 0);

  std::vector<Order> exchange_open{limitOrder(1, 1.0), limitOrder(42, 1.0)};
  auto result = book.reconcileOpenOrders(exchange_open);

  ASSERT_EQ(result.missing.size(), 2u);
  EXPECT_EQ(result.missing[0].order.id, 2u);
  EXPECT_EQ(result.missing[0].order.status, OrderStatus::Canceled);
  EXPECT_EQ(result.missing[1].order.id, 3u);
  EXPECT_EQ(result.missing[1].owner, IntentSource::Risk);
  ASSERT_EQ(result.untracked.size(), 1u);
  EXPECT_EQ(result.untracked[0].id, 42u);

  EXPECT_EQ(book.size(), 1u);
  EXPECT_NE(book.find(1), nullptr);
  EXPECT_EQ(book.find(42), nullptr);
}

// -----------------------------------------------------------------------------
// 6. Every status change is published as an OrderUpdateEvent; hydrate()
//    is silent.
// -----------------------------------------------------------------------------
TEST_F(OrderBookStateTest, PublishesOrderUpdates) {
  book.hydrate(TrackedOrder{limitOrder(5, 1.0), IntentSource::Grid, 2});
  EXPECT_EQ(notifier.eventCount(), 0u);

  book.track(limitOrder(6, 1.0), IntentSource::Dca, 1);
  book.applyFill(fillOf(6, 1.0));
  book.markCanceled(5);

  auto updates = notifier.eventsOf<gridcore::OrderUpdateEvent>();
  ASSERT_EQ(updates.size(), 3u);
  EXPECT_EQ(updates[0].order.status, OrderStatus::Accepted);
  EXPECT_EQ(updates[1].order.status, OrderStatus::Filled);
  EXPECT_EQ(updates[1].previous_status, OrderStatus::Accepted);
  EXPECT_EQ(updates[1].owner, IntentSource::Dca);
  EXPECT_EQ(updates[2].order.id, 5u);
  EXPECT_EQ(updates[2].order.status, OrderStatus::Canceled);
}

// -----------------------------------------------------------------------------
// 7. reconcilePosition() reports whether anything changed.
// -----------------------------------------------------------------------------
TEST_F(OrderBookStateTest, ReconcilePositionReportsChanges) {
  gridcore::domain::Position p;
  p.symbol = "BTCUSDT";
  p.net_quantity = 0.1;
  p.average_price = 60000.0;

  EXPECT_TRUE(book.reconcilePosition(p));
  EXPECT_FALSE(book.reconcilePosition(p));
  p.mark_price = 60100.0;
  EXPECT_TRUE(book.reconcilePosition(p));
  EXPECT_DOUBLE_EQ(book.position().mark_price, 60100.0);
}
