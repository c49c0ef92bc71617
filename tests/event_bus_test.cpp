// =============================================================================
// event_bus_test.cpp
// =============================================================================
// Unit tests for gridcore::EventBus.
//
// Validates:
//   - Generic subscription receives every event alternative
//   - Typed subscription receives only its alternative
//   - Unsubscribe stops delivery; unknown ids are ignored
//   - Re-entrant publish from inside a callback does not deadlock
//   - Payloads survive the variant dispatch
// =============================================================================

#include "gridcore/eventbus/event_bus.hpp"
#include "gridcore/events/event.hpp"

#include <gtest/gtest.h>

#include <string>
#include <vector>

class EventBusTest : public ::testing::Test {
 protected:
  gridcore::EventBus bus;

  static gridcore::TickEvent makeTick(std::uint64_t seq, double price) {
    gridcore::TickEvent e;
    e.symbol = "BTCUSDT";
    e.price = price;
    e.tick_sequence = seq;
    return e;
  }

  static gridcore::AlertEvent makeAlert(const std::string& message) {
    gridcore::AlertEvent e;
    e.severity = gridcore::AlertSeverity::Critical;
    e.source = "test";
    e.message = message;
    return e;
  }
};

// -----------------------------------------------------------------------------
// 1. A generic subscriber sees every event type.
// Why: ConsoleLogger and the IPC telemetry bridge subscribe generically; a
//      skipped alternative would silently vanish from the audit trail.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, GenericSubscriberReceivesAllEvents) {
  int call_count = 0;
  bus.subscribe([&call_count](const gridcore::Event&) { ++call_count; });

  bus.publish(makeTick(1, 60000.0));
  bus.publish(makeAlert("kill switch"));
  bus.publish(gridcore::RiskEvent{});
  bus.publish(gridcore::HealthEvent{});

  EXPECT_EQ(call_count, 4);
}

// -----------------------------------------------------------------------------
// 2. A typed subscriber fires only for its own alternative.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, TypedSubscriberFiltersCorrectly) {
  int alerts = 0;
  bus.subscribe<gridcore::AlertEvent>(
      [&alerts](const gridcore::AlertEvent&) { ++alerts; });

  bus.publish(makeTick(1, 60000.0));
  bus.publish(makeAlert("restart suppressed"));
  bus.publish(makeTick(2, 60010.0));

  EXPECT_EQ(alerts, 1);
}

// -----------------------------------------------------------------------------
// 3. Subscribers are invoked in subscription order.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, SubscribersRunInSubscriptionOrder) {
  std::vector<int> order;
  bus.subscribe([&order](const gridcore::Event&) { order.push_back(1); });
  bus.subscribe([&order](const gridcore::Event&) { order.push_back(2); });
  bus.subscribe([&order](const gridcore::Event&) { order.push_back(3); });

  bus.publish(makeTick(1, 1.0));

  EXPECT_EQ(order, (std::vector<int>{1, 2, 3}));
}

// -----------------------------------------------------------------------------
// 4. After unsubscribe(id) the callback no longer fires.
// Why: ConsoleLogger unsubscribes in its destructor; a late callback would
//      write through a dangling stream reference.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, UnsubscribeStopsDelivery) {
  int call_count = 0;
  auto id = bus.subscribe<gridcore::TickEvent>(
      [&call_count](const gridcore::TickEvent&) { ++call_count; });
  EXPECT_EQ(bus.subscriberCount(), 1u);

  bus.publish(makeTick(1, 60000.0));
  bus.unsubscribe(id);
  bus.publish(makeTick(2, 60000.0));

  EXPECT_EQ(call_count, 1);
  EXPECT_EQ(bus.subscriberCount(), 0u);
}

// -----------------------------------------------------------------------------
// 5. Unknown ids and empty buses are harmless.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, UnsubscribeUnknownIdAndPublishToEmptyBus) {
  EXPECT_NO_FATAL_FAILURE(bus.unsubscribe(9999));
  EXPECT_NO_FATAL_FAILURE(bus.publish(makeTick(1, 1.0)));
}

// -----------------------------------------------------------------------------
// 6. Publishing from inside a callback must not deadlock.
// Why: The subscriber list is copied before dispatch. Holding the lock across
//      callbacks would hang this test.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, SubscriberCanPublishInsideCallback) {
  int alerts = 0;
  bus.subscribe<gridcore::AlertEvent>(
      [&alerts](const gridcore::AlertEvent&) { ++alerts; });
  bus.subscribe<gridcore::RiskEvent>([this](const gridcore::RiskEvent& risk) {
    bus.publish(makeAlert("risk: " + risk.reason));
  });

  gridcore::RiskEvent risk;
  risk.action = gridcore::domain::RiskAction::KillSwitch;
  risk.reason = "drawdown";
  bus.publish(risk);

  EXPECT_EQ(alerts, 1);
}

// -----------------------------------------------------------------------------
// 7. Field values survive publish and dispatch.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, TypedSubscriberReceivesCorrectData) {
  gridcore::TickEvent received;
  bus.subscribe<gridcore::TickEvent>(
      [&received](const gridcore::TickEvent& e) { received = e; });

  bus.publish(makeTick(42, 61234.5));

  EXPECT_EQ(received.symbol, "BTCUSDT");
  EXPECT_EQ(received.tick_sequence, 42u);
  EXPECT_DOUBLE_EQ(received.price, 61234.5);
}
