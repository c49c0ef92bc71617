// =============================================================================
// console_logger_test.cpp
// =============================================================================
// Unit tests for gridcore::ConsoleLogger.
//
// Validates:
//   - One formatted line per event, with the component prefix
//   - Alerts (Warning/Critical) and risk actions go to the error stream
//   - Unsubscribes from the bus on destruction
// =============================================================================

#include "gridcore/notify/console_logger.hpp"
#include "gridcore/notify/event_bus_notifier.hpp"

#include <gtest/gtest.h>

#include <sstream>

using namespace gridcore;

class ConsoleLoggerTest : public ::testing::Test {
 protected:
  EventBus bus;
  EventBusNotifier notifier{bus};
  std::ostringstream out;
  std::ostringstream err;
};

// -----------------------------------------------------------------------------
// 1. Line formats.
// -----------------------------------------------------------------------------
TEST_F(ConsoleLoggerTest, FormatsEvents) {
  TickEvent tick;
  tick.symbol = "BTCUSDT";
  tick.price = 60000.0;
  tick.tick_sequence = 12;
  tick.fills = 2;
  tick.intents_submitted = 3;
  EXPECT_EQ(ConsoleLogger::format(tick),
            "[Tick] #12 BTCUSDT price=60000.0000 fills=2 submitted=3 failed=0");

  FillEvent fill;
  fill.fill.order_id = 9;
  fill.fill.side = domain::Side::Buy;
  fill.fill.quantity = 0.01;
  fill.fill.price = 59640.0;
  fill.owner = domain::IntentSource::Grid;
  EXPECT_EQ(ConsoleLogger::format(fill),
            "[Fill] order_id=9 owner=Grid Buy qty=0.0100 price=59640.0000");
  fill.owned = false;
  EXPECT_NE(ConsoleLogger::format(fill).find("owner=unknown"),
            std::string::npos);

  AlertEvent alert;
  alert.severity = AlertSeverity::Critical;
  alert.source = "TradingSession";
  alert.message = "kill switch triggered";
  EXPECT_EQ(ConsoleLogger::format(alert),
            "[Alert] Critical TradingSession: kill switch triggered");

  HealthEvent health;
  health.previous_state = domain::SupervisorState::Running;
  health.status.state = domain::SupervisorState::Degraded;
  health.message = "exchange connection lost";
  EXPECT_EQ(ConsoleLogger::format(health),
            "[Supervisor] Running -> Degraded failures=0 restarts_in_window=0 "
            "(exchange connection lost)");
}

// -----------------------------------------------------------------------------
// 2. Routing between the two streams.
// -----------------------------------------------------------------------------
TEST_F(ConsoleLoggerTest, RoutesAlertsAndRiskToErrorStream) {
  ConsoleLogger logger(bus, out, err);

  TickEvent tick;
  tick.symbol = "BTCUSDT";
  notifier.record(tick);

  RiskEvent risk;
  risk.action = domain::RiskAction::ArmBreakeven;
  risk.symbol = "BTCUSDT";
  notifier.record(risk);

  AlertEvent warning;
  warning.severity = AlertSeverity::Warning;
  warning.source = "Supervisor";
  warning.message = "restart suppressed";
  notifier.alert(warning);

  AlertEvent info = warning;
  info.severity = AlertSeverity::Info;
  notifier.alert(info);

  EXPECT_NE(out.str().find("[Tick]"), std::string::npos);
  EXPECT_NE(out.str().find("[Alert] Info"), std::string::npos);
  EXPECT_EQ(out.str().find("[Risk]"), std::string::npos);

  EXPECT_NE(err.str().find("[Risk] ArmBreakeven BTCUSDT"), std::string::npos);
  EXPECT_NE(err.str().find("[Alert] Warning Supervisor: restart suppressed"),
            std::string::npos);
  EXPECT_EQ(err.str().find("[Tick]"), std::string::npos);
}

// -----------------------------------------------------------------------------
// 3. Destruction unsubscribes.
// -----------------------------------------------------------------------------
TEST_F(ConsoleLoggerTest, UnsubscribesOnDestruction) {
  {
    ConsoleLogger logger(bus, out, err);
    EXPECT_EQ(bus.subscriberCount(), 1u);
  }
  EXPECT_EQ(bus.subscriberCount(), 0u);
  notifier.record(TickEvent{});
  EXPECT_TRUE(out.str().empty());
}
