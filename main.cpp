// -----------------------------------------------------------------------------
// gridcore_bot: single executable entry point.
//
// Paper-trading mode:
//   1) Load the configuration (argv[1], or defaults) plus environment
//      overrides. A ConfigError ends the process before anything starts.
//   2) Build the stack: clock, simulated exchange behind the retry
//      decorator, JSON state file, event bus with console logger and IPC
//      telemetry, TradingSession and its Supervisor.
//   3) Run the PriceFeedGateway on its own thread; every quote moves the
//      simulated exchange's mark price.
//   4) Run the Supervisor on the main thread until it reaches Stopped
//      (kill switch, unrecoverable error, STOP command or Ctrl-C).
//
// Thread layout:
//   main thread        Supervisor::run()
//   tick thread        TradingSession ticks (owned by the session)
//   price feed thread  PriceFeedGateway::run()
//   ipc thread         IpcServer commands and telemetry
//
// Everything is stack-local in main(); the signal handler reaches it through
// the two pointers below, set once before SIGINT is installed.
// -----------------------------------------------------------------------------

#include "gridcore/config/config_loader.hpp"
#include "gridcore/engine/control_commands.hpp"
#include "gridcore/engine/trading_session.hpp"
#include "gridcore/errors/errors.hpp"
#include "gridcore/eventbus/event_bus.hpp"
#include "gridcore/exchange/retrying_exchange_client.hpp"
#include "gridcore/exchange/simulated_exchange.hpp"
#include "gridcore/gateway/price_feed_gateway.hpp"
#include "gridcore/network/ipc_server.hpp"
#include "gridcore/notify/console_logger.hpp"
#include "gridcore/notify/event_bus_notifier.hpp"
#include "gridcore/persistence/json_file_state_store.hpp"
#include "gridcore/supervisor/supervisor.hpp"
#include "gridcore/time/live_time_provider.hpp"

#include <csignal>
#include <iostream>
#include <thread>

static gridcore::Supervisor* g_supervisor_ptr = nullptr;
static gridcore::PriceFeedGateway* g_gateway_ptr = nullptr;

// Only lock-free atomic stores happen here. The supervisor notices the flag
// within one health check interval, the gateway within its recv timeout.
static void sigint_handler(int /*signum*/) {
  if (g_supervisor_ptr != nullptr) {
    g_supervisor_ptr->requestStopFromSignal();
  }
  if (g_gateway_ptr != nullptr) {
    g_gateway_ptr->stop();
  }
}

int main(int argc, char** argv) {
  // -------------------------------------------------------------------------
  // 1) Configuration.
  // -------------------------------------------------------------------------
  gridcore::config::BotConfig config;
  try {
    gridcore::config::ConfigLoader loader;
    config = loader.loadFile(argc > 1 ? argv[1] : "");
  } catch (const gridcore::ConfigError& e) {
    std::cerr << "[main] configuration error: " << e.what() << "\n";
    return 2;
  }

  std::cout << "[main] " << config.trading.symbol << " x"
            << config.trading.leverage << ", " << config.grid.levels
            << " grid levels, capital " << config.trading.initial_capital
            << "\n";

  // -------------------------------------------------------------------------
  // 2) Components.
  // -------------------------------------------------------------------------
  gridcore::LiveTimeProvider clock;

  gridcore::SimulatedExchange paper_exchange(
      config.trading.symbol, config.trading.initial_capital,
      config.trading.leverage, clock);
  gridcore::RetryingExchangeClient exchange(paper_exchange, config.exchange);

  gridcore::JsonFileStateStore store(config.persistence.state_file);

  gridcore::EventBus bus;
  gridcore::EventBusNotifier notifier(bus);
  gridcore::ConsoleLogger logger(bus, std::cout, std::cerr);

  gridcore::TradingSession session(config, exchange, store, clock, &notifier);
  gridcore::Supervisor supervisor(session, clock, config.supervisor,
                                  &notifier);

  gridcore::IpcServer ipc(
      [&session, &supervisor](const std::string& cmd) {
        return gridcore::handleControlCommand(cmd, session, supervisor);
      },
      config.ipc.command_endpoint, config.ipc.telemetry_endpoint);
  auto telemetry_sub = bus.subscribe(
      [&ipc](const gridcore::Event& event) { ipc.pushTelemetry(event); });

  try {
    ipc.start();
  } catch (const zmq::error_t& e) {
    std::cerr << "[main] IPC disabled, cannot bind: " << e.what() << "\n";
  }

  // -------------------------------------------------------------------------
  // 3) Price feed.
  // -------------------------------------------------------------------------
  gridcore::PriceFeedGateway gateway(
      config.trading.symbol,
      [&paper_exchange](const gridcore::domain::PriceSnapshot& quote) {
        paper_exchange.setMarkPrice(quote.price);
      },
      config.ipc.price_feed_endpoint);
  std::thread feed_thread([&gateway] {
    try {
      gateway.run();
    } catch (const zmq::error_t& e) {
      std::cerr << "[main] price feed stopped: " << e.what() << "\n";
    }
  });

  g_supervisor_ptr = &supervisor;
  g_gateway_ptr = &gateway;
  std::signal(SIGINT, sigint_handler);
  std::signal(SIGTERM, sigint_handler);

  // -------------------------------------------------------------------------
  // 4) Supervise until Stopped.
  // -------------------------------------------------------------------------
  supervisor.run();

  std::cout << "[main] supervisor stopped: " << supervisor.health().last_error
            << "\n";

  gateway.stop();
  feed_thread.join();

  bus.unsubscribe(telemetry_sub);
  ipc.stop();

  g_supervisor_ptr = nullptr;
  g_gateway_ptr = nullptr;

  std::cout << "[main] shutdown complete\n";
  return 0;
}
