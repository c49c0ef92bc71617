#include "gridcore/notify/console_logger.hpp"

#include <iomanip>
#include <ostream>
#include <sstream>
#include <type_traits>

namespace gridcore {

namespace {

// Which stream an event belongs on.
bool isError(const Event& event) {
  if (const auto* alert = std::get_if<AlertEvent>(&event)) {
    return alert->severity != AlertSeverity::Info;
  }
  if (std::holds_alternative<RiskEvent>(event)) {
    return true;
  }
  return false;
}

}  // namespace

ConsoleLogger::ConsoleLogger(EventBus& bus, std::ostream& out,
                             std::ostream& err)
    : bus_(bus), out_(out), err_(err) {
  subscription_id_ =
      bus_.subscribe([this](const Event& event) { onEvent(event); });
}

ConsoleLogger::~ConsoleLogger() { bus_.unsubscribe(subscription_id_); }

void ConsoleLogger::onEvent(const Event& event) {
  std::string line = format(event);
  std::lock_guard lock(write_mutex_);
  (isError(event) ? err_ : out_) << line << "\n";
}

std::string ConsoleLogger::format(const Event& event) {
  std::ostringstream os;
  os << std::fixed << std::setprecision(4);

  std::visit(
      [&os](const auto& e) {
        using T = std::decay_t<decltype(e)>;
        if constexpr (std::is_same_v<T, TickEvent>) {
          os << "[Tick] #" << e.tick_sequence << " " << e.symbol
             << " price=" << e.price << " fills=" << e.fills
             << " submitted=" << e.intents_submitted
             << " failed=" << e.intents_failed;
        } else if constexpr (std::is_same_v<T, OrderUpdateEvent>) {
          os << "[OrderUpdate] id=" << e.order.id << " owner="
             << domain::toString(e.owner) << " "
             << domain::toString(e.order.side) << " "
             << domain::toString(e.order.type) << " qty=" << e.order.quantity
             << " price=" << e.order.price << " "
             << domain::toString(e.previous_status) << " -> "
             << domain::toString(e.order.status);
        } else if constexpr (std::is_same_v<T, FillEvent>) {
          os << "[Fill] order_id=" << e.fill.order_id << " owner="
             << (e.owned ? domain::toString(e.owner) : "unknown") << " "
             << domain::toString(e.fill.side) << " qty=" << e.fill.quantity
             << " price=" << e.fill.price;
        } else if constexpr (std::is_same_v<T, PositionUpdateEvent>) {
          os << "[Position] " << e.position.symbol
             << " net_qty=" << e.position.net_quantity
             << " avg_price=" << e.position.average_price
             << " upnl=" << e.position.unrealized_pnl
             << " rpnl=" << e.position.realized_pnl << " equity=" << e.equity;
        } else if constexpr (std::is_same_v<T, RiskEvent>) {
          os << "[Risk] " << domain::toString(e.action) << " " << e.symbol
             << ": " << e.reason << " (value=" << e.current_value
             << " limit=" << e.limit_value << ")";
        } else if constexpr (std::is_same_v<T, HealthEvent>) {
          os << "[Supervisor] " << domain::toString(e.previous_state) << " -> "
             << domain::toString(e.status.state)
             << " failures=" << e.status.consecutive_failures
             << " restarts_in_window=" << e.status.restarts_in_window;
          if (!e.message.empty()) {
            os << " (" << e.message << ")";
          }
        } else if constexpr (std::is_same_v<T, AlertEvent>) {
          os << "[Alert] " << toString(e.severity) << " " << e.source << ": "
             << e.message;
        }
      },
      event);

  return os.str();
}

}  // namespace gridcore
