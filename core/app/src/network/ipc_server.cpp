#include "gridcore/network/ipc_server.hpp"
#include "gridcore/time/time_utils.hpp"

#include <nlohmann/json.hpp>

#include <iostream>
#include <type_traits>
#include <variant>
#include <utility>

namespace gridcore {

namespace {

using nlohmann::json;

json orderUpdateJson(const OrderUpdateEvent& e) {
  json j;
  j["type"] = "order_update";
  j["order_id"] = e.order.id;
  j["symbol"] = e.order.symbol;
  j["side"] = domain::toString(e.order.side);
  j["order_type"] = domain::toString(e.order.type);
  j["status"] = domain::toString(e.order.status);
  j["previous_status"] = domain::toString(e.previous_status);
  j["owner"] = domain::toString(e.owner);
  j["quantity"] = e.order.quantity;
  j["price"] = e.order.price;
  j["filled_quantity"] = e.order.filled_quantity;
  return j;
}

json fillJson(const FillEvent& e) {
  json j;
  j["type"] = "fill";
  j["order_id"] = e.fill.order_id;
  j["symbol"] = e.fill.symbol;
  j["side"] = domain::toString(e.fill.side);
  j["price"] = e.fill.price;
  j["quantity"] = e.fill.quantity;
  j["owner"] = e.owned ? json(domain::toString(e.owner)) : json(nullptr);
  return j;
}

json positionJson(const PositionUpdateEvent& e) {
  json j;
  j["type"] = "position_update";
  j["symbol"] = e.position.symbol;
  j["net_quantity"] = e.position.net_quantity;
  j["average_price"] = e.position.average_price;
  j["mark_price"] = e.position.mark_price;
  j["unrealized_pnl"] = e.position.unrealized_pnl;
  j["realized_pnl"] = e.position.realized_pnl;
  j["equity"] = e.equity;
  return j;
}

json riskJson(const RiskEvent& e) {
  json j;
  j["type"] = "risk";
  j["symbol"] = e.symbol;
  j["action"] = domain::toString(e.action);
  j["reason"] = e.reason;
  j["current_value"] = e.current_value;
  j["limit_value"] = e.limit_value;
  return j;
}

json healthJson(const HealthEvent& e) {
  json j;
  j["type"] = "health";
  j["previous_state"] = domain::toString(e.previous_state);
  j["state"] = domain::toString(e.status.state);
  j["connection"] = domain::toString(e.status.connection);
  j["consecutive_failures"] = e.status.consecutive_failures;
  j["restarts_in_window"] = e.status.restarts_in_window;
  j["message"] = e.message;
  return j;
}

json alertJson(const AlertEvent& e) {
  json j;
  j["type"] = "alert";
  j["severity"] = toString(e.severity);
  j["source"] = e.source;
  j["message"] = e.message;
  return j;
}

}  // namespace

IpcServer::IpcServer(CommandHandler command_handler, std::string cmd_endpoint,
                     std::string pub_endpoint)
    : command_handler_(std::move(command_handler)),
      cmd_endpoint_(std::move(cmd_endpoint)),
      pub_endpoint_(std::move(pub_endpoint)) {}

IpcServer::~IpcServer() { stop(); }

void IpcServer::start() {
  if (running_.load()) {
    return;
  }

  context_ = std::make_unique<zmq::context_t>(1);
  cmd_socket_ =
      std::make_unique<zmq::socket_t>(*context_, zmq::socket_type::rep);
  pub_socket_ =
      std::make_unique<zmq::socket_t>(*context_, zmq::socket_type::pub);

  cmd_socket_->set(zmq::sockopt::rcvtimeo, kPollTimeoutMs);
  cmd_socket_->set(zmq::sockopt::linger, 0);
  pub_socket_->set(zmq::sockopt::linger, 0);
  cmd_socket_->bind(cmd_endpoint_);
  pub_socket_->bind(pub_endpoint_);

  running_.store(true);
  thread_ = std::thread([this] { run(); });

  std::cout << "[IpcServer] started. CMD=" << cmd_endpoint_
            << " PUB=" << pub_endpoint_ << "\n";
}

void IpcServer::stop() {
  if (!running_.exchange(false)) {
    if (thread_.joinable()) {
      thread_.join();
    }
    return;
  }

  if (thread_.joinable()) {
    thread_.join();
  }

  cmd_socket_.reset();
  pub_socket_.reset();
  context_.reset();

  std::cout << "[IpcServer] stopped.\n";
}

void IpcServer::pushTelemetry(Event event) {
  telemetry_queue_.push(std::move(event));
}

void IpcServer::run() {
  while (running_.load()) {
    processTelemetry();
    processCommands();
  }
  // Publish what is left before the sockets close.
  processTelemetry();
}

void IpcServer::processTelemetry() {
  while (auto event = telemetry_queue_.try_pop()) {
    auto text = formatTelemetry(*event);
    if (text.has_value()) {
      zmq::message_t msg(text->data(), text->size());
      if (!pub_socket_->send(msg, zmq::send_flags::dontwait)) {
        std::cerr << "[IpcServer] telemetry dropped (PUB would block)\n";
      }
    }
  }
}

void IpcServer::processCommands() {
  zmq::message_t request;
  zmq::recv_result_t result;

  try {
    result = cmd_socket_->recv(request, zmq::recv_flags::none);
  } catch (const zmq::error_t& e) {
    if (e.num() == EINTR) {
      return;
    }
    throw;
  }

  if (!result.has_value()) {
    return;
  }

  std::string command(static_cast<const char*>(request.data()),
                      request.size());
  std::string response = command_handler_(command);

  zmq::message_t reply(response.data(), response.size());
  cmd_socket_->send(reply, zmq::send_flags::none);
}

std::optional<std::string> IpcServer::formatTelemetry(const Event& event) {
  return std::visit(
      [](const auto& e) -> std::optional<std::string> {
        using T = std::decay_t<decltype(e)>;
        json j;
        if constexpr (std::is_same_v<T, OrderUpdateEvent>) {
          j = orderUpdateJson(e);
        } else if constexpr (std::is_same_v<T, FillEvent>) {
          j = fillJson(e);
        } else if constexpr (std::is_same_v<T, PositionUpdateEvent>) {
          j = positionJson(e);
        } else if constexpr (std::is_same_v<T, RiskEvent>) {
          j = riskJson(e);
        } else if constexpr (std::is_same_v<T, HealthEvent>) {
          j = healthJson(e);
        } else if constexpr (std::is_same_v<T, AlertEvent>) {
          j = alertJson(e);
        } else {
          return std::nullopt;
        }
        j["timestamp_ms"] = timestamp_to_ms(e.timestamp);
        return j.dump();
      },
      event);
}

}  // namespace gridcore
