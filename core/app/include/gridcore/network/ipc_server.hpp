#pragma once

#include "gridcore/concurrent/thread_safe_queue.hpp"
#include "gridcore/events/event.hpp"

#include <zmq.hpp>

#include <atomic>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <thread>

namespace gridcore {

// -----------------------------------------------------------------------------
// IpcServer: operator command and telemetry endpoint
// -----------------------------------------------------------------------------
//
// @brief  Serves operator commands on a ZMQ REP socket and broadcasts
//         telemetry as JSON on a ZMQ PUB socket.
//
// @details
// Both sockets are owned by a single worker thread (ZMQ sockets are not
// thread-safe). Other threads hand telemetry over through pushTelemetry(),
// which only enqueues.
//
// Commands are plain strings ("PING", "STATUS", "PERFORMANCE", "HALT",
// "STOP"); the reply is whatever the CommandHandler returns, typically a
// JSON object built by handleControlCommand().
//
// Thread model:
//   start()/stop()     owning thread (main)
//   pushTelemetry()    any thread, usually an EventBus subscriber
//   run()              IPC worker thread only
// -----------------------------------------------------------------------------
class IpcServer {
 public:
  using CommandHandler = std::function<std::string(const std::string&)>;

  // No sockets are opened until start().
  explicit IpcServer(CommandHandler command_handler,
                     std::string cmd_endpoint = "tcp://127.0.0.1:5556",
                     std::string pub_endpoint = "tcp://127.0.0.1:5557");

  ~IpcServer();

  IpcServer(const IpcServer&) = delete;
  IpcServer& operator=(const IpcServer&) = delete;
  IpcServer(IpcServer&&) = delete;
  IpcServer& operator=(IpcServer&&) = delete;

  // -------------------------------------------------------------------------
  // start()
  // -------------------------------------------------------------------------
  //
  // @brief  Binds both sockets and spawns the worker thread.
  //
  // @details
  // The REP socket gets a receive timeout of kPollTimeoutMs so the worker
  // alternates between commands and telemetry. Idempotent. A bind failure
  // propagates as zmq::error_t.
  // -------------------------------------------------------------------------
  void start();

  // Idempotent. Blocks for at most one poll timeout.
  void stop();

  void pushTelemetry(Event event);

  // -------------------------------------------------------------------------
  // formatTelemetry(event)
  // -------------------------------------------------------------------------
  //
  // @return One JSON object per event, with a "type" discriminator, or
  //         std::nullopt for events that are not broadcast (TickEvent is
  //         too chatty for the wire).
  // -------------------------------------------------------------------------
  static std::optional<std::string> formatTelemetry(const Event& event);

 private:
  static constexpr int kPollTimeoutMs = 50;

  void run();
  void processTelemetry();
  void processCommands();

  CommandHandler command_handler_;
  std::string cmd_endpoint_;
  std::string pub_endpoint_;

  std::unique_ptr<zmq::context_t> context_;
  std::unique_ptr<zmq::socket_t> cmd_socket_;
  std::unique_ptr<zmq::socket_t> pub_socket_;

  ThreadSafeQueue<Event> telemetry_queue_;
  std::thread thread_;
  std::atomic<bool> running_{false};
};

}  // namespace gridcore
