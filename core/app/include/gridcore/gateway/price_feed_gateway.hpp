#pragma once

#include "gridcore/domain/market.hpp"

#include <zmq.hpp>

#include <atomic>
#include <functional>
#include <optional>
#include <string>

namespace gridcore {

// -----------------------------------------------------------------------------
// PriceFeedGateway
// -----------------------------------------------------------------------------
//
// @brief  Subscribes to a ZMQ PUB price feed and forwards every valid quote
//         to a sink.
//
// @details
// Wire format, one JSON object per message:
//
//   {"timestamp_ms": 1700000000000, "symbol": "BTCUSDT", "price": 60000.0}
//
// Messages for other symbols are skipped. Malformed messages are logged to
// stderr and skipped; the feed never stops on bad input.
//
// In the paper-trading binary the sink is SimulatedExchange::setMarkPrice,
// so the feed is what moves the simulated market.
//
// Thread model:
//   run()  blocks; call it from a dedicated thread.
//   stop() any thread; run() returns within kRecvTimeoutMs.
// -----------------------------------------------------------------------------
class PriceFeedGateway {
 public:
  using PriceSink = std::function<void(const domain::PriceSnapshot&)>;

  PriceFeedGateway(std::string symbol, PriceSink sink,
                   const std::string& endpoint = "tcp://127.0.0.1:5555");

  PriceFeedGateway(const PriceFeedGateway&) = delete;
  PriceFeedGateway& operator=(const PriceFeedGateway&) = delete;
  PriceFeedGateway(PriceFeedGateway&&) = delete;
  PriceFeedGateway& operator=(PriceFeedGateway&&) = delete;

  void run();
  void stop();

  std::size_t received() const { return received_.load(); }

  // std::nullopt for malformed JSON, missing fields or a non-positive price.
  static std::optional<domain::PriceSnapshot> parse(const std::string& payload);

 private:
  static constexpr int kRecvTimeoutMs = 100;

  const std::string symbol_;
  PriceSink sink_;

  zmq::context_t context_{1};
  zmq::socket_t socket_{context_, zmq::socket_type::sub};

  std::atomic<bool> running_{false};
  std::atomic<std::size_t> received_{0};
};

}  // namespace gridcore
