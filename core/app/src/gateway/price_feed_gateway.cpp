#include "gridcore/gateway/price_feed_gateway.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <iostream>
#include <utility>

namespace gridcore {

PriceFeedGateway::PriceFeedGateway(std::string symbol, PriceSink sink,
                                   const std::string& endpoint)
    : symbol_(std::move(symbol)), sink_(std::move(sink)) {
  socket_.set(zmq::sockopt::subscribe, "");
  // Without a timeout recv() never returns and stop() would hang.
  socket_.set(zmq::sockopt::rcvtimeo, kRecvTimeoutMs);
  socket_.connect(endpoint);
}

std::optional<domain::PriceSnapshot> PriceFeedGateway::parse(
    const std::string& payload) {
  try {
    auto json = nlohmann::json::parse(payload);

    domain::PriceSnapshot quote;
    quote.timestamp_ms = json.at("timestamp_ms").get<std::int64_t>();
    quote.symbol = json.at("symbol").get<std::string>();
    quote.price = json.at("price").get<double>();
    if (!(quote.price > 0.0)) {
      std::cerr << "[PriceFeedGateway] non-positive price in: " << payload
                << "\n";
      return std::nullopt;
    }
    return quote;
  } catch (const nlohmann::json::exception& e) {
    std::cerr << "[PriceFeedGateway] JSON parse error: " << e.what()
              << " payload: " << payload << "\n";
    return std::nullopt;
  }
}

void PriceFeedGateway::run() {
  running_.store(true);

  while (running_.load()) {
    zmq::message_t msg;
    zmq::recv_result_t result;
    try {
      result = socket_.recv(msg, zmq::recv_flags::none);
    } catch (const zmq::error_t& e) {
      if (e.num() == EINTR) {
        continue;
      }
      throw;
    }
    if (!result.has_value()) {
      continue;  // timeout, re-check the stop flag
    }

    auto quote = parse(msg.to_string());
    if (!quote || quote->symbol != symbol_) {
      continue;
    }
    ++received_;
    sink_(*quote);
  }
}

void PriceFeedGateway::stop() { running_.store(false); }

}  // namespace gridcore
