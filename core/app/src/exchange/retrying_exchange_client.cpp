#include "gridcore/exchange/retrying_exchange_client.hpp"

#include <thread>
#include <utility>

namespace gridcore {

namespace {

bool isRateLimited(const ExchangeError& e) {
  return e.kind() == ExchangeErrorKind::RateLimited;
}

}  // namespace

RetryingExchangeClient::Sleeper RetryingExchangeClient::realSleeper() {
  return [](std::chrono::milliseconds delay) {
    std::this_thread::sleep_for(delay);
  };
}

RetryingExchangeClient::RetryingExchangeClient(
    IExchangeClient& inner, config::ExchangeRetryConfig policy,
    Sleeper sleeper)
    : inner_(inner), policy_(policy), sleeper_(std::move(sleeper)) {}

void RetryingExchangeClient::connect() {
  withRetry("connect", [this] { inner_.connect(); });
}

void RetryingExchangeClient::disconnect() { inner_.disconnect(); }

bool RetryingExchangeClient::isConnected() const {
  return inner_.isConnected();
}

domain::PriceSnapshot RetryingExchangeClient::getPrice(
    const std::string& symbol) {
  return withRetry("getPrice", [&] { return inner_.getPrice(symbol); });
}

domain::OrderId RetryingExchangeClient::placeOrder(
    const domain::OrderRequest& request) {
  return withRetry(
      "placeOrder", [&] { return inner_.placeOrder(request); },
      &isRateLimited);
}

void RetryingExchangeClient::cancelOrder(domain::OrderId id) {
  withRetry("cancelOrder", [&] { inner_.cancelOrder(id); });
}

domain::Position RetryingExchangeClient::getPosition(
    const std::string& symbol) {
  return withRetry("getPosition", [&] { return inner_.getPosition(symbol); });
}

double RetryingExchangeClient::getEquity() {
  return withRetry("getEquity", [&] { return inner_.getEquity(); });
}

std::vector<domain::Order> RetryingExchangeClient::getOpenOrders(
    const std::string& symbol) {
  return withRetry("getOpenOrders",
                   [&] { return inner_.getOpenOrders(symbol); });
}

std::vector<domain::Fill> RetryingExchangeClient::drainFills() {
  return withRetry("drainFills", [&] { return inner_.drainFills(); });
}

}  // namespace gridcore
