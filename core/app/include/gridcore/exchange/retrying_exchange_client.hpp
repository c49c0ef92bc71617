#pragma once

#include "gridcore/config/bot_config.hpp"
#include "gridcore/errors/errors.hpp"
#include "gridcore/exchange/i_exchange_client.hpp"
#include "gridcore/supervisor/exponential_backoff.hpp"

#include <chrono>
#include <functional>
#include <iostream>
#include <string>

namespace gridcore {

// -----------------------------------------------------------------------------
// RetryingExchangeClient
// -----------------------------------------------------------------------------
// @brief  Decorator that retries transient exchange failures with bounded
//         exponential backoff.
//
// @details
// Transient kinds (Timeout, RateLimited, NetworkError) are retried up to
// max_attempts total calls; the last error is rethrown unchanged. All other
// kinds propagate immediately.
//
// placeOrder() is special: only RateLimited is retried, because a timed-out
// or dropped placement may already be resting on the book and a blind
// retry would double the order. The caller treats the failure as a failed
// placement and reconciliation picks up the truth later.
//
// The sleeper is injectable so tests run without real delays.
//
// Ownership: decorates (does not own) the inner client.
// -----------------------------------------------------------------------------
class RetryingExchangeClient final : public IExchangeClient {
 public:
  using Sleeper = std::function<void(std::chrono::milliseconds)>;

  static Sleeper realSleeper();

  RetryingExchangeClient(IExchangeClient& inner,
                         config::ExchangeRetryConfig policy,
                         Sleeper sleeper = realSleeper());

  void connect() override;
  void disconnect() override;
  bool isConnected() const override;
  domain::PriceSnapshot getPrice(const std::string& symbol) override;
  domain::OrderId placeOrder(const domain::OrderRequest& request) override;
  void cancelOrder(domain::OrderId id) override;
  domain::Position getPosition(const std::string& symbol) override;
  double getEquity() override;
  std::vector<domain::Order> getOpenOrders(const std::string& symbol) override;
  std::vector<domain::Fill> drainFills() override;

  // Total number of retries performed (not counting first attempts).
  std::size_t retries() const { return retries_; }

 private:
  template <typename Fn>
  auto withRetry(const char* operation, Fn&& fn,
                 bool (*retryable)(const ExchangeError&) = &isTransient)
      -> decltype(fn());

  static bool isTransient(const ExchangeError& e) { return e.isTransient(); }

  IExchangeClient& inner_;
  config::ExchangeRetryConfig policy_;
  Sleeper sleeper_;
  std::size_t retries_{0};
};

template <typename Fn>
auto RetryingExchangeClient::withRetry(const char* operation, Fn&& fn,
                                       bool (*retryable)(const ExchangeError&))
    -> decltype(fn()) {
  ExponentialBackoff backoff(policy_.retry_initial_ms, policy_.retry_max_ms);
  for (int attempt = 1;; ++attempt) {
    try {
      return fn();
    } catch (const ExchangeError& e) {
      if (!retryable(e) || attempt >= policy_.max_attempts) {
        throw;
      }
      std::int64_t delay = backoff.next();
      std::cerr << "[RetryingExchangeClient] " << operation << " failed ("
                << e.what() << "), attempt " << attempt << "/"
                << policy_.max_attempts << ", retrying in " << delay
                << " ms\n";
      ++retries_;
      sleeper_(std::chrono::milliseconds(delay));
    }
  }
}

}  // namespace gridcore
