#pragma once

#include <stdexcept>
#include <string>

namespace gridcore {

// -----------------------------------------------------------------------------
// ExchangeErrorKind
// -----------------------------------------------------------------------------
// Failure taxonomy of the exchange collaborator. The kind, not the message,
// decides how the failure is handled:
//
//   Timeout, RateLimited, NetworkError   transient, retried at the call site
//   Rejected, InsufficientBalance        order-level, owning engine parks it
//   NotFound                             order already gone (cancel race)
//   Disconnected                         connection lost, supervisor recovers
//   AuthError                            unrecoverable, session stops
// -----------------------------------------------------------------------------
enum class ExchangeErrorKind {
  Timeout,
  RateLimited,
  NetworkError,
  Rejected,
  InsufficientBalance,
  NotFound,
  Disconnected,
  AuthError,
};

inline const char* toString(ExchangeErrorKind k) {
  switch (k) {
    case ExchangeErrorKind::Timeout:             return "Timeout";
    case ExchangeErrorKind::RateLimited:         return "RateLimited";
    case ExchangeErrorKind::NetworkError:        return "NetworkError";
    case ExchangeErrorKind::Rejected:            return "Rejected";
    case ExchangeErrorKind::InsufficientBalance: return "InsufficientBalance";
    case ExchangeErrorKind::NotFound:            return "NotFound";
    case ExchangeErrorKind::Disconnected:        return "Disconnected";
    case ExchangeErrorKind::AuthError:           return "AuthError";
  }
  return "Unknown";
}

class ExchangeError : public std::runtime_error {
 public:
  ExchangeError(ExchangeErrorKind kind, const std::string& message)
      : std::runtime_error(std::string(toString(kind)) + ": " + message),
        kind_(kind) {}

  ExchangeErrorKind kind() const noexcept { return kind_; }

  bool isTransient() const noexcept {
    return kind_ == ExchangeErrorKind::Timeout ||
           kind_ == ExchangeErrorKind::RateLimited ||
           kind_ == ExchangeErrorKind::NetworkError;
  }

  bool isOrderRejection() const noexcept {
    return kind_ == ExchangeErrorKind::Rejected ||
           kind_ == ExchangeErrorKind::InsufficientBalance;
  }

  bool isUnrecoverable() const noexcept {
    return kind_ == ExchangeErrorKind::AuthError;
  }

 private:
  ExchangeErrorKind kind_;
};

// Invalid or missing configuration. Raised once at startup, never retried.
class ConfigError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

// The persisted session state could not be read or written.
class StateStoreError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

}  // namespace gridcore
