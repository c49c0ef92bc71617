#pragma once

#include <cstdint>

namespace gridcore {

// -----------------------------------------------------------------------------
// ExponentialBackoff
// -----------------------------------------------------------------------------
// Capped exponential delay sequence: initial, initial*m, initial*m^2, ...,
// max, max, ... Used for exchange call retries and for the supervisor's
// delay after a suppressed restart.
// -----------------------------------------------------------------------------
class ExponentialBackoff {
 public:
  ExponentialBackoff(std::int64_t initial_ms, std::int64_t max_ms,
                     double multiplier = 2.0);

  // Returns the current delay and advances to the next one.
  std::int64_t next();

  // Delay the next call to next() will return.
  std::int64_t peek() const { return current_ms_; }

  void reset();

  int attempts() const { return attempts_; }

 private:
  std::int64_t initial_ms_;
  std::int64_t max_ms_;
  double multiplier_;
  std::int64_t current_ms_;
  int attempts_{0};
};

}  // namespace gridcore
