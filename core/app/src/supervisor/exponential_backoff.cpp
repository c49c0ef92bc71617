#include "gridcore/supervisor/exponential_backoff.hpp"

#include <algorithm>
#include <stdexcept>

namespace gridcore {

ExponentialBackoff::ExponentialBackoff(std::int64_t initial_ms,
                                       std::int64_t max_ms, double multiplier)
    : initial_ms_(initial_ms),
      max_ms_(max_ms),
      multiplier_(multiplier),
      current_ms_(initial_ms) {
  if (initial_ms < 0 || max_ms < initial_ms || multiplier < 1.0) {
    throw std::invalid_argument(
        "ExponentialBackoff requires 0 <= initial <= max and multiplier >= 1");
  }
}

std::int64_t ExponentialBackoff::next() {
  std::int64_t delay = current_ms_;
  double grown = static_cast<double>(current_ms_) * multiplier_;
  current_ms_ = grown >= static_cast<double>(max_ms_)
                    ? max_ms_
                    : std::max<std::int64_t>(static_cast<std::int64_t>(grown),
                                             current_ms_);
  ++attempts_;
  return delay;
}

void ExponentialBackoff::reset() {
  current_ms_ = initial_ms_;
  attempts_ = 0;
}

}  // namespace gridcore
