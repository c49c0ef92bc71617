#include "gridcore/supervisor/restart_rate_limiter.hpp"

#include <algorithm>
#include <stdexcept>

namespace gridcore {

RestartRateLimiter::RestartRateLimiter(std::size_t max_events,
                                       std::int64_t window_ms)
    : max_events_(max_events), window_ms_(window_ms) {
  if (max_events == 0 || window_ms <= 0) {
    throw std::invalid_argument(
        "RestartRateLimiter needs a positive budget and window");
  }
}

bool RestartRateLimiter::tryAcquire(std::int64_t now_ms) {
  prune(now_ms);
  if (events_.size() >= max_events_) {
    return false;
  }
  events_.push_back(now_ms);
  return true;
}

std::size_t RestartRateLimiter::countInWindow(std::int64_t now_ms) const {
  return static_cast<std::size_t>(
      std::count_if(events_.begin(), events_.end(), [&](std::int64_t t) {
        return t > now_ms - window_ms_;
      }));
}

std::int64_t RestartRateLimiter::nextAvailableAt(std::int64_t now_ms) const {
  if (countInWindow(now_ms) < max_events_) {
    return now_ms;
  }
  // The budget frees up when the oldest in-window event expires.
  std::size_t expired = events_.size() - countInWindow(now_ms);
  return events_[expired] + window_ms_;
}

void RestartRateLimiter::prune(std::int64_t now_ms) {
  while (!events_.empty() && events_.front() <= now_ms - window_ms_) {
    events_.pop_front();
  }
}

}  // namespace gridcore
