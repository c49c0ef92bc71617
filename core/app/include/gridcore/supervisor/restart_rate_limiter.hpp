#pragma once

#include <cstddef>
#include <cstdint>
#include <deque>

namespace gridcore {

// -----------------------------------------------------------------------------
// RestartRateLimiter
// -----------------------------------------------------------------------------
// Rolling-window budget: at most `max_events` acquisitions within any
// `window_ms` span. Timestamps older than the window are pruned lazily.
//
// With the defaults (10 per hour) the 11th restart inside an hour is
// refused and allowed again once the oldest of the ten leaves the window.
// -----------------------------------------------------------------------------
class RestartRateLimiter {
 public:
  RestartRateLimiter(std::size_t max_events, std::int64_t window_ms);

  // Records an event at now_ms if the budget allows it.
  bool tryAcquire(std::int64_t now_ms);

  std::size_t countInWindow(std::int64_t now_ms) const;

  // Earliest time tryAcquire() can succeed (now_ms if it already can).
  std::int64_t nextAvailableAt(std::int64_t now_ms) const;

  std::size_t maxEvents() const { return max_events_; }
  std::int64_t windowMs() const { return window_ms_; }

 private:
  void prune(std::int64_t now_ms);

  std::size_t max_events_;
  std::int64_t window_ms_;
  std::deque<std::int64_t> events_;
};

}  // namespace gridcore
