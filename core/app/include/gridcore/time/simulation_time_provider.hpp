#pragma once

#include "gridcore/time/i_time_provider.hpp"

#include <atomic>
#include <cstdint>

namespace gridcore {

// -----------------------------------------------------------------------------
// SimulationTimeProvider
// -----------------------------------------------------------------------------
// Manually driven clock. Time only moves when set_time()/advance() is
// called, which makes rolling-window and backoff behaviour deterministic in
// tests. Both setters are safe to call while other threads read now_ms().
// -----------------------------------------------------------------------------
class SimulationTimeProvider final : public ITimeProvider {
 public:
  explicit SimulationTimeProvider(std::int64_t start_ms = 0)
      : current_time_ms_(start_ms) {}

  std::int64_t now_ms() const override;

  // Jumps to an absolute time.
  void set_time(std::int64_t new_time_ms);

  // Moves forward by delta_ms.
  void advance(std::int64_t delta_ms);

 private:
  std::atomic<std::int64_t> current_time_ms_;
};

}  // namespace gridcore
