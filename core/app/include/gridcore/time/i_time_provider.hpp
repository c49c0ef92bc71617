#pragma once

#include <cstdint>

namespace gridcore {

// -----------------------------------------------------------------------------
// ITimeProvider
// -----------------------------------------------------------------------------
// @brief  Clock abstraction for everything that reasons about time.
//
// @details
// The supervisor's restart window, the stale-tick detector, order
// timestamps and snapshot timestamps all read time through this interface
// so tests can drive a full hour of restarts with SimulationTimeProvider in
// microseconds of wall time.
//
// Thread-safety: Implementations must allow concurrent now_ms() calls.
// -----------------------------------------------------------------------------
class ITimeProvider {
 public:
  virtual ~ITimeProvider() = default;

  // Milliseconds since the Unix epoch (or since simulation start).
  virtual std::int64_t now_ms() const = 0;
};

}  // namespace gridcore
