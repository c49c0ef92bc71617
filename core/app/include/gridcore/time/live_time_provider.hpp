#pragma once

#include "gridcore/time/i_time_provider.hpp"

namespace gridcore {

// Wall clock (std::chrono::system_clock). Used by the production binary.
class LiveTimeProvider final : public ITimeProvider {
 public:
  std::int64_t now_ms() const override;
};

}  // namespace gridcore
