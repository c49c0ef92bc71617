#pragma once

#include <cstddef>
#include <cstdint>
#include <deque>

namespace gridcore {

struct EquitySample {
  std::int64_t timestamp_ms{0};
  double equity{0.0};
};

// -----------------------------------------------------------------------------
// EquityHistory
// -----------------------------------------------------------------------------
// Bounded window of equity samples, one per tick. The oldest sample is
// dropped once capacity is reached. The drawdown peak is not taken from
// this window (RiskState keeps the all-time session peak); the window only
// feeds the performance report (range over the window) and the latest
// equity value.
// -----------------------------------------------------------------------------
class EquityHistory {
 public:
  explicit EquityHistory(std::size_t capacity = 720) : capacity_(capacity) {}

  void push(std::int64_t timestamp_ms, double equity) {
    samples_.push_back(EquitySample{timestamp_ms, equity});
    while (samples_.size() > capacity_) {
      samples_.pop_front();
    }
  }

  bool empty() const { return samples_.empty(); }
  std::size_t size() const { return samples_.size(); }
  const EquitySample& latest() const { return samples_.back(); }
  const std::deque<EquitySample>& samples() const { return samples_; }

  double maxEquity() const {
    double peak = 0.0;
    for (const auto& s : samples_) {
      if (s.equity > peak) {
        peak = s.equity;
      }
    }
    return peak;
  }

  void clear() { samples_.clear(); }

 private:
  std::size_t capacity_;
  std::deque<EquitySample> samples_;
};

}  // namespace gridcore
