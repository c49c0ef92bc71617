#pragma once

#include "gridcore/persistence/i_state_store.hpp"

#include <cstddef>
#include <mutex>
#include <vector>

namespace gridcore {

// Keeps the last snapshot in memory. Used by tests and dry runs.
class MemoryStateStore final : public IStateStore {
 public:
  void saveState(const SessionSnapshot& snapshot) override {
    std::lock_guard lock(mutex_);
    snapshot_ = snapshot;
    ++saves_;
  }

  std::optional<SessionSnapshot> loadState() override {
    std::lock_guard lock(mutex_);
    return snapshot_;
  }

  void appendTrade(const TradeRecord& record) override {
    std::lock_guard lock(mutex_);
    trades_.push_back(record);
  }

  void appendEquity(const EquityRecord& record) override {
    std::lock_guard lock(mutex_);
    equity_.push_back(record);
  }

  std::vector<TradeRecord> recentTrades(std::size_t limit) override {
    std::lock_guard lock(mutex_);
    return tail(trades_, limit);
  }

  std::vector<EquityRecord> recentEquity(std::size_t limit) override {
    std::lock_guard lock(mutex_);
    return tail(equity_, limit);
  }

  std::size_t saves() const {
    std::lock_guard lock(mutex_);
    return saves_;
  }

 private:
  template <typename T>
  static std::vector<T> tail(const std::vector<T>& all, std::size_t limit) {
    std::size_t skip = all.size() > limit ? all.size() - limit : 0;
    return std::vector<T>(all.begin() + static_cast<std::ptrdiff_t>(skip),
                          all.end());
  }

  mutable std::mutex mutex_;
  std::optional<SessionSnapshot> snapshot_;
  std::vector<TradeRecord> trades_;
  std::vector<EquityRecord> equity_;
  std::size_t saves_{0};
};

}  // namespace gridcore
