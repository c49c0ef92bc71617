#pragma once

#include "gridcore/persistence/journal_records.hpp"
#include "gridcore/persistence/session_snapshot.hpp"

#include <cstddef>
#include <optional>
#include <vector>

namespace gridcore {

// -----------------------------------------------------------------------------
// IStateStore
// -----------------------------------------------------------------------------
// Persistence collaborator. saveState() replaces the stored snapshot as a
// whole; loadState() returns std::nullopt when nothing was ever saved.
// Both throw StateStoreError when the medium or the stored data is broken.
//
// The trade and equity journals only grow. recentTrades()/recentEquity()
// return at most `limit` records, oldest first. Journal calls may come from
// any thread.
// -----------------------------------------------------------------------------
class IStateStore {
 public:
  virtual ~IStateStore() = default;

  virtual void saveState(const SessionSnapshot& snapshot) = 0;

  virtual std::optional<SessionSnapshot> loadState() = 0;

  virtual void appendTrade(const TradeRecord& record) = 0;
  virtual void appendEquity(const EquityRecord& record) = 0;

  virtual std::vector<TradeRecord> recentTrades(std::size_t limit) = 0;
  virtual std::vector<EquityRecord> recentEquity(std::size_t limit) = 0;
};

}  // namespace gridcore
