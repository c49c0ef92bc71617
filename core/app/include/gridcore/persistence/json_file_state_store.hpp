#pragma once

#include "gridcore/persistence/i_state_store.hpp"

#include <cstddef>
#include <mutex>
#include <string>
#include <vector>

namespace gridcore {

// -----------------------------------------------------------------------------
// JsonFileStateStore
// -----------------------------------------------------------------------------
// Stores the snapshot as one JSON document. Writes go to "<path>.tmp" and
// are renamed over <path>, so a crash mid-write leaves the previous
// snapshot intact.
//
// The journals are JSON Lines files beside the snapshot:
// "<path>.trades.jsonl" and "<path>.equity.jsonl", one record per line.
// -----------------------------------------------------------------------------
class JsonFileStateStore final : public IStateStore {
 public:
  explicit JsonFileStateStore(std::string path);

  void saveState(const SessionSnapshot& snapshot) override;

  std::optional<SessionSnapshot> loadState() override;

  void appendTrade(const TradeRecord& record) override;
  void appendEquity(const EquityRecord& record) override;

  std::vector<TradeRecord> recentTrades(std::size_t limit) override;
  std::vector<EquityRecord> recentEquity(std::size_t limit) override;

  const std::string& path() const { return path_; }
  std::string tradesPath() const { return path_ + ".trades.jsonl"; }
  std::string equityPath() const { return path_ + ".equity.jsonl"; }

 private:
  std::string path_;
  // Serializes journal appends against journal reads.
  std::mutex journal_mutex_;
};

}  // namespace gridcore
