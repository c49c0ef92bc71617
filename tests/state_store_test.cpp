// =============================================================================
// state_store_test.cpp
// =============================================================================
// Unit tests for the IStateStore implementations.
//
// Validates:
//   - JsonFileStateStore: save/load returns an equal snapshot, no file means
//     no state, corrupt or foreign files raise StateStoreError
//   - Saving replaces the previous snapshot
//   - MemoryStateStore behaves the same and counts saves
//   - Trade and equity journals append, survive reopening and return the
//     newest records oldest first
// =============================================================================

#include "gridcore/errors/errors.hpp"
#include "gridcore/persistence/json_file_state_store.hpp"
#include "gridcore/persistence/memory_state_store.hpp"

#include <gtest/gtest.h>

#include <cstdint>
#include <cstdio>
#include <fstream>
#include <string>

using gridcore::EquityRecord;
using gridcore::SessionSnapshot;
using gridcore::StateStoreError;
using gridcore::TradeRecord;
using namespace gridcore::domain;

namespace {

SessionSnapshot sampleSnapshot() {
  SessionSnapshot s;
  s.symbol = "BTCUSDT";
  s.tick_sequence = 42;
  s.timestamp_ms = 1700000000123;
  s.last_price = 59712.5;
  s.equity = 1012.34;

  s.position.symbol = "BTCUSDT";
  s.position.net_quantity = 0.03;
  s.position.average_price = 59640.0;
  s.position.mark_price = 59712.5;
  s.position.unrealized_pnl = 2.175;
  s.position.leverage = 10;

  s.risk.peak_equity = 1020.0;
  s.risk.current_equity = 1012.34;
  s.risk.drawdown_percent = 0.75;
  s.risk.breakeven_armed = true;
  s.risk.breakeven_stop_price = 59640.0;
  s.risk.breakeven_stop_quantity = 0.03;
  s.risk.breakeven_stop_order_id = 17;

  s.grid.reference_price = 60000.0;
  s.grid.lower_price = 58200.0;
  s.grid.upper_price = 61800.0;
  GridLevel buy;
  buy.index = 8;
  buy.price = 59640.0;
  buy.side = Side::Buy;
  buy.size = 0.01;
  buy.order_id = 9;
  buy.state = GridLevelState::Open;
  GridLevel parked;
  parked.index = 9;
  parked.price = 59820.0;
  parked.side = Side::Buy;
  parked.size = 0.01;
  parked.state = GridLevelState::Parked;
  parked.rejections = 3;
  s.grid.levels = {buy, parked};

  s.dca.reference_price = 58800.0;
  s.dca.next_sequence = 2;
  DcaLadderEntry entry;
  entry.sequence = 1;
  entry.trigger_price = 58800.0;
  entry.size = 0.02;
  entry.order_id = 12;
  entry.status = DcaEntryStatus::Filled;
  entry.filled_quantity = 0.02;
  s.dca.entries = {entry};

  Order stop;
  stop.id = 17;
  stop.symbol = "BTCUSDT";
  stop.side = Side::Sell;
  stop.type = OrderType::Stop;
  stop.quantity = 0.03;
  stop.price = 59640.0;
  stop.reduce_only = true;
  s.open_orders = {{stop, IntentSource::Risk, 0}};
  return s;
}

TradeRecord sampleTrade(OrderId id, double price) {
  TradeRecord t;
  t.fill.order_id = id;
  t.fill.symbol = "BTCUSDT";
  t.fill.side = Side::Buy;
  t.fill.price = price;
  t.fill.quantity = 0.01;
  t.fill.timestamp_ms = 1700000000000 + static_cast<std::int64_t>(id);
  t.owner = IntentSource::Grid;
  t.owned = true;
  return t;
}

}  // namespace

class JsonFileStateStoreTest : public ::testing::Test {
 protected:
  void SetUp() override {
    path = ::testing::TempDir() + "gridcore_state_" +
           ::testing::UnitTest::GetInstance()->current_test_info()->name() +
           ".json";
    std::remove(path.c_str());
  }

  void TearDown() override {
    std::remove(path.c_str());
    std::remove((path + ".tmp").c_str());
    std::remove((path + ".trades.jsonl").c_str());
    std::remove((path + ".equity.jsonl").c_str());
  }

  void writeRaw(const std::string& text) {
    std::ofstream out(path, std::ios::trunc);
    out << text;
  }

  std::string path;
};

// -----------------------------------------------------------------------------
// 1. Nothing saved yet: a fresh start, not an error.
// -----------------------------------------------------------------------------
TEST_F(JsonFileStateStoreTest, MissingFileMeansNoState) {
  gridcore::JsonFileStateStore store(path);
  EXPECT_FALSE(store.loadState().has_value());
}

// -----------------------------------------------------------------------------
// 2. Every field survives a save and a load through a new store instance.
// -----------------------------------------------------------------------------
TEST_F(JsonFileStateStoreTest, SavedSnapshotLoadsBackEqual) {
  const SessionSnapshot saved = sampleSnapshot();
  gridcore::JsonFileStateStore(path).saveState(saved);

  gridcore::JsonFileStateStore reopened(path);
  auto loaded = reopened.loadState();
  ASSERT_TRUE(loaded.has_value());
  EXPECT_EQ(*loaded, saved);
  EXPECT_EQ(loaded->grid.levels[1].state, GridLevelState::Parked);
  EXPECT_EQ(loaded->open_orders[0].owner, IntentSource::Risk);
}

// -----------------------------------------------------------------------------
// 3. A later save replaces the earlier one and leaves no temp file behind.
// -----------------------------------------------------------------------------
TEST_F(JsonFileStateStoreTest, SaveReplacesPrevious) {
  gridcore::JsonFileStateStore store(path);
  SessionSnapshot s = sampleSnapshot();
  store.saveState(s);
  s.tick_sequence = 43;
  s.open_orders.clear();
  store.saveState(s);

  auto loaded = store.loadState();
  ASSERT_TRUE(loaded.has_value());
  EXPECT_EQ(loaded->tick_sequence, 43u);
  EXPECT_TRUE(loaded->open_orders.empty());
  EXPECT_FALSE(std::ifstream(path + ".tmp").good());
}

// -----------------------------------------------------------------------------
// 4. Corrupt, truncated or incompatible files are errors.
// Why: Silently starting fresh would orphan the live orders the file
//      describes.
// -----------------------------------------------------------------------------
TEST_F(JsonFileStateStoreTest, CorruptFileThrows) {
  gridcore::JsonFileStateStore store(path);

  writeRaw("{\"version\": 1, \"symbol\": ");
  EXPECT_THROW(store.loadState(), StateStoreError);

  writeRaw(R"({"version": 1, "symbol": "BTCUSDT"})");
  EXPECT_THROW(store.loadState(), StateStoreError);

  writeRaw(R"({"version": 99})");
  EXPECT_THROW(store.loadState(), StateStoreError);
}

TEST_F(JsonFileStateStoreTest, UnwritableLocationThrows) {
  gridcore::JsonFileStateStore store("/nonexistent-dir/gridcore/state.json");
  EXPECT_THROW(store.saveState(sampleSnapshot()), StateStoreError);
}

// -----------------------------------------------------------------------------
// 5. MemoryStateStore.
// -----------------------------------------------------------------------------
TEST(MemoryStateStoreTest, KeepsLatestSnapshot) {
  gridcore::MemoryStateStore store;
  EXPECT_FALSE(store.loadState().has_value());

  SessionSnapshot s = sampleSnapshot();
  store.saveState(s);
  s.tick_sequence = 50;
  store.saveState(s);

  ASSERT_TRUE(store.loadState().has_value());
  EXPECT_EQ(store.loadState()->tick_sequence, 50u);
  EXPECT_EQ(store.saves(), 2u);
}

// -----------------------------------------------------------------------------
// 6. Journals: appended records come back in order, newest `limit` only,
//    also through a new store instance. Unowned fills keep a null owner.
// -----------------------------------------------------------------------------
TEST_F(JsonFileStateStoreTest, JournalsAppendAndReturnNewest) {
  {
    gridcore::JsonFileStateStore store(path);
    EXPECT_TRUE(store.recentTrades(5).empty());
    EXPECT_TRUE(store.recentEquity(5).empty());

    for (OrderId id = 1; id <= 4; ++id) {
      store.appendTrade(sampleTrade(id, 59000.0 + static_cast<double>(id)));
    }
    TradeRecord stray = sampleTrade(99, 58000.0);
    stray.owned = false;
    store.appendTrade(stray);

    EquityRecord e;
    e.timestamp_ms = 1700000060000;
    e.balance = 1000.0;
    e.equity = 1002.5;
    e.unrealized_pnl = 2.5;
    e.margin_ratio_percent = 5.25;
    store.appendEquity(e);
  }

  gridcore::JsonFileStateStore reopened(path);
  auto trades = reopened.recentTrades(3);
  ASSERT_EQ(trades.size(), 3u);
  EXPECT_EQ(trades[0].fill.order_id, 3u);
  EXPECT_EQ(trades[1].fill.order_id, 4u);
  EXPECT_DOUBLE_EQ(trades[1].fill.price, 59004.0);
  EXPECT_TRUE(trades[1].owned);
  EXPECT_EQ(trades[1].owner, IntentSource::Grid);
  EXPECT_EQ(trades[2].fill.order_id, 99u);
  EXPECT_FALSE(trades[2].owned);
  EXPECT_EQ(reopened.recentTrades(100).size(), 5u);
  EXPECT_TRUE(reopened.recentTrades(0).empty());

  auto equity = reopened.recentEquity(10);
  ASSERT_EQ(equity.size(), 1u);
  EXPECT_DOUBLE_EQ(equity[0].equity, 1002.5);
  EXPECT_DOUBLE_EQ(equity[0].margin_ratio_percent, 5.25);

  // The snapshot file is untouched by journaling.
  EXPECT_FALSE(reopened.loadState().has_value());
}

TEST_F(JsonFileStateStoreTest, CorruptJournalThrows) {
  gridcore::JsonFileStateStore store(path);
  store.appendTrade(sampleTrade(1, 59000.0));
  {
    std::ofstream out(store.tradesPath(), std::ios::app);
    out << "{\"order_id\": \n";
  }
  EXPECT_THROW(store.recentTrades(10), StateStoreError);

  gridcore::JsonFileStateStore nowhere("/nonexistent-dir/gridcore/state.json");
  EXPECT_THROW(nowhere.appendTrade(sampleTrade(1, 59000.0)), StateStoreError);
}

// -----------------------------------------------------------------------------
// 7. MemoryStateStore journals.
// -----------------------------------------------------------------------------
TEST(MemoryStateStoreTest, JournalsKeepNewest) {
  gridcore::MemoryStateStore store;
  for (OrderId id = 1; id <= 3; ++id) {
    store.appendTrade(sampleTrade(id, 59000.0));
  }
  auto trades = store.recentTrades(2);
  ASSERT_EQ(trades.size(), 2u);
  EXPECT_EQ(trades[0].fill.order_id, 2u);
  EXPECT_EQ(trades[1].fill.order_id, 3u);

  EquityRecord e;
  e.equity = 999.0;
  store.appendEquity(e);
  ASSERT_EQ(store.recentEquity(10).size(), 1u);
  EXPECT_DOUBLE_EQ(store.recentEquity(10)[0].equity, 999.0);
}
