#pragma once

#include "gridcore/config/bot_config.hpp"
#include "gridcore/domain/order_intent.hpp"
#include "gridcore/engine/tick_loop_thread.hpp"
#include "gridcore/exchange/i_exchange_client.hpp"
#include "gridcore/notify/i_notifier.hpp"
#include "gridcore/persistence/i_state_store.hpp"
#include "gridcore/persistence/session_snapshot.hpp"
#include "gridcore/risk/equity_history.hpp"
#include "gridcore/risk/risk_manager.hpp"
#include "gridcore/state/order_book_state.hpp"
#include "gridcore/strategy/dca_engine.hpp"
#include "gridcore/strategy/grid_engine.hpp"
#include "gridcore/supervisor/i_supervised_session.hpp"
#include "gridcore/time/i_time_provider.hpp"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <vector>

namespace gridcore {

// Account performance as of the last completed tick. Balance excludes
// unrealized PnL; total return is measured on balance against the
// configured initial capital.
struct PerformanceReport {
  std::string symbol;
  std::uint64_t tick_sequence{0};
  double initial_capital{0.0};
  double balance{0.0};
  double equity{0.0};
  double total_return_percent{0.0};
  double unrealized_pnl{0.0};
  double realized_pnl{0.0};
  double peak_equity{0.0};
  double drawdown_percent{0.0};
  double max_drawdown_percent{0.0};
  double margin_ratio_percent{0.0};
  // Equity range over the volatility window.
  double window_high_equity{0.0};
  double window_low_equity{0.0};
  std::size_t window_samples{0};
  std::uint64_t trades_recorded{0};
};

// -----------------------------------------------------------------------------
// TradingSession
// -----------------------------------------------------------------------------
//
// @brief  Runs one symbol's strategy stack against an exchange: the periodic
//         tick that turns market state into orders.
//
// @details
// Each tick, in order:
//   1. Pull price, position and equity, then drain fills. Fills are read
//      last so a failed read leaves them queued on the exchange.
//   2. Route fills to the owning engine through OrderBookState and journal
//      them. Grid fills stay buffered until the grid has consumed them.
//   3. Reconcile open orders (after a restore, a reconnect, a failed tick
//      or a placement whose outcome is unknown) and the position.
//   4. Collect intents: GridEngine, then DcaEngine, then RiskManager.
//   5. Execute risk intents first, then grid, then DCA. A kill switch
//      executes its own intents only, each on its own.
//   6. Publish an immutable SessionSnapshot and PerformanceReport, persist
//      the snapshot if anything changed and journal equity.
//
// Kill switch wind-down: once the switch fires the session only retries
// cancel-all and flatten, one attempt per tick (or on start() after a
// restart), until the exchange reports no position and no open orders.
// health().kill_switch turns true and the loop ends only then.
//
// A grid placement that times out is not a rejection: the level stays
// Pending and the next tick reconciles. A matching untracked exchange order
// is adopted for the level; otherwise the level is placed again.
//
// Ticks are strictly sequential (TickLoopThread); engines are only touched
// from the tick, or from start()/recover()/stop() while the loop is stopped.
//
// Errors inside a tick:
//   ExchangeError                 counted as a tick failure; Disconnected
//                                 marks the session disconnected; AuthError
//                                 marks it fatal and ends the loop
//   order-level rejection         reported to the owning engine, tick goes on
//   StateStoreError on save or    logged and alerted, tick goes on
//   journal append
//   anything else                 escapes into TickLoopThread, which ends
//                                 the loop (seen by the Supervisor as a crash)
//
// Thread model:
//   tick thread       runTick()
//   supervisor thread start(), recover(), stop(), health()
//   any thread        snapshot(), performance(), recentTrades(),
//                     requestHalt()
//
// Ownership:
//   TradingSession
//    ├── exchange_     (IExchangeClient&, non-owning)
//    ├── store_        (IStateStore&, non-owning)
//    ├── clock_        (const ITimeProvider&, non-owning)
//    ├── notifier_     (INotifier*, optional, non-owning)
//    ├── book_, grid_, dca_, risk_, equity_  (value members)
//    └── loop_         (unique_ptr<TickLoopThread>, destroyed first)
// -----------------------------------------------------------------------------
class TradingSession final : public ISupervisedSession {
 public:
  TradingSession(config::BotConfig config, IExchangeClient& exchange,
                 IStateStore& store, const ITimeProvider& clock,
                 INotifier* notifier = nullptr);

  ~TradingSession() override;

  TradingSession(const TradingSession&) = delete;
  TradingSession& operator=(const TradingSession&) = delete;
  TradingSession(TradingSession&&) = delete;
  TradingSession& operator=(TradingSession&&) = delete;

  // -------------------------------------------------------------------------
  // ISupervisedSession
  // -------------------------------------------------------------------------

  // Connects, restores persisted state (or starts fresh), runs the first
  // tick synchronously and starts the tick loop. Throws on failure; the
  // loop is not running afterwards.
  void start() override;

  // Reconnects and forces a full reconciliation before resuming the loop.
  void recover() override;

  // Stops the loop, writes a final checkpoint and disconnects. Idempotent.
  void stop() override;

  SessionHealth health() const override;

  // -------------------------------------------------------------------------
  // Operator surface
  // -------------------------------------------------------------------------

  // Fires the kill switch on the next tick (which is started immediately).
  void requestHalt(const std::string& reason);

  // Last published state. Never null after construction.
  std::shared_ptr<const SessionSnapshot> snapshot() const;

  PerformanceReport performance() const;

  // Newest `limit` journaled trades, oldest first. Throws StateStoreError.
  std::vector<TradeRecord> recentTrades(std::size_t limit);

  // One tick on the caller's thread, with exchange failures counted the
  // way the loop counts them. This is the loop's tick function; tests call
  // it directly to step a simulated clock.
  void runTick();

  const config::BotConfig& config() const { return config_; }

 private:
  // What a single tick did, for the TickEvent and the save decision.
  struct TickOutcome {
    std::size_t fills{0};
    std::size_t submitted{0};
    std::size_t failed{0};
    bool position_changed{false};
    bool risk_action{false};
  };

  void step();
  void continueWindDown();
  void finishWindDownAttempt();
  bool confirmWindDown();
  bool halted() const;
  void restoreOrInitialize();
  void routeFills(const std::vector<domain::Fill>& fills,
                  std::vector<domain::Fill>& grid_fills, TickOutcome& outcome);
  void reconcileWithExchange();

  void execute(const std::vector<domain::OrderIntent>& intents,
               TickOutcome& outcome);
  void executeEach(const std::vector<domain::OrderIntent>& intents,
                   TickOutcome& outcome);
  void executePlace(const domain::OrderIntent& intent, TickOutcome& outcome);
  void executeCancel(const domain::OrderIntent& intent, TickOutcome& outcome);
  void executeCancelAll(TickOutcome& outcome);
  void reportRejected(const domain::OrderIntent& intent,
                      const std::string& reason);

  void handleKillSwitch(const RiskDecision& decision, TickOutcome& outcome);
  void recordRisk(const RiskDecision& decision);
  void checkpoint(bool persist);
  SessionSnapshot buildSnapshot() const;
  PerformanceReport buildPerformance() const;
  void journalTrade(const domain::Fill& fill, const TrackedOrder* tracked);
  void journalEquity(const PerformanceReport& report);

  void recordFailure(const std::string& error);
  void alert(bool critical, const std::string& message);
  void record(const Event& event);

  const config::BotConfig config_;
  IExchangeClient& exchange_;
  IStateStore& store_;
  const ITimeProvider& clock_;
  INotifier* notifier_;

  OrderBookState book_;
  GridEngine grid_;
  DcaEngine dca_;
  RiskManager risk_;
  EquityHistory equity_;

  // Serializes runTick() against start()/recover()/stop().
  std::mutex tick_mutex_;
  std::uint64_t tick_sequence_{0};
  double last_price_{0.0};
  double last_equity_{0.0};
  bool reconcile_pending_{false};
  // Grid fills routed but not yet consumed by GridEngine::onTick().
  std::vector<domain::Fill> pending_grid_fills_;
  std::int64_t last_equity_record_ms_{0};
  bool equity_recorded_{false};
  bool state_loaded_{false};
  bool dirty_{true};
  bool stopped_{true};

  std::atomic<bool> connected_{false};
  std::atomic<bool> kill_switch_{false};
  // Mirrors RiskState::wind_down_pending for health().
  std::atomic<bool> wind_down_pending_{false};
  std::atomic<bool> fatal_{false};
  std::atomic<bool> halt_requested_{false};
  std::atomic<int> consecutive_failures_{0};
  std::atomic<std::int64_t> last_tick_ms_{0};
  std::atomic<std::uint64_t> ticks_completed_{0};
  std::atomic<std::uint64_t> trades_recorded_{0};

  mutable std::mutex info_mutex_;
  std::string last_error_;
  std::string halt_reason_;

  mutable std::shared_mutex snapshot_mutex_;
  std::shared_ptr<const SessionSnapshot> published_;
  PerformanceReport performance_;

  std::unique_ptr<TickLoopThread> loop_;
};

}  // namespace gridcore
