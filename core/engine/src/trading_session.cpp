#include "gridcore/engine/trading_session.hpp"
#include "gridcore/errors/errors.hpp"
#include "gridcore/events/position_update_event.hpp"
#include "gridcore/events/risk_event.hpp"
#include "gridcore/time/time_utils.hpp"

#include <algorithm>
#include <chrono>
#include <iostream>
#include <utility>

namespace gridcore {

using domain::IntentSource;
using domain::OrderIntent;

TradingSession::TradingSession(config::BotConfig config,
                               IExchangeClient& exchange, IStateStore& store,
                               const ITimeProvider& clock, INotifier* notifier)
    : config_(std::move(config)),
      exchange_(exchange),
      store_(store),
      clock_(clock),
      notifier_(notifier),
      book_(clock, notifier),
      grid_(config_.trading.symbol, config_.grid),
      dca_(config_.trading.symbol, config_.dca),
      risk_(config_.trading.symbol, config_.risk),
      published_(std::make_shared<const SessionSnapshot>()) {
  loop_ = std::make_unique<TickLoopThread>(
      [this] { runTick(); },
      std::chrono::milliseconds(config_.tick.interval_ms));
}

TradingSession::~TradingSession() {
  // The loop references this object; join it before members go away.
  loop_->stop();
}

// -----------------------------------------------------------------------------
// Lifecycle
// -----------------------------------------------------------------------------

void TradingSession::start() {
  loop_->stop();
  {
    std::lock_guard lock(tick_mutex_);
    exchange_.connect();
    connected_.store(true);
    restoreOrInitialize();
    state_loaded_ = true;
    stopped_ = false;
  }

  // The first tick runs here so start() fails loudly instead of leaving a
  // loop that never completes a tick.
  {
    std::lock_guard lock(tick_mutex_);
    step();
  }

  if (!halted()) {
    loop_->start();
  }
  std::cout << "[TradingSession] started " << config_.trading.symbol
            << " at tick " << tick_sequence_ << "\n";
}

void TradingSession::recover() {
  loop_->stop();
  {
    std::lock_guard lock(tick_mutex_);
    try {
      exchange_.disconnect();
    } catch (const ExchangeError& e) {
      std::cerr << "[TradingSession] disconnect during recovery failed: "
                << e.what() << "\n";
    }
    connected_.store(false);
    exchange_.connect();
    connected_.store(true);
    // A session whose start() failed has not loaded its state yet.
    if (!state_loaded_) {
      restoreOrInitialize();
      state_loaded_ = true;
    }
    reconcile_pending_ = true;
    stopped_ = false;
  }

  {
    std::lock_guard lock(tick_mutex_);
    step();
  }

  if (!halted()) {
    loop_->start();
  }
  std::cout << "[TradingSession] recovered at tick " << tick_sequence_ << "\n";
}

void TradingSession::stop() {
  loop_->stop();

  std::lock_guard lock(tick_mutex_);
  if (stopped_) {
    return;
  }
  stopped_ = true;
  checkpoint(true);
  try {
    exchange_.disconnect();
  } catch (const ExchangeError& e) {
    std::cerr << "[TradingSession] disconnect failed: " << e.what() << "\n";
  }
  connected_.store(false);
  std::cout << "[TradingSession] stopped after " << ticks_completed_.load()
            << " ticks\n";
}

SessionHealth TradingSession::health() const {
  SessionHealth h;
  h.running = loop_->running();
  h.connected = connected_.load();
  h.consecutive_failures = consecutive_failures_.load();
  h.last_tick_ms = last_tick_ms_.load();
  h.ticks_completed = ticks_completed_.load();
  h.kill_switch = halted();
  h.fatal = fatal_.load();

  std::lock_guard lock(info_mutex_);
  h.last_error = last_error_;
  if (h.last_error.empty() && !h.running) {
    h.last_error = loop_->lastError();
  }
  return h;
}

void TradingSession::requestHalt(const std::string& reason) {
  {
    std::lock_guard lock(info_mutex_);
    halt_reason_ = reason;
  }
  halt_requested_.store(true);
  loop_->wake();
}

std::shared_ptr<const SessionSnapshot> TradingSession::snapshot() const {
  std::shared_lock lock(snapshot_mutex_);
  return published_;
}

PerformanceReport TradingSession::performance() const {
  std::shared_lock lock(snapshot_mutex_);
  return performance_;
}

std::vector<TradeRecord> TradingSession::recentTrades(std::size_t limit) {
  return store_.recentTrades(limit);
}

// Latched and nothing left to unwind.
bool TradingSession::halted() const {
  return kill_switch_.load() && !wind_down_pending_.load();
}

// -----------------------------------------------------------------------------
// Restore
// -----------------------------------------------------------------------------

void TradingSession::restoreOrInitialize() {
  std::optional<SessionSnapshot> saved = store_.loadState();

  if (saved && saved->symbol != config_.trading.symbol) {
    std::cerr << "[TradingSession] saved state is for " << saved->symbol
              << ", configured symbol is " << config_.trading.symbol
              << "; starting fresh\n";
    alert(false, "ignored saved state for symbol " + saved->symbol);
    saved.reset();
  }

  if (!saved) {
    if (tick_sequence_ == 0) {
      std::cout << "[TradingSession] no saved state, starting fresh\n";
    }
    return;
  }

  book_.clear();
  for (const auto& tracked : saved->open_orders) {
    book_.hydrate(tracked);
  }
  book_.reconcilePosition(saved->position);
  grid_.restore(saved->grid);
  dca_.restore(saved->dca);
  risk_.restore(saved->risk);
  tick_sequence_ = saved->tick_sequence;
  last_price_ = saved->last_price;
  last_equity_ = saved->equity;
  kill_switch_.store(saved->risk.kill_switch_armed);
  wind_down_pending_.store(saved->risk.wind_down_pending);
  pending_grid_fills_.clear();
  reconcile_pending_ = true;

  std::cout << "[TradingSession] restored tick " << tick_sequence_ << " with "
            << saved->open_orders.size() << " open orders\n";

  std::unique_lock lock(snapshot_mutex_);
  published_ = std::make_shared<const SessionSnapshot>(*saved);
}

// -----------------------------------------------------------------------------
// Tick
// -----------------------------------------------------------------------------

void TradingSession::runTick() {
  std::lock_guard lock(tick_mutex_);
  try {
    step();
  } catch (const ExchangeError& e) {
    recordFailure(e.what());
    if (e.kind() == ExchangeErrorKind::Disconnected) {
      connected_.store(false);
    }
    if (e.isUnrecoverable()) {
      fatal_.store(true);
      alert(true, std::string("unrecoverable exchange error: ") + e.what());
      loop_->requestStop();
    }
    // Orders placed or canceled before the failure may not be reflected
    // locally; the next tick starts from the exchange's view.
    reconcile_pending_ = true;
    std::cerr << "[TradingSession] tick failed: " << e.what() << "\n";
  }
}

void TradingSession::step() {
  if (fatal_.load()) {
    return;
  }
  if (kill_switch_.load()) {
    if (wind_down_pending_.load()) {
      continueWindDown();
    }
    return;
  }

  TickOutcome outcome;

  const std::string& symbol = config_.trading.symbol;
  double price = exchange_.getPrice(symbol).price;
  domain::Position position = exchange_.getPosition(symbol);
  double equity = exchange_.getEquity();
  // Draining is the last read: once fills leave the exchange they only
  // exist in this process.
  std::vector<domain::Fill> fills = exchange_.drainFills();
  connected_.store(true);

  routeFills(fills, pending_grid_fills_, outcome);

  if (reconcile_pending_) {
    reconcileWithExchange();
    reconcile_pending_ = false;
  }

  if (book_.reconcilePosition(position)) {
    outcome.position_changed = true;
    PositionUpdateEvent update;
    update.position = position;
    update.equity = equity;
    update.timestamp = ms_to_timestamp(clock_.now_ms());
    record(update);
  }
  equity_.push(clock_.now_ms(), equity);
  last_price_ = price;
  last_equity_ = equity;

  if (!grid_.initialized()) {
    grid_.initialize(price);
    std::cout << "[TradingSession] grid seeded at " << price << "\n";
  }
  if (dca_.enabled() && !dca_.started()) {
    dca_.start(price);
  }

  std::vector<OrderIntent> grid_intents =
      grid_.onTick(price, pending_grid_fills_);
  pending_grid_fills_.clear();
  std::vector<OrderIntent> dca_intents;
  if (dca_.enabled()) {
    dca_intents = dca_.onTick(price);
  }

  RiskDecision decision;
  if (halt_requested_.exchange(false)) {
    std::string reason;
    {
      std::lock_guard info(info_mutex_);
      reason = halt_reason_.empty() ? "operator halt" : halt_reason_;
    }
    decision = risk_.triggerKillSwitch(reason, book_.position());
  } else {
    decision = risk_.evaluate(book_.position(), equity_);
  }

  if (decision.action == domain::RiskAction::KillSwitch) {
    handleKillSwitch(decision, outcome);
    return;
  }
  if (!decision.warning.empty()) {
    alert(false, decision.warning);
  }

  if (decision.action != domain::RiskAction::None) {
    outcome.risk_action = true;
    recordRisk(decision);
  }
  execute(decision.intents, outcome);
  execute(grid_intents, outcome);
  execute(dca_intents, outcome);

  ++tick_sequence_;
  bool persist = dirty_ || outcome.fills > 0 || outcome.submitted > 0 ||
                 outcome.failed > 0 || outcome.position_changed ||
                 outcome.risk_action;
  checkpoint(persist);

  TickEvent event;
  event.symbol = symbol;
  event.price = price;
  event.tick_sequence = tick_sequence_;
  event.fills = outcome.fills;
  event.intents_submitted = outcome.submitted;
  event.intents_failed = outcome.failed;
  event.timestamp = ms_to_timestamp(clock_.now_ms());
  record(event);

  last_tick_ms_.store(clock_.now_ms());
  ticks_completed_.fetch_add(1);
  consecutive_failures_.store(0);
  {
    std::lock_guard info(info_mutex_);
    last_error_.clear();
  }
}

void TradingSession::routeFills(const std::vector<domain::Fill>& fills,
                                std::vector<domain::Fill>& grid_fills,
                                TickOutcome& outcome) {
  for (const auto& fill : fills) {
    ++outcome.fills;

    FillEvent event;
    event.fill = fill;
    event.timestamp = ms_to_timestamp(clock_.now_ms());

    std::optional<TrackedOrder> tracked = book_.applyFill(fill);
    journalTrade(fill, tracked ? &*tracked : nullptr);
    if (!tracked) {
      std::cerr << "[TradingSession] fill for unknown order " << fill.order_id
                << " ignored\n";
      event.owned = false;
      record(event);
      continue;
    }

    event.owner = tracked->owner;
    switch (tracked->owner) {
      case IntentSource::Grid:
        grid_fills.push_back(fill);
        break;
      case IntentSource::Dca:
        dca_.onFill(fill.order_id, fill.quantity);
        break;
      case IntentSource::Risk:
        // Risk orders act through the position, read back every tick.
        break;
    }
    record(event);
  }
}

void TradingSession::reconcileWithExchange() {
  std::vector<domain::Order> open =
      exchange_.getOpenOrders(config_.trading.symbol);
  OrderBookState::ReconcileResult result = book_.reconcileOpenOrders(open);

  for (const auto& tracked : result.missing) {
    std::cout << "[TradingSession] order " << tracked.order.id << " ("
              << domain::toString(tracked.owner)
              << ") no longer on exchange\n";
    switch (tracked.owner) {
      case IntentSource::Grid:
        grid_.onOrderMissing(tracked.order.id);
        break;
      case IntentSource::Risk:
        risk_.onOrderMissing(tracked.order.id);
        break;
      case IntentSource::Dca:
        // DCA entries are market orders; a vanished one has nothing to redo.
        break;
    }
  }
  bool adopted = false;
  for (const auto& order : result.untracked) {
    // A grid placement whose response was lost lands here.
    std::optional<std::size_t> level = grid_.pendingLevelFor(order);
    if (level) {
      book_.track(order, IntentSource::Grid, *level);
      grid_.onOrderPlaced(*level, order.id);
      adopted = true;
      std::cout << "[TradingSession] adopted exchange order " << order.id
                << " for grid level " << *level << "\n";
      continue;
    }
    std::cerr << "[TradingSession] untracked exchange order " << order.id
              << " left untouched\n";
  }
  dirty_ = dirty_ || adopted || !result.missing.empty();
}

// -----------------------------------------------------------------------------
// Intent execution
// -----------------------------------------------------------------------------

void TradingSession::execute(const std::vector<OrderIntent>& intents,
                             TickOutcome& outcome) {
  for (const auto& intent : intents) {
    switch (intent.kind) {
      case OrderIntent::Kind::Place:
      case OrderIntent::Kind::Flatten:
        executePlace(intent, outcome);
        break;
      case OrderIntent::Kind::Cancel:
        executeCancel(intent, outcome);
        break;
      case OrderIntent::Kind::CancelAll:
        executeCancelAll(outcome);
        break;
    }
  }
}

// Every intent is attempted even when an earlier one fails.
void TradingSession::executeEach(const std::vector<OrderIntent>& intents,
                                 TickOutcome& outcome) {
  for (const auto& intent : intents) {
    try {
      execute({intent}, outcome);
    } catch (const ExchangeError& e) {
      std::cerr << "[TradingSession] wind-down step failed: " << e.what()
                << "\n";
      recordFailure(e.what());
      if (e.kind() == ExchangeErrorKind::Disconnected) {
        connected_.store(false);
      }
      if (e.isUnrecoverable()) {
        fatal_.store(true);
        alert(true, std::string("unrecoverable exchange error during "
                                "wind-down: ") + e.what());
      }
    }
  }
}

void TradingSession::executePlace(const OrderIntent& intent,
                                  TickOutcome& outcome) {
  domain::OrderId id = 0;
  try {
    id = exchange_.placeOrder(intent.request);
  } catch (const ExchangeError& e) {
    ++outcome.failed;
    std::cerr << "[TradingSession] " << domain::toString(intent.source)
              << " order (slot " << intent.slot << ") failed: " << e.what()
              << "\n";
    if (e.kind() == ExchangeErrorKind::Timeout &&
        intent.source == IntentSource::Grid) {
      // The order may have reached the exchange. The level stays Pending
      // until reconciliation either adopts the order or finds none.
      reconcile_pending_ = true;
      return;
    }
    reportRejected(intent, e.what());
    if (e.kind() == ExchangeErrorKind::Disconnected || e.isUnrecoverable()) {
      throw;
    }
    return;
  }

  ++outcome.submitted;
  book_.track(domain::makeOrder(id, intent.request), intent.source,
              intent.slot);

  switch (intent.source) {
    case IntentSource::Grid:
      grid_.onOrderPlaced(intent.slot, id);
      break;
    case IntentSource::Dca:
      dca_.onOrderPlaced(intent.slot, id);
      break;
    case IntentSource::Risk:
      if (intent.kind == OrderIntent::Kind::Place &&
          intent.slot == RiskManager::kBreakevenStopSlot) {
        risk_.onStopPlaced(id);
      }
      break;
  }
}

void TradingSession::reportRejected(const OrderIntent& intent,
                                    const std::string& reason) {
  switch (intent.source) {
    case IntentSource::Grid:
      grid_.onOrderRejected(intent.slot, reason);
      break;
    case IntentSource::Dca:
      dca_.onOrderRejected(intent.slot, reason);
      break;
    case IntentSource::Risk:
      if (intent.kind == OrderIntent::Kind::Place &&
          intent.slot == RiskManager::kBreakevenStopSlot) {
        risk_.onStopRejected(reason);
      } else {
        alert(intent.kind == OrderIntent::Kind::Flatten,
              "risk order rejected: " + reason);
      }
      break;
  }
}

void TradingSession::executeCancel(const OrderIntent& intent,
                                   TickOutcome& outcome) {
  try {
    exchange_.cancelOrder(intent.cancel_id);
    ++outcome.submitted;
  } catch (const ExchangeError& e) {
    if (e.kind() != ExchangeErrorKind::NotFound) {
      ++outcome.failed;
      std::cerr << "[TradingSession] cancel " << intent.cancel_id
                << " failed: " << e.what() << "\n";
      if (e.kind() == ExchangeErrorKind::Disconnected || e.isUnrecoverable()) {
        throw;
      }
      return;
    }
    // Already gone on the exchange; forget it locally as well.
  }
  book_.markCanceled(intent.cancel_id);
}

void TradingSession::executeCancelAll(TickOutcome& outcome) {
  std::vector<domain::Order> open =
      exchange_.getOpenOrders(config_.trading.symbol);
  for (const auto& order : open) {
    OrderIntent cancel;
    cancel.kind = OrderIntent::Kind::Cancel;
    cancel.source = IntentSource::Risk;
    cancel.cancel_id = order.id;
    executeCancel(cancel, outcome);
  }
  for (const auto& tracked : book_.openOrders()) {
    book_.markCanceled(tracked.order.id);
  }
}

// -----------------------------------------------------------------------------
// Kill switch
// -----------------------------------------------------------------------------

void TradingSession::handleKillSwitch(const RiskDecision& decision,
                                      TickOutcome& outcome) {
  std::cerr << "[TradingSession] KILL SWITCH: " << decision.reason << "\n";
  recordRisk(decision);

  // Engine intents collected this tick are dropped; only the cancel and
  // flatten orders go out.
  grid_.reset();  // its orders go with CancelAll
  dca_.reset(last_price_);
  pending_grid_fills_.clear();
  kill_switch_.store(true);
  wind_down_pending_.store(risk_.windDownPending());
  alert(true, "kill switch triggered: " + decision.reason);

  executeEach(decision.intents, outcome);
  finishWindDownAttempt();
}

void TradingSession::continueWindDown() {
  TickOutcome outcome;
  domain::Position position = exchange_.getPosition(config_.trading.symbol);
  std::cout << "[TradingSession] retrying kill switch wind-down\n";
  executeEach(risk_.windDown(position), outcome);
  finishWindDownAttempt();
}

// Checks the exchange, persists the outcome and ends the loop once the
// account is flat with nothing resting.
void TradingSession::finishWindDownAttempt() {
  bool complete = confirmWindDown();
  wind_down_pending_.store(risk_.windDownPending());

  ++tick_sequence_;
  checkpoint(true);
  last_tick_ms_.store(clock_.now_ms());
  ticks_completed_.fetch_add(1);

  if (complete) {
    alert(true, "kill switch wind-down complete, session halted");
    loop_->requestStop();
  }
}

bool TradingSession::confirmWindDown() {
  const std::string& symbol = config_.trading.symbol;
  try {
    domain::Position position = exchange_.getPosition(symbol);
    std::vector<domain::Order> open = exchange_.getOpenOrders(symbol);
    book_.reconcilePosition(position);
    for (const auto& tracked : book_.openOrders()) {
      if (std::none_of(open.begin(), open.end(),
                       [&](const domain::Order& o) {
                         return o.id == tracked.order.id;
                       })) {
        book_.markCanceled(tracked.order.id);
      }
    }
    if (position.isFlat() && open.empty()) {
      risk_.onWindDownComplete();
      return true;
    }
    std::cerr << "[TradingSession] wind-down incomplete: position "
              << position.net_quantity << ", " << open.size()
              << " open orders\n";
  } catch (const ExchangeError& e) {
    std::cerr << "[TradingSession] wind-down check failed: " << e.what()
              << "\n";
    recordFailure(e.what());
  }
  return false;
}

void TradingSession::recordRisk(const RiskDecision& decision) {
  std::cout << "[TradingSession] risk action "
            << domain::toString(decision.action) << ": " << decision.reason
            << "\n";
  RiskEvent event;
  event.symbol = config_.trading.symbol;
  event.action = decision.action;
  event.reason = decision.reason;
  event.current_value = decision.current_value;
  event.limit_value = decision.limit_value;
  event.timestamp = ms_to_timestamp(clock_.now_ms());
  record(event);
}

// -----------------------------------------------------------------------------
// Checkpoint
// -----------------------------------------------------------------------------

SessionSnapshot TradingSession::buildSnapshot() const {
  SessionSnapshot s;
  s.symbol = config_.trading.symbol;
  s.tick_sequence = tick_sequence_;
  s.timestamp_ms = clock_.now_ms();
  s.last_price = last_price_;
  s.equity = last_equity_;
  s.position = book_.position();
  s.risk = risk_.state();
  s.grid = grid_.snapshot();
  s.dca = dca_.snapshot();
  s.open_orders = book_.openOrders();
  return s;
}

PerformanceReport TradingSession::buildPerformance() const {
  const domain::RiskState& risk = risk_.state();
  const domain::Position& position = book_.position();

  PerformanceReport r;
  r.symbol = config_.trading.symbol;
  r.tick_sequence = tick_sequence_;
  r.initial_capital = config_.trading.initial_capital;
  r.equity = last_equity_;
  r.unrealized_pnl = position.unrealized_pnl;
  r.realized_pnl = position.realized_pnl;
  r.balance = r.equity - r.unrealized_pnl;
  if (r.initial_capital > 0.0) {
    r.total_return_percent =
        (r.balance - r.initial_capital) / r.initial_capital * 100.0;
  }
  r.peak_equity = risk.peak_equity;
  r.drawdown_percent = risk.drawdown_percent;
  r.max_drawdown_percent = risk.max_drawdown_percent;
  r.margin_ratio_percent = risk.margin_ratio_percent;

  r.window_samples = equity_.size();
  if (!equity_.empty()) {
    r.window_high_equity = equity_.maxEquity();
    r.window_low_equity = equity_.latest().equity;
    for (const auto& sample : equity_.samples()) {
      r.window_low_equity = std::min(r.window_low_equity, sample.equity);
    }
  }
  r.trades_recorded = trades_recorded_.load();
  return r;
}

void TradingSession::checkpoint(bool persist) {
  auto next = std::make_shared<const SessionSnapshot>(buildSnapshot());
  PerformanceReport report = buildPerformance();
  {
    std::unique_lock lock(snapshot_mutex_);
    published_ = next;
    performance_ = report;
  }
  journalEquity(report);

  if (!persist) {
    return;
  }
  try {
    store_.saveState(*next);
    dirty_ = false;
  } catch (const StateStoreError& e) {
    std::cerr << "[TradingSession] checkpoint failed: " << e.what() << "\n";
    alert(false, std::string("checkpoint failed: ") + e.what());
  }
}

// -----------------------------------------------------------------------------
// Reporting
// -----------------------------------------------------------------------------

void TradingSession::journalTrade(const domain::Fill& fill,
                                  const TrackedOrder* tracked) {
  TradeRecord trade;
  trade.fill = fill;
  trade.owned = tracked != nullptr;
  if (tracked != nullptr) {
    trade.owner = tracked->owner;
  }
  try {
    store_.appendTrade(trade);
    trades_recorded_.fetch_add(1);
  } catch (const StateStoreError& e) {
    std::cerr << "[TradingSession] trade journal failed: " << e.what()
              << "\n";
    alert(false, std::string("trade journal failed: ") + e.what());
  }
}

void TradingSession::journalEquity(const PerformanceReport& report) {
  if (equity_.empty()) {
    return;
  }
  std::int64_t now = clock_.now_ms();
  if (equity_recorded_ &&
      now - last_equity_record_ms_ <
          config_.persistence.equity_record_interval_ms) {
    return;
  }

  EquityRecord entry;
  entry.timestamp_ms = now;
  entry.balance = report.balance;
  entry.equity = report.equity;
  entry.unrealized_pnl = report.unrealized_pnl;
  entry.realized_pnl = report.realized_pnl;
  entry.drawdown_percent = report.drawdown_percent;
  entry.margin_ratio_percent = report.margin_ratio_percent;
  try {
    store_.appendEquity(entry);
    equity_recorded_ = true;
    last_equity_record_ms_ = now;
  } catch (const StateStoreError& e) {
    std::cerr << "[TradingSession] equity journal failed: " << e.what()
              << "\n";
    alert(false, std::string("equity journal failed: ") + e.what());
  }
}

void TradingSession::recordFailure(const std::string& error) {
  consecutive_failures_.fetch_add(1);
  std::lock_guard lock(info_mutex_);
  last_error_ = error;
}

void TradingSession::alert(bool critical, const std::string& message) {
  if (notifier_ == nullptr) {
    return;
  }
  AlertEvent event;
  event.severity = critical ? AlertSeverity::Critical : AlertSeverity::Warning;
  event.source = "TradingSession";
  event.message = message;
  event.timestamp = ms_to_timestamp(clock_.now_ms());
  notifier_->alert(event);
}

void TradingSession::record(const Event& event) {
  if (notifier_ != nullptr) {
    notifier_->record(event);
  }
}

}  // namespace gridcore
