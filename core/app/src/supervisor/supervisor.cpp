#include "gridcore/supervisor/supervisor.hpp"
#include "gridcore/errors/errors.hpp"
#include "gridcore/events/health_event.hpp"
#include "gridcore/time/time_utils.hpp"

#include <chrono>
#include <iostream>
#include <utility>

namespace gridcore {

using domain::ConnectionState;
using domain::SupervisorState;

Supervisor::Supervisor(ISupervisedSession& session, const ITimeProvider& clock,
                       config::SupervisorConfig config, INotifier* notifier)
    : session_(session),
      clock_(clock),
      config_(config),
      notifier_(notifier),
      limiter_(static_cast<std::size_t>(config.max_restarts_per_window),
               config.restart_window_ms),
      suppression_backoff_(config.backoff_initial_ms, config.backoff_max_ms) {}

// -----------------------------------------------------------------------------
// State machine
// -----------------------------------------------------------------------------

void Supervisor::checkOnce() {
  std::int64_t now = clock_.now_ms();

  if (stop_requested_.load() && state() != SupervisorState::Stopped) {
    shutdown("stop requested");
    return;
  }

  switch (state()) {
    case SupervisorState::Starting:
      attemptStart(now);
      break;
    case SupervisorState::Running:
      checkRunning(now);
      break;
    case SupervisorState::Degraded:
      checkDegraded(now);
      break;
    case SupervisorState::Recovering:
    case SupervisorState::Stopped:
      break;
  }
}

void Supervisor::attemptStart(std::int64_t now) {
  try {
    session_.start();
    observe(session_.health(), now);
    transition(SupervisorState::Running, "session started");
  } catch (const ConfigError& e) {
    raiseAlert(true, std::string("invalid configuration: ") + e.what());
    shutdown(e.what());
  } catch (const StateStoreError& e) {
    raiseAlert(true, std::string("cannot restore state: ") + e.what());
    shutdown(e.what());
  } catch (const ExchangeError& e) {
    if (e.isUnrecoverable()) {
      raiseAlert(true, std::string("exchange refused session: ") + e.what());
      shutdown(e.what());
      return;
    }
    {
      std::lock_guard lock(status_mutex_);
      status_.last_error = e.what();
      status_.connection = ConnectionState::Reconnecting;
      status_.next_attempt_ms = now + config_.restart_delay_ms;
    }
    transition(SupervisorState::Degraded,
               std::string("start failed: ") + e.what());
  } catch (const std::exception& e) {
    {
      std::lock_guard lock(status_mutex_);
      status_.last_error = e.what();
      status_.next_attempt_ms = now + config_.restart_delay_ms;
    }
    transition(SupervisorState::Degraded,
               std::string("start failed: ") + e.what());
  }
}

void Supervisor::checkRunning(std::int64_t now) {
  SessionHealth h = session_.health();
  observe(h, now);
  if (handleTerminal(h)) {
    return;
  }

  std::string crash = detectCrash(h, now);
  if (crash.empty()) {
    return;
  }

  {
    std::lock_guard lock(status_mutex_);
    status_.last_error = crash;
    status_.next_attempt_ms = now + config_.restart_delay_ms;
  }
  std::cerr << "[Supervisor] crash detected: " << crash << "\n";
  transition(SupervisorState::Degraded, crash);
}

void Supervisor::checkDegraded(std::int64_t now) {
  SessionHealth h = session_.health();
  observe(h, now);
  if (handleTerminal(h)) {
    return;
  }

  std::int64_t next_attempt = 0;
  {
    std::lock_guard lock(status_mutex_);
    next_attempt = status_.next_attempt_ms;
  }
  if (now < next_attempt) {
    return;
  }

  if (!limiter_.tryAcquire(now)) {
    std::int64_t delay = suppression_backoff_.next();
    ++suppressed_restarts_;
    std::string message =
        "restart suppressed: " + std::to_string(limiter_.maxEvents()) +
        " restarts within " + std::to_string(limiter_.windowMs() / 1000) +
        " s, next attempt in " + std::to_string(delay / 1000) + " s";
    {
      std::lock_guard lock(status_mutex_);
      status_.next_attempt_ms = now + delay;
      status_.restarts_in_window = limiter_.countInWindow(now);
    }
    std::cerr << "[Supervisor] " << message << "\n";
    raiseAlert(false, message);
    recordHealth(SupervisorState::Degraded, message);
    return;
  }

  attemptRecovery(now);
}

void Supervisor::attemptRecovery(std::int64_t now) {
  {
    std::lock_guard lock(status_mutex_);
    status_.restarts_in_window = limiter_.countInWindow(now);
    status_.connection = ConnectionState::Reconnecting;
  }
  transition(SupervisorState::Recovering, "restarting session");

  try {
    session_.recover();
    suppression_backoff_.reset();
    observe(session_.health(), clock_.now_ms());
    transition(SupervisorState::Running, "session recovered");
  } catch (const ExchangeError& e) {
    if (e.isUnrecoverable()) {
      {
        std::lock_guard lock(status_mutex_);
        status_.connection = ConnectionState::Failed;
      }
      raiseAlert(true, std::string("exchange refused session: ") + e.what());
      shutdown(e.what());
      return;
    }
    {
      std::lock_guard lock(status_mutex_);
      status_.last_error = e.what();
      status_.next_attempt_ms = clock_.now_ms() + config_.restart_delay_ms;
    }
    transition(SupervisorState::Degraded,
               std::string("recovery failed: ") + e.what());
  } catch (const StateStoreError& e) {
    raiseAlert(true, std::string("cannot restore state: ") + e.what());
    shutdown(e.what());
  } catch (const std::exception& e) {
    {
      std::lock_guard lock(status_mutex_);
      status_.last_error = e.what();
      status_.next_attempt_ms = clock_.now_ms() + config_.restart_delay_ms;
    }
    transition(SupervisorState::Degraded,
               std::string("recovery failed: ") + e.what());
  }
}

bool Supervisor::handleTerminal(const SessionHealth& h) {
  if (h.kill_switch) {
    raiseAlert(true, "kill switch fired, session ended: " + h.last_error);
    shutdown("kill switch");
    return true;
  }
  if (h.fatal) {
    {
      std::lock_guard lock(status_mutex_);
      status_.connection = ConnectionState::Failed;
    }
    raiseAlert(true, "unrecoverable session error: " + h.last_error);
    shutdown(h.last_error);
    return true;
  }
  return false;
}

std::string Supervisor::detectCrash(const SessionHealth& h,
                                    std::int64_t now) const {
  if (!h.running) {
    return "tick loop not running" +
           (h.last_error.empty() ? std::string() : ": " + h.last_error);
  }
  if (!h.connected) {
    return "exchange connection lost";
  }
  if (h.consecutive_failures >= config_.failure_threshold) {
    return std::to_string(h.consecutive_failures) +
           " consecutive tick failures: " + h.last_error;
  }
  if (now - h.last_tick_ms > config_.stale_tick_timeout_ms) {
    return "no successful tick for " +
           std::to_string((now - h.last_tick_ms) / 1000) + " s";
  }
  return std::string();
}

void Supervisor::observe(const SessionHealth& h, std::int64_t now) {
  std::lock_guard lock(status_mutex_);
  status_.last_tick_ms = h.last_tick_ms;
  status_.consecutive_failures = h.consecutive_failures;
  status_.restarts_in_window = limiter_.countInWindow(now);
  if (status_.connection != ConnectionState::Failed) {
    status_.connection = h.connected ? ConnectionState::Connected
                                     : ConnectionState::Reconnecting;
  }
  if (!h.last_error.empty()) {
    status_.last_error = h.last_error;
  }
}

void Supervisor::shutdown(const std::string& reason) {
  try {
    session_.stop();
  } catch (const std::exception& e) {
    std::cerr << "[Supervisor] error while stopping session: " << e.what()
              << "\n";
  }
  transition(SupervisorState::Stopped, reason);
}

// -----------------------------------------------------------------------------
// Loop
// -----------------------------------------------------------------------------

void Supervisor::run() {
  std::cout << "[Supervisor] running, health check every "
            << config_.health_check_interval_ms << " ms, restart budget "
            << config_.max_restarts_per_window << " per "
            << config_.restart_window_ms / 1000 << " s\n";

  while (state() != SupervisorState::Stopped) {
    checkOnce();
    if (state() == SupervisorState::Stopped) {
      break;
    }
    std::unique_lock lock(wait_mutex_);
    wait_cv_.wait_for(lock,
                      std::chrono::milliseconds(config_.health_check_interval_ms),
                      [this] { return stop_requested_.load(); });
  }
}

void Supervisor::requestStop() {
  stop_requested_.store(true);
  wait_cv_.notify_all();
}

// -----------------------------------------------------------------------------
// Status
// -----------------------------------------------------------------------------

domain::SupervisorState Supervisor::state() const {
  std::lock_guard lock(status_mutex_);
  return status_.state;
}

domain::HealthStatus Supervisor::health() const {
  std::lock_guard lock(status_mutex_);
  return status_;
}

void Supervisor::transition(domain::SupervisorState next,
                            const std::string& message) {
  domain::SupervisorState previous;
  {
    std::lock_guard lock(status_mutex_);
    previous = status_.state;
    status_.state = next;
  }
  if (previous == next) {
    return;
  }
  std::cout << "[Supervisor] " << domain::toString(previous) << " -> "
            << domain::toString(next) << ": " << message << "\n";
  recordHealth(previous, message);
}

void Supervisor::recordHealth(domain::SupervisorState previous,
                              const std::string& message) {
  if (notifier_ == nullptr) {
    return;
  }
  HealthEvent event;
  event.previous_state = previous;
  event.status = health();
  event.message = message;
  event.timestamp = ms_to_timestamp(clock_.now_ms());
  notifier_->record(event);
}

void Supervisor::raiseAlert(bool critical, const std::string& message) {
  if (notifier_ == nullptr) {
    return;
  }
  AlertEvent alert;
  alert.severity = critical ? AlertSeverity::Critical : AlertSeverity::Warning;
  alert.source = "Supervisor";
  alert.message = message;
  alert.timestamp = ms_to_timestamp(clock_.now_ms());
  notifier_->alert(alert);
}

}  // namespace gridcore
