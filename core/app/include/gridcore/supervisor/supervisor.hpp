#pragma once

#include "gridcore/config/bot_config.hpp"
#include "gridcore/domain/health_status.hpp"
#include "gridcore/notify/i_notifier.hpp"
#include "gridcore/supervisor/exponential_backoff.hpp"
#include "gridcore/supervisor/i_supervised_session.hpp"
#include "gridcore/supervisor/restart_rate_limiter.hpp"
#include "gridcore/time/i_time_provider.hpp"

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <string>

namespace gridcore {

// -----------------------------------------------------------------------------
// Supervisor: health state machine with a rate-limited restart budget
// -----------------------------------------------------------------------------
//
// @brief  Starts the trading session, watches its health and restarts it
//         after crashes, at most max_restarts_per_window times per window.
//
// @details
//   Starting   --first tick ok-------------------------------> Running
//   Running    --crash detected------------------------------> Degraded
//   Degraded   --restart_delay elapsed, budget available-----> Recovering
//   Recovering --reconnect + fresh tick ok-------------------> Running
//   Recovering --failed--------------------------------------> Degraded
//   any        --unrecoverable / kill switch / requestStop----> Stopped
//
// Crash detection: connection lost, consecutive tick failures at or above
// failure_threshold, tick loop no longer running, or no successful tick
// for stale_tick_timeout_ms.
//
// When the restart budget is exhausted the attempt is suppressed: the
// supervisor logs "restart suppressed", stays Degraded and schedules the
// next attempt after an exponentially growing, capped delay. A successful
// recovery resets that delay.
//
// Every transition (and every suppression) is recorded as a HealthEvent.
//
// Thread model:
//   checkOnce() runs on the supervisor thread (run()) or on the test
//   thread; never concurrently with itself. health()/state() may be read
//   from any thread (IPC STATUS). requestStop() is safe from any thread;
//   a signal handler uses requestStopFromSignal() instead.
//
// Time comes exclusively from the ITimeProvider, so tests drive a full
// restart window with SimulationTimeProvider.
// -----------------------------------------------------------------------------
class Supervisor {
 public:
  Supervisor(ISupervisedSession& session, const ITimeProvider& clock,
             config::SupervisorConfig config, INotifier* notifier = nullptr);

  Supervisor(const Supervisor&) = delete;
  Supervisor& operator=(const Supervisor&) = delete;
  Supervisor(Supervisor&&) = delete;
  Supervisor& operator=(Supervisor&&) = delete;

  // One step of the state machine.
  void checkOnce();

  // Blocks, calling checkOnce() every health_check_interval_ms until
  // Stopped. Stops the session before returning.
  void run();

  void requestStop();

  // Async-signal-safe stop: only stores the flag, no notify. run() sees it
  // at its next health check.
  void requestStopFromSignal() noexcept { stop_requested_.store(true); }

  domain::SupervisorState state() const;
  domain::HealthStatus health() const;
  std::size_t suppressedRestarts() const { return suppressed_restarts_; }

 private:
  void attemptStart(std::int64_t now);
  void checkRunning(std::int64_t now);
  void checkDegraded(std::int64_t now);
  void attemptRecovery(std::int64_t now);
  void shutdown(const std::string& reason);

  // Empty when healthy, otherwise a description of the crash.
  std::string detectCrash(const SessionHealth& h, std::int64_t now) const;
  bool handleTerminal(const SessionHealth& h);
  void observe(const SessionHealth& h, std::int64_t now);

  void transition(domain::SupervisorState next, const std::string& message);
  void recordHealth(domain::SupervisorState previous,
                    const std::string& message);
  void raiseAlert(bool critical, const std::string& message);

  ISupervisedSession& session_;
  const ITimeProvider& clock_;
  const config::SupervisorConfig config_;
  INotifier* notifier_;

  RestartRateLimiter limiter_;
  ExponentialBackoff suppression_backoff_;

  mutable std::mutex status_mutex_;
  domain::HealthStatus status_;

  std::atomic<bool> stop_requested_{false};
  std::mutex wait_mutex_;
  std::condition_variable wait_cv_;
  std::atomic<std::size_t> suppressed_restarts_{0};
};

}  // namespace gridcore
