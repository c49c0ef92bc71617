#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

namespace gridcore {

// -----------------------------------------------------------------------------
// TickLoopThread: periodic worker with cooperative stop
// -----------------------------------------------------------------------------
//
// @brief  Runs a tick function on a dedicated thread, once per interval,
//         sequentially.
//
// @details
// Ticks never overlap: the first tick runs one interval after start(), each
// later one `interval` after the previous one finished. Stop is cooperative: stop() and requestStop() only raise a
// flag (and wake the idle wait), so a tick in progress always runs to
// completion, including its in-flight exchange calls.
//
// If the tick function throws, the exception is logged, kept as
// lastError() and the loop exits. running() then reports false, which is
// how the Supervisor notices an engine crash.
//
// Thread model:
//   start()/stop()  owner thread (session, supervisor). stop() joins, so it
//                   must not be called from inside the tick function; use
//                   requestStop() there.
//   wake()          any thread; skips the remaining idle wait.
// -----------------------------------------------------------------------------
class TickLoopThread {
 public:
  using TickFn = std::function<void()>;

  TickLoopThread(TickFn tick, std::chrono::milliseconds interval);

  ~TickLoopThread();

  TickLoopThread(const TickLoopThread&) = delete;
  TickLoopThread& operator=(const TickLoopThread&) = delete;
  TickLoopThread(TickLoopThread&&) = delete;
  TickLoopThread& operator=(TickLoopThread&&) = delete;

  // No-op if already started.
  void start();

  // Requests stop and joins. Idempotent.
  void stop();

  // Requests stop without joining.
  void requestStop();

  void wake();

  // True while the worker thread is inside its loop.
  bool running() const { return alive_.load(); }

  std::string lastError() const;

 private:
  void run();

  TickFn tick_;
  std::chrono::milliseconds interval_;

  std::atomic<bool> running_{false};
  std::atomic<bool> alive_{false};
  bool woken_{false};

  std::mutex wait_mutex_;
  std::condition_variable wait_cv_;

  mutable std::mutex error_mutex_;
  std::string last_error_;

  std::thread thread_;
};

}  // namespace gridcore
