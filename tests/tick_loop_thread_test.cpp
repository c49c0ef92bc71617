// =============================================================================
// tick_loop_thread_test.cpp
// =============================================================================
// Unit tests for gridcore::TickLoopThread.
//
// Validates:
//   - Ticks run on the worker thread, one interval after start()
//   - wake() cuts the interval short; stop() returns promptly
//   - A throwing tick ends the loop and is reported via lastError()
//   - start() after stop() runs a fresh loop
// =============================================================================

#include "gridcore/engine/tick_loop_thread.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <future>
#include <stdexcept>
#include <thread>

using namespace std::chrono_literals;

namespace {

// Polls `pred` for up to two seconds.
template <typename Pred>
bool eventually(Pred pred) {
  auto deadline = std::chrono::steady_clock::now() + 2s;
  while (std::chrono::steady_clock::now() < deadline) {
    if (pred()) {
      return true;
    }
    std::this_thread::sleep_for(1ms);
  }
  return pred();
}

}  // namespace

class TickLoopThreadTest : public ::testing::Test {
 protected:
  std::atomic<int> ticks{0};
};

// -----------------------------------------------------------------------------
// 1. Ticks run on a thread other than the caller's.
// -----------------------------------------------------------------------------
TEST_F(TickLoopThreadTest, TicksOnWorkerThread) {
  std::promise<std::thread::id> tick_thread;
  auto tick_thread_future = tick_thread.get_future();
  std::atomic<bool> reported{false};

  gridcore::TickLoopThread loop(
      [&] {
        if (!reported.exchange(true)) {
          tick_thread.set_value(std::this_thread::get_id());
        }
      },
      10s);
  loop.start();
  loop.wake();

  ASSERT_EQ(tick_thread_future.wait_for(2s), std::future_status::ready);
  EXPECT_NE(tick_thread_future.get(), std::this_thread::get_id());
  EXPECT_TRUE(loop.running());
  loop.stop();
  EXPECT_FALSE(loop.running());
}

// -----------------------------------------------------------------------------
// 2. With a long interval, only wake() produces ticks, and stop() does not
//    wait the interval out.
// Why: Owners run the first tick themselves before starting the loop, so
//      the loop must not repeat it at once.
// -----------------------------------------------------------------------------
TEST_F(TickLoopThreadTest, WakeAndPromptStop) {
  gridcore::TickLoopThread loop([&] { ++ticks; }, 10s);
  loop.start();
  std::this_thread::sleep_for(20ms);
  EXPECT_EQ(ticks.load(), 0);

  loop.wake();
  ASSERT_TRUE(eventually([&] { return ticks.load() == 1; }));

  loop.wake();
  ASSERT_TRUE(eventually([&] { return ticks.load() == 2; }));

  auto before = std::chrono::steady_clock::now();
  loop.stop();
  EXPECT_LT(std::chrono::steady_clock::now() - before, 2s);
  EXPECT_EQ(ticks.load(), 2);
}

// -----------------------------------------------------------------------------
// 3. A tick that throws ends the loop and running() turns false.
// -----------------------------------------------------------------------------
TEST_F(TickLoopThreadTest, ThrowingTickEndsLoop) {
  gridcore::TickLoopThread loop(
      [&] {
        if (++ticks == 3) {
          throw std::runtime_error("grid state inconsistent");
        }
      },
      1ms);
  loop.start();

  ASSERT_TRUE(eventually([&] { return !loop.running(); }));
  EXPECT_EQ(ticks.load(), 3);
  EXPECT_EQ(loop.lastError(), "grid state inconsistent");
  loop.stop();
}

// -----------------------------------------------------------------------------
// 4. stop() is idempotent and the loop can be started again afterwards.
// -----------------------------------------------------------------------------
TEST_F(TickLoopThreadTest, RestartAfterStop) {
  gridcore::TickLoopThread loop([&] { ++ticks; }, 10s);
  loop.stop();

  loop.start();
  loop.wake();
  ASSERT_TRUE(eventually([&] { return ticks.load() == 1; }));
  loop.stop();
  loop.stop();

  loop.start();
  loop.wake();
  ASSERT_TRUE(eventually([&] { return ticks.load() == 2; }));
  EXPECT_TRUE(loop.running());
}
