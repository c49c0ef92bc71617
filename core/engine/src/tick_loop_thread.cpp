#include "gridcore/engine/tick_loop_thread.hpp"

#include <iostream>
#include <utility>

namespace gridcore {

TickLoopThread::TickLoopThread(TickFn tick, std::chrono::milliseconds interval)
    : tick_(std::move(tick)), interval_(interval) {}

TickLoopThread::~TickLoopThread() { stop(); }

void TickLoopThread::start() {
  if (thread_.joinable()) {
    return;
  }
  running_.store(true);
  alive_.store(true);
  thread_ = std::thread([this] { run(); });
}

void TickLoopThread::stop() {
  requestStop();
  if (thread_.joinable()) {
    thread_.join();
  }
}

void TickLoopThread::requestStop() {
  {
    std::lock_guard lock(wait_mutex_);
    running_.store(false);
  }
  wait_cv_.notify_all();
}

void TickLoopThread::wake() {
  {
    std::lock_guard lock(wait_mutex_);
    woken_ = true;
  }
  wait_cv_.notify_all();
}

std::string TickLoopThread::lastError() const {
  std::lock_guard lock(error_mutex_);
  return last_error_;
}

void TickLoopThread::run() {
  for (;;) {
    {
      std::unique_lock lock(wait_mutex_);
      wait_cv_.wait_for(lock, interval_,
                        [this] { return !running_.load() || woken_; });
      woken_ = false;
    }
    if (!running_.load()) {
      break;
    }

    try {
      tick_();
    } catch (const std::exception& e) {
      std::cerr << "[TickLoopThread] tick threw, loop exiting: " << e.what()
                << "\n";
      {
        std::lock_guard lock(error_mutex_);
        last_error_ = e.what();
      }
      break;
    }
  }
  alive_.store(false);
}

}  // namespace gridcore
