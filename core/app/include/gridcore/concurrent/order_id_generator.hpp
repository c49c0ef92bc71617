#pragma once

#include <atomic>
#include <cstdint>

namespace gridcore {

// -----------------------------------------------------------------------------
// OrderIdGenerator
// -----------------------------------------------------------------------------
// Hands out exchange order ids for the paper exchange. Ids start at 1 so
// that 0 can keep meaning "no order" in GridLevel / DcaLadderEntry.
//
// Thread-safety: next_id() is lock-free and safe from any thread.
// -----------------------------------------------------------------------------
class OrderIdGenerator {
 public:
  explicit OrderIdGenerator(std::uint64_t first_id = 1) : next_id_(first_id) {}

  OrderIdGenerator(const OrderIdGenerator&) = delete;
  OrderIdGenerator& operator=(const OrderIdGenerator&) = delete;
  OrderIdGenerator(OrderIdGenerator&&) = delete;
  OrderIdGenerator& operator=(OrderIdGenerator&&) = delete;

  std::uint64_t next_id() {
    return next_id_.fetch_add(1, std::memory_order_relaxed);
  }

 private:
  std::atomic<std::uint64_t> next_id_;
};

}  // namespace gridcore
