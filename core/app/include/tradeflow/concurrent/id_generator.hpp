#pragma once

#include <atomic>
#include <cstdint>
#include <string>
#include <utility>

namespace tradeflow {

// -----------------------------------------------------------------------------
// IdGenerator: thread-safe, monotonically increasing id source
// -----------------------------------------------------------------------------
//
// @brief  Produces unique ids from an atomic counter, optionally rendered with
//         a prefix ("ord-1", "trd-7").
//
// @details
// Starts at 1 so 0 can stay an "unset" sentinel. Relaxed ordering is enough:
// the only guarantee required is that each call returns a distinct value.
// The mock execution client owns one generator for exchange order ids and one
// for trade ids; the engine never generates exchange ids itself.
//
// Thread model: next_id()/next() are safe to call from any thread.
// Ownership: value member of its owner; non-copyable so two owners never
// hand out duplicate ids.
// -----------------------------------------------------------------------------
class IdGenerator {
 public:
  explicit IdGenerator(std::string prefix = {}) : prefix_(std::move(prefix)) {}

  IdGenerator(const IdGenerator&) = delete;
  IdGenerator& operator=(const IdGenerator&) = delete;
  IdGenerator(IdGenerator&&) = delete;
  IdGenerator& operator=(IdGenerator&&) = delete;

  std::uint64_t next_id() {
    return next_id_.fetch_add(1, std::memory_order_relaxed);
  }

  std::string next() { return prefix_ + std::to_string(next_id()); }

 private:
  const std::string prefix_;
  std::atomic<std::uint64_t> next_id_{1};
};

}  // namespace tradeflow
