#pragma once

#include "credit/domain/negotiation.hpp"

#include <atomic>

namespace credit {

// -----------------------------------------------------------------------------
// SessionIdGenerator: thread-safe, monotonically increasing session IDs
// -----------------------------------------------------------------------------
//
// @brief  Hands out negotiation session ids from an atomic counter.
//
// @details
// Starts at 1; 0 is reserved as the "no session" sentinel. Ids are never
// reused within a process, so a reset session's id can never resolve to a
// newer session. memory_order_relaxed is enough because only uniqueness is
// required.
//
// Thread model:
//   next_id() is safe to call concurrently from any thread.
//
// Ownership:
//   Owned by value by SessionStore.
// -----------------------------------------------------------------------------
class SessionIdGenerator {
 public:
  SessionIdGenerator() = default;

  SessionIdGenerator(const SessionIdGenerator&) = delete;
  SessionIdGenerator& operator=(const SessionIdGenerator&) = delete;
  SessionIdGenerator(SessionIdGenerator&&) = delete;
  SessionIdGenerator& operator=(SessionIdGenerator&&) = delete;

  domain::SessionId next_id() {
    return next_id_.fetch_add(1, std::memory_order_relaxed);
  }

 private:
  std::atomic<domain::SessionId> next_id_{1};
};

}  // namespace credit
