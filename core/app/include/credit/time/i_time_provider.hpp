#pragma once

#include <cstdint>

namespace credit {

// -----------------------------------------------------------------------------
// ITimeProvider: abstract time source
// -----------------------------------------------------------------------------
//
// @brief  Injected clock used for session activity stamps and event
//         timestamps.
//
// @details
// SessionStore stamps every create/advance with now_ms() and purgeIdle()
// compares against it. The orchestrator stamps published events with it.
// Production wiring uses LiveTimeProvider; tests use ManualTimeProvider so
// idle expiry can be exercised without sleeping.
//
// Thread-safety contract:
//   Implementations must be safe for concurrent reads.
//
// Ownership:
//   Components hold a const reference; the provider must outlive them.
// -----------------------------------------------------------------------------
class ITimeProvider {
 public:
  virtual ~ITimeProvider() = default;

  // Milliseconds since the Unix epoch.
  virtual std::int64_t now_ms() const = 0;
};

}  // namespace credit
