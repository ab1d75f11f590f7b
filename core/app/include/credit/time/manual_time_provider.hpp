#pragma once

#include "credit/time/i_time_provider.hpp"

#include <atomic>
#include <cstdint>

namespace credit {

// -----------------------------------------------------------------------------
// ManualTimeProvider: externally driven clock
// -----------------------------------------------------------------------------
//
// @brief  ITimeProvider whose current time only moves when told to.
//
// @details
// Lets tests and replay tools control session idle time deterministically:
// create a session at t, advance_by(max_idle + 1), call purgeIdle().
//
// Storage is a single std::atomic<int64_t>; readers and the writer never
// block each other.
//
// Thread model:
//   now_ms(), set_time() and advance_by() are safe from any thread.
// -----------------------------------------------------------------------------
class ManualTimeProvider final : public ITimeProvider {
 public:
  explicit ManualTimeProvider(std::int64_t start_ms = 0)
      : current_time_ms_(start_ms) {}

  std::int64_t now_ms() const override;

  // Sets the clock to an absolute value. Monotonicity is not enforced.
  void set_time(std::int64_t time_ms);

  // Moves the clock forward by delta_ms.
  void advance_by(std::int64_t delta_ms);

 private:
  std::atomic<std::int64_t> current_time_ms_;
};

}  // namespace credit
