#pragma once

#include "credit/time/i_time_provider.hpp"

namespace credit {

// -----------------------------------------------------------------------------
// LiveTimeProvider: wall-clock ITimeProvider
// -----------------------------------------------------------------------------
// Reads std::chrono::system_clock. Stateless, safe from any thread.
// -----------------------------------------------------------------------------
class LiveTimeProvider final : public ITimeProvider {
 public:
  std::int64_t now_ms() const override;
};

}  // namespace credit
