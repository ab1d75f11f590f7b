#include "credit/time/manual_time_provider.hpp"

namespace credit {

std::int64_t ManualTimeProvider::now_ms() const {
  return current_time_ms_.load();
}

void ManualTimeProvider::set_time(std::int64_t time_ms) {
  current_time_ms_.store(time_ms);
}

void ManualTimeProvider::advance_by(std::int64_t delta_ms) {
  current_time_ms_.fetch_add(delta_ms);
}

}  // namespace credit
