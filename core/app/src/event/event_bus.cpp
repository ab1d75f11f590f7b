#include "credit/eventbus/event_bus.hpp"

#include <algorithm>
#include <iostream>

namespace credit {

EventBus::SubscriptionId EventBus::subscribe(GenericCallback callback) {
  std::lock_guard lock(mutex_);
  const SubscriptionId id = next_id_++;
  subscribers_.emplace_back(id, std::move(callback));
  return id;
}

void EventBus::unsubscribe(SubscriptionId id) {
  std::lock_guard lock(mutex_);
  auto it = std::find_if(subscribers_.begin(), subscribers_.end(),
                         [id](const SubscriberEntry& e) { return e.first == id; });
  if (it != subscribers_.end()) {
    subscribers_.erase(it);
  }
}

// -----------------------------------------------------------------------------
// publish(): deliver to a snapshot, one failing subscriber does not stop
// the others
// -----------------------------------------------------------------------------
std::size_t EventBus::publish(const Event& event) {
  std::vector<SubscriberEntry> targets;
  {
    std::lock_guard lock(mutex_);
    targets = subscribers_;
  }

  std::size_t delivered = 0;
  for (const auto& [id, callback] : targets) {
    try {
      callback(event);
      ++delivered;
    } catch (const std::exception& e) {
      failed_.fetch_add(1);
      std::cerr << "[EventBus] WARNING: subscriber " << id << " failed on "
                << eventName(event) << " event: " << e.what() << "\n";
    }
  }
  return delivered;
}

std::size_t EventBus::subscriberCount() const {
  std::lock_guard lock(mutex_);
  return subscribers_.size();
}

}  // namespace credit
