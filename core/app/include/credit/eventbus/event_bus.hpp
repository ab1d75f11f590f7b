#pragma once

#include "credit/events/event.hpp"

#include <atomic>
#include <cstddef>
#include <functional>
#include <mutex>
#include <utility>
#include <vector>

namespace credit {

// -----------------------------------------------------------------------------
// EventBus
// -----------------------------------------------------------------------------
//
// @brief  Publish-subscribe channel for decision, negotiation-round and
//         escalation notifications.
//
// @details
// The orchestrator publishes; audit logging, manual-review routing and
// tests subscribe. Nothing in the decision path depends on a subscriber,
// so a bus with no subscribers is valid.
//
// Callbacks run synchronously on the publishing thread, after the lock is
// released, so a callback may publish or unsubscribe without deadlock.
//
// A decision has already been made by the time it is published, so a
// failing subscriber must not turn it into an error for the caller. A
// callback that throws a std::exception is logged to std::cerr with its
// subscription id and the event kind, counted in failedDeliveries(), and
// the remaining subscribers still receive the event.
//
// Thread model:
//   subscribe(), unsubscribe() and publish() are safe from any thread.
// -----------------------------------------------------------------------------
class EventBus {
 public:
  using GenericCallback = std::function<void(const Event&)>;
  using SubscriptionId = std::size_t;

  EventBus() = default;

  EventBus(const EventBus&) = delete;
  EventBus& operator=(const EventBus&) = delete;

  // Receives every event.
  SubscriptionId subscribe(GenericCallback callback);

  // -------------------------------------------------------------------------
  // subscribe<EventType>(callback)
  // -------------------------------------------------------------------------
  // Receives only events holding EventType, e.g.
  //   bus.subscribe<EscalationEvent>([](const EscalationEvent& e) { ... });
  // -------------------------------------------------------------------------
  template <typename EventType>
  SubscriptionId subscribe(std::function<void(const EventType&)> callback);

  // A publish already in progress may still invoke the removed callback.
  void unsubscribe(SubscriptionId id);

  // Returns the number of subscribers that handled the event without
  // throwing.
  std::size_t publish(const Event& event);

  std::size_t subscriberCount() const;

  // Callbacks that threw since construction.
  std::size_t failedDeliveries() const { return failed_.load(); }

 private:
  using SubscriberEntry = std::pair<SubscriptionId, GenericCallback>;

  mutable std::mutex mutex_;
  SubscriptionId next_id_{0};
  std::vector<SubscriberEntry> subscribers_;
  std::atomic<std::size_t> failed_{0};
};

template <typename EventType>
EventBus::SubscriptionId EventBus::subscribe(
    std::function<void(const EventType&)> callback) {
  GenericCallback wrapped = [cb = std::move(callback)](const Event& event) {
    if (const auto* ptr = std::get_if<EventType>(&event)) {
      cb(*ptr);
    }
  };
  return subscribe(std::move(wrapped));
}

}  // namespace credit
