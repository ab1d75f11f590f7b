// =============================================================================
// event_bus_test.cpp
// =============================================================================
// Unit tests for credit::EventBus.
//
// Validates:
//   - Generic (all-event) subscription receives every event type
//   - Typed subscription receives only the matching event type
//   - Multiple subscribers all receive the same published event
//   - Unsubscribe stops delivery; unknown ids are ignored
//   - Publishing with no subscribers is harmless
//   - Re-entrant publish (subscriber publishes inside callback), no deadlock
//   - Payload integrity through the variant dispatch path
//   - Concurrent publishers all get delivered
//   - A throwing subscriber is counted and skipped; others still receive
//
// Threading model: single-threaded except the last test.
// End-to-end delivery from the orchestrator is covered in
// decision_orchestrator_test.cpp.
// =============================================================================

#include "credit/eventbus/event_bus.hpp"
#include "credit/events/event.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using credit::DecisionEvent;
using credit::EscalationEvent;
using credit::NegotiationRoundEvent;

class EventBusTest : public ::testing::Test {
 protected:
  credit::EventBus bus;

  static DecisionEvent makeDecision(const std::string& company,
                                    credit::domain::Decision decision) {
    DecisionEvent e;
    e.company_id = company;
    e.decision = decision;
    return e;
  }

  static NegotiationRoundEvent makeRound(credit::domain::SessionId id,
                                         int round) {
    NegotiationRoundEvent e;
    e.session_id = id;
    e.company_id = "IN-TRV-000567";
    e.round_number = round;
    return e;
  }
};

// -----------------------------------------------------------------------------
// 1. A generic subscriber is invoked for every event type.
// Why: an audit log subscribes generically and must see everything.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, GenericSubscriberReceivesAllEvents) {
  int call_count = 0;
  bus.subscribe([&call_count](const credit::Event&) { ++call_count; });

  bus.publish(makeDecision("IN-TRV-000123", credit::domain::Decision::Approved));
  bus.publish(makeRound(1, 1));
  bus.publish(EscalationEvent{1, "IN-TRV-000567", "REF-2026-02-15-0567", 3, 0});

  EXPECT_EQ(call_count, 3);
}

// -----------------------------------------------------------------------------
// 2. A typed subscriber fires only for its registered event type.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, TypedSubscriberFiltersCorrectly) {
  int escalations = 0;
  bus.subscribe<EscalationEvent>(
      [&escalations](const EscalationEvent&) { ++escalations; });

  bus.publish(makeRound(1, 1));
  bus.publish(EscalationEvent{1, "IN-TRV-000567", "REF-2026-02-15-0567", 3, 0});
  bus.publish(makeDecision("IN-TRV-000999", credit::domain::Decision::Blocked));

  EXPECT_EQ(escalations, 1);
}

// -----------------------------------------------------------------------------
// 3. Multiple subscribers all receive the same event.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, MultipleSubscribersAllReceive) {
  int count_a = 0;
  int count_b = 0;
  bus.subscribe<DecisionEvent>([&count_a](const DecisionEvent&) { ++count_a; });
  bus.subscribe<DecisionEvent>([&count_b](const DecisionEvent&) { ++count_b; });
  EXPECT_EQ(bus.subscriberCount(), 2u);

  bus.publish(makeDecision("IN-TRV-000567", credit::domain::Decision::Negotiate));

  EXPECT_EQ(count_a, 1);
  EXPECT_EQ(count_b, 1);
}

// -----------------------------------------------------------------------------
// 4. After unsubscribe(id), the callback no longer fires.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, UnsubscribeStopsDelivery) {
  int call_count = 0;
  auto id = bus.subscribe<NegotiationRoundEvent>(
      [&call_count](const NegotiationRoundEvent&) { ++call_count; });

  bus.publish(makeRound(1, 1));
  EXPECT_EQ(call_count, 1);

  bus.unsubscribe(id);
  EXPECT_EQ(bus.subscriberCount(), 0u);

  bus.publish(makeRound(1, 2));
  EXPECT_EQ(call_count, 1);
}

// -----------------------------------------------------------------------------
// 5. Unknown ids and empty buses are harmless.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, UnsubscribeUnknownIdAndPublishToEmptyBus) {
  EXPECT_NO_FATAL_FAILURE(bus.unsubscribe(9999));
  EXPECT_NO_FATAL_FAILURE(bus.publish(makeRound(1, 1)));
}

// -----------------------------------------------------------------------------
// 6. A subscriber may publish from inside its callback.
// Why: publish() snapshots the subscriber list and releases the lock before
//      invoking callbacks; holding it would deadlock here.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, SubscriberCanPublishInsideCallback) {
  int escalations = 0;
  bus.subscribe<EscalationEvent>(
      [&escalations](const EscalationEvent&) { ++escalations; });

  bus.subscribe<NegotiationRoundEvent>([this](const NegotiationRoundEvent& e) {
    if (e.state == credit::domain::NegotiationState::Escalated) {
      bus.publish(EscalationEvent{e.session_id, e.company_id, "REF", 3, 0});
    }
  });

  auto round = makeRound(4, 3);
  round.state = credit::domain::NegotiationState::Escalated;
  bus.publish(round);

  EXPECT_EQ(escalations, 1);
}

// -----------------------------------------------------------------------------
// 7. Payload fields survive the variant dispatch.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, TypedSubscriberReceivesCorrectData) {
  NegotiationRoundEvent received;
  bus.subscribe<NegotiationRoundEvent>(
      [&received](const NegotiationRoundEvent& e) { received = e; });

  auto round = makeRound(42, 2);
  round.state = credit::domain::NegotiationState::Resolved;
  round.source = credit::domain::OfferSource::Narrator;
  round.expected_loss = 4760.0;
  round.timestamp_ms = 1234;
  bus.publish(round);

  EXPECT_EQ(received.session_id, 42u);
  EXPECT_EQ(received.company_id, "IN-TRV-000567");
  EXPECT_EQ(received.round_number, 2);
  EXPECT_EQ(received.state, credit::domain::NegotiationState::Resolved);
  EXPECT_EQ(received.source, credit::domain::OfferSource::Narrator);
  ASSERT_TRUE(received.expected_loss.has_value());
  EXPECT_DOUBLE_EQ(*received.expected_loss, 4760.0);
  EXPECT_EQ(received.timestamp_ms, 1234);
}

// -----------------------------------------------------------------------------
// 8. Publishing from several threads delivers every event.
// Why: request threads publish decisions concurrently.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, ConcurrentPublishersAllDelivered) {
  constexpr int kThreads = 4;
  constexpr int kPerThread = 250;
  std::atomic<int> received{0};
  bus.subscribe<DecisionEvent>([&received](const DecisionEvent&) { ++received; });

  std::vector<std::thread> publishers;
  for (int t = 0; t < kThreads; ++t) {
    publishers.emplace_back([this] {
      for (int i = 0; i < kPerThread; ++i) {
        bus.publish(
            makeDecision("IN-TRV-000567", credit::domain::Decision::Negotiate));
      }
    });
  }
  for (auto& t : publishers) t.join();

  EXPECT_EQ(received.load(), kThreads * kPerThread);
}

// -----------------------------------------------------------------------------
// 9. A subscriber that throws does not stop delivery to the rest.
// Why: a broken audit sink must not fail a decision already made.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, ThrowingSubscriberIsIsolated) {
  int before = 0;
  int after = 0;
  bus.subscribe([&before](const credit::Event&) { ++before; });
  bus.subscribe<EscalationEvent>([](const EscalationEvent&) {
    throw std::runtime_error("review queue offline");
  });
  bus.subscribe([&after](const credit::Event&) { ++after; });

  EXPECT_EQ(bus.publish(EscalationEvent{1, "IN-TRV-000567", "REF", 3, 0}), 2u);
  EXPECT_EQ(bus.publish(makeRound(1, 1)), 3u);

  EXPECT_EQ(before, 2);
  EXPECT_EQ(after, 2);
  EXPECT_EQ(bus.failedDeliveries(), 1u);
  EXPECT_STREQ(credit::eventName(credit::Event{makeRound(1, 1)}),
               "negotiation_round");
}
