#pragma once

// =============================================================================
// test_support.hpp
// =============================================================================
// Shared builders and fakes for the credit engine tests.
//
// The reference companies mirror the demo portfolio:
//   yellow  IN-TRV-000567  booking 50,000  outstanding 45,000
//   green   IN-TRV-000123  booking 30,000  outstanding 20,000
//   red     IN-TRV-000999  booking 100,000 outstanding 150,000
//   edge    IN-TRV-999999  booking 50,000  outstanding 80,000 (no option fits)
// =============================================================================

#include "credit/domain/booking_request.hpp"
#include "credit/domain/errors.hpp"
#include "credit/domain/negotiation.hpp"
#include "credit/domain/risk_scores.hpp"
#include "credit/narration/i_narrator.hpp"

#include <atomic>
#include <chrono>
#include <optional>
#include <string>
#include <thread>

namespace credit {
namespace testing_support {

inline domain::BookingRequest yellowBooking() {
  return domain::BookingRequest::create("IN-TRV-000567", "MediumRisk Agency",
                                        50000.0, 45000.0, 80000.0,
                                        "Chennai-Dubai", "2026-02-15");
}

inline domain::RiskScores yellowScores() {
  return domain::RiskScores::create(0.32, 0.55, 0.02, 0.08, 0.15,
                                    domain::RiskCategory::Yellow);
}

inline domain::BookingRequest greenBooking() {
  return domain::BookingRequest::create("IN-TRV-000123", "LowRisk Travels",
                                        30000.0, 20000.0, 100000.0,
                                        "Mumbai-Singapore", "2026-02-15");
}

inline domain::RiskScores greenScores() {
  return domain::RiskScores::create(0.15, 0.85, 0.005, 0.01, 0.03,
                                    domain::RiskCategory::Green);
}

inline domain::BookingRequest redBooking() {
  return domain::BookingRequest::create("IN-TRV-000999", "HighRisk Agency",
                                        100000.0, 150000.0, 120000.0,
                                        "Delhi-London", "2026-02-15");
}

inline domain::RiskScores redScores() {
  return domain::RiskScores::create(0.85, 0.25, 0.25, 0.40, 0.60,
                                    domain::RiskCategory::Red);
}

inline domain::BookingRequest edgeBooking() {
  return domain::BookingRequest::create("IN-TRV-999999",
                                        "HighRisk Travels Pvt Ltd", 50000.0,
                                        80000.0, 100000.0, "DEL-BOM",
                                        "2026-02-15");
}

inline domain::RiskScores edgeScores() {
  return domain::RiskScores::create(0.50, 0.40, 0.30, 0.40, 0.50,
                                    domain::RiskCategory::Yellow);
}

inline domain::NegotiationSession makeSession(
    const domain::BookingRequest& booking, const domain::RiskScores& scores) {
  domain::NegotiationSession session;
  session.id = 1;
  session.booking = booking;
  session.scores = scores;
  return session;
}

// -----------------------------------------------------------------------------
// FakeNarrator
// -----------------------------------------------------------------------------
// Scriptable INarrator: returns a fixed proposal, optionally after a delay,
// or throws CollaboratorError when fail is set.
// -----------------------------------------------------------------------------
class FakeNarrator final : public INarrator {
 public:
  std::optional<domain::CounterOffer> offer;
  std::string response_text{"Narrator counter-offer"};
  bool escalate_hint{false};
  bool fail{false};
  std::chrono::milliseconds delay{0};
  std::atomic<int> compose_calls{0};
  std::atomic<int> propose_calls{0};

  domain::CustomerMessage composeMessage(const DecisionContext&) override {
    ++compose_calls;
    pause();
    if (fail) {
      throw CollaboratorError("FakeNarrator: compose failed");
    }
    return domain::CustomerMessage{"Narrated subject", "Narrated body",
                                   {"Select A"}};
  }

  CounterProposal proposeCounter(const NegotiationContext&) override {
    ++propose_calls;
    pause();
    if (fail) {
      throw CollaboratorError("FakeNarrator: propose failed");
    }
    CounterProposal proposal;
    proposal.response_text = response_text;
    proposal.offer = offer;
    proposal.escalate_hint = escalate_hint;
    return proposal;
  }

 private:
  void pause() const {
    if (delay.count() > 0) {
      std::this_thread::sleep_for(delay);
    }
  }
};

}  // namespace testing_support
}  // namespace credit
