#pragma once

#include "credit/domain/booking_request.hpp"
#include "credit/domain/credit_option.hpp"
#include "credit/domain/risk_scores.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace credit {
namespace domain {

using SessionId = std::uint64_t;

// -----------------------------------------------------------------------------
// NegotiationState
// -----------------------------------------------------------------------------
//
// @brief  Per-session protocol state.
//
// @details
//   Open       accepting rounds; also the state after a round that produced
//              no verified offer (round < 3).
//   Resolved   the last round returned a verified counter-offer. The session
//              stays usable for another round until the ceiling.
//   Escalated  terminal. Handed to manual review; further calls re-return
//              the stored escalation result.
// -----------------------------------------------------------------------------
enum class NegotiationState {
  Open,
  Resolved,
  Escalated,
};

const char* negotiationStateToString(NegotiationState state);

// Where a round's response came from.
enum class OfferSource {
  Narrator,
  Fallback,
  Escalation,
};

const char* offerSourceToString(OfferSource source);

// One line of the negotiation transcript.
struct Turn {
  std::string role;  // "Customer" or "Agent"
  std::string text;
};

// Structured counter-offer terms. Always verified by the engine before use.
struct CounterOffer {
  double upfront{0.0};
  int settlement_days{0};
  double approved_amount{0.0};
};

// -----------------------------------------------------------------------------
// NegotiationResult: outcome of one negotiation round
// -----------------------------------------------------------------------------
//
// @details
// offer and expected_loss are both set or both empty. expected_loss is the
// engine's own re-pricing of the offer, never a number supplied by the
// Narrator. escalate is true only in the Escalated state.
// -----------------------------------------------------------------------------
struct NegotiationResult {
  std::string response_text;
  std::optional<CounterOffer> offer;
  std::optional<double> expected_loss;
  bool escalate{false};
  int round_number{0};
  NegotiationState state{NegotiationState::Open};
  OfferSource source{OfferSource::Fallback};
};

// -----------------------------------------------------------------------------
// NegotiationSession: state for one customer conversation
// -----------------------------------------------------------------------------
//
// @brief  Everything the Negotiation Engine needs to process the next round
//         of a conversation.
//
// @details
// Owned exclusively by SessionStore. The Negotiation Engine receives a
// mutable reference only while the store holds that session's lock, so at
// most one round is in flight per session.
//
// Lifecycle:
//   created   by SessionStore::create() after an offer set is declined;
//   advanced  by NegotiationEngine::advance(), one call per customer message;
//   destroyed by SessionStore::reset() or SessionStore::purgeIdle().
//
// Invariants:
//   1 <= round_number <= kMaxRounds
//   rounds_completed <= kMaxRounds
//   escalated == (state == NegotiationState::Escalated)
//   initial_options is never modified after creation.
// -----------------------------------------------------------------------------
struct NegotiationSession {
  static constexpr int kMaxRounds = 3;

  SessionId id{0};
  BookingRequest booking;
  RiskScores scores;
  std::vector<CreditOption> initial_options;

  int round_number{1};
  int rounds_completed{0};
  std::vector<Turn> transcript;
  NegotiationState state{NegotiationState::Open};
  bool escalated{false};

  // Returned verbatim to any call made after escalation.
  std::optional<NegotiationResult> escalation_result;

  // Epoch ms of the last create/advance, used by SessionStore::purgeIdle().
  std::int64_t last_activity_ms{0};
};

}  // namespace domain
}  // namespace credit
