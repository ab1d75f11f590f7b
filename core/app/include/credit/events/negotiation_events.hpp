#pragma once

#include "credit/domain/negotiation.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace credit {

// -----------------------------------------------------------------------------
// NegotiationRoundEvent
// -----------------------------------------------------------------------------
// One per negotiate() call that ran a round (not for replays of an already
// escalated session). expected_loss is the engine's own re-pricing.
// -----------------------------------------------------------------------------
struct NegotiationRoundEvent {
  domain::SessionId session_id{0};
  std::string company_id;
  int round_number{0};
  domain::NegotiationState state{domain::NegotiationState::Open};
  domain::OfferSource source{domain::OfferSource::Fallback};
  std::optional<double> expected_loss;
  std::int64_t timestamp_ms{0};
};

// -----------------------------------------------------------------------------
// EscalationEvent
// -----------------------------------------------------------------------------
//
// @brief  Published once when a session enters the terminal Escalated state.
//
// @details
// Subscribers route the booking to manual review. reference is the same
// string quoted to the customer in the escalation response.
// -----------------------------------------------------------------------------
struct EscalationEvent {
  domain::SessionId session_id{0};
  std::string company_id;
  std::string reference;
  int rounds_completed{0};
  std::int64_t timestamp_ms{0};
};

}  // namespace credit
