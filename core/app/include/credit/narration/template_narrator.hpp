#pragma once

#include "credit/narration/i_narrator.hpp"

namespace credit {

// -----------------------------------------------------------------------------
// TemplateNarrator
// -----------------------------------------------------------------------------
//
// @brief  Deterministic INarrator built from fixed message templates.
//
// @details
// Used when no narration service is configured and as the fallback when the
// configured one fails. composeMessage() lists every offered option with its
// terms. proposeCounter() never suggests terms of its own: it returns an
// acknowledgement without an offer, which leaves the Negotiation Engine's
// deterministic fallback to price the round.
//
// Thread model:
//   Stateless; safe to call concurrently.
// -----------------------------------------------------------------------------
class TemplateNarrator final : public INarrator {
 public:
  domain::CustomerMessage composeMessage(
      const DecisionContext& context) override;

  CounterProposal proposeCounter(const NegotiationContext& context) override;
};

}  // namespace credit
