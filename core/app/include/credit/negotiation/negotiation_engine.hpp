#pragma once

#include "credit/concurrent/worker_pool.hpp"
#include "credit/config/engine_config.hpp"
#include "credit/domain/negotiation.hpp"
#include "credit/narration/i_narrator.hpp"
#include "credit/terms/compliance_validator.hpp"

#include <optional>
#include <string>

namespace credit {

// A counter-offer the engine has re-priced and validated itself.
struct VerifiedOffer {
  domain::CounterOffer offer;
  double expected_loss{0.0};
  double pd{0.0};  // default probability the offer was priced at
};

// -----------------------------------------------------------------------------
// NegotiationEngine
// -----------------------------------------------------------------------------
//
// @brief  Runs one round of the bounded negotiation protocol per customer
//         message.
//
// @details
// State machine (per session, at most three rounds):
//
//   Escalated session        → replay the stored escalation result
//   three rounds completed   → escalate
//   otherwise
//     1. ask the Narrator for a counter-proposal, bounded by
//        narrator_timeout_ms on the WorkerPool
//     2. re-price and validate the Narrator's offer (verifyProposal)
//     3. if there is no usable Narrator offer, compute the deterministic
//        fallback offer (fallbackOffer)
//     4. verified offer              → Resolved, offer returned
//        none, round < 3             → Open, "cannot meet that" response
//        none, round 3               → Escalated (terminal)
//
// Every round that runs appends the customer turn and the agent turn,
// increments rounds_completed and advances round_number (capped at 3).
//
// Narrator problems (timeout, exception, offer that fails verification)
// never surface as errors; they are logged and the round falls through to
// the fallback.
//
// Thread model:
//   advance() mutates only the session it is given; the caller (SessionStore)
//   holds that session's lock. The engine itself is immutable after
//   construction and may serve many sessions concurrently.
//
// Ownership:
//   Copies the risk constraints and negotiation tunables. Holds references
//   to the Narrator, WorkerPool and ComplianceValidator,
//   all owned by DecisionOrchestrator and outliving the engine. The
//   Narrator must also outlive any call still running on the pool after a
//   timeout; the orchestrator stops the pool before releasing it.
// -----------------------------------------------------------------------------
class NegotiationEngine {
 public:
  NegotiationEngine(const EngineConfig& config, INarrator& narrator,
                    WorkerPool& pool, const ComplianceValidator& validator);

  NegotiationEngine(const NegotiationEngine&) = delete;
  NegotiationEngine& operator=(const NegotiationEngine&) = delete;

  // -------------------------------------------------------------------------
  // advance(session, customer_message)
  // -------------------------------------------------------------------------
  // @brief  Processes one customer message against session.
  // @return The round's result; also stored in the session when escalating.
  // -------------------------------------------------------------------------
  domain::NegotiationResult advance(domain::NegotiationSession& session,
                                    const std::string& customer_message) const;

  // -------------------------------------------------------------------------
  // verifyProposal(session, offer)
  // -------------------------------------------------------------------------
  //
  // @brief  Re-prices a proposed counter-offer and checks it against the
  //         risk budget and compliance rules.
  //
  // @details
  //   EL = pdForHorizon(settlement_days)
  //        * (outstanding + approved_amount - upfront) * lgd
  //
  // Rejected when any amount is non-finite or negative, approved_amount is
  // zero or above the requested booking, or the validator reports any
  // violation for the re-priced option.
  //
  // @return The verified offer with the engine's EL (rounded to cents), or
  //         std::nullopt.
  // -------------------------------------------------------------------------
  std::optional<VerifiedOffer> verifyProposal(
      const domain::NegotiationSession& session,
      const domain::CounterOffer& offer) const;

  // -------------------------------------------------------------------------
  // fallbackOffer(session)
  // -------------------------------------------------------------------------
  //
  // @brief  Deterministic counter-offer used when the Narrator has none.
  //
  // @details
  // fallback_settlement_days (10) at pd = (pd_7d + pd_14d) / 2, full
  // amount, upfront solved against the budget as for the upfront option,
  // clamped to [0, fallback_upfront_cap_fraction * booking] and rounded up
  // to a whole unit. Returned only if the result passes the validator.
  // -------------------------------------------------------------------------
  std::optional<VerifiedOffer> fallbackOffer(
      const domain::NegotiationSession& session) const;

  // "REF-<booking_date>-<last four characters of company_id>"
  static std::string escalationReference(const domain::BookingRequest& booking);

 private:
  std::optional<CounterProposal> askNarrator(
      const domain::NegotiationSession& session,
      const std::string& customer_message) const;

  domain::NegotiationResult escalate(domain::NegotiationSession& session,
                                     const std::string& customer_message) const;

  const domain::RiskConstraints constraints_;
  const NegotiationConfig negotiation_;
  INarrator& narrator_;
  WorkerPool& pool_;
  const ComplianceValidator& validator_;
};

}  // namespace credit
