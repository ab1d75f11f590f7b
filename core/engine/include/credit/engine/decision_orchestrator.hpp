#pragma once

#include "credit/concurrent/worker_pool.hpp"
#include "credit/config/engine_config.hpp"
#include "credit/domain/booking_request.hpp"
#include "credit/domain/decision_record.hpp"
#include "credit/domain/negotiation.hpp"
#include "credit/eventbus/event_bus.hpp"
#include "credit/narration/i_narrator.hpp"
#include "credit/narration/template_narrator.hpp"
#include "credit/negotiation/negotiation_engine.hpp"
#include "credit/negotiation/session_store.hpp"
#include "credit/risk/risk_gate.hpp"
#include "credit/scoring/i_scorer.hpp"
#include "credit/terms/compliance_validator.hpp"
#include "credit/terms/options_generator.hpp"
#include "credit/time/i_time_provider.hpp"

#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace credit {

// -----------------------------------------------------------------------------
// DecisionOrchestrator
// -----------------------------------------------------------------------------
//
// @brief  Root component: turns a booking request into a DecisionRecord and
//         drives negotiation sessions.
//
// @details
// processBooking() pipeline:
//
//   Scorer ──► RiskGate ──┬── green  → APPROVED (full amount, standard days)
//                         ├── red    → BLOCKED  (threshold reasons)
//                         └── yellow → FinancialAnalysis
//                                       → OptionsGenerator
//                                         ├── none      → BLOCKED
//                                         └── options   → ComplianceValidator
//                                              ├── violations → BLOCKED
//                                              └── compliant  → Narrator
//                                                               → NEGOTIATE
//
// A Scorer failure, or scores outside [0,1], switches to the configured
// conservative score set and flags the record. The Risk Gate always
// recomputes the category; the Scorer's own category is discarded.
//
// Negotiation: openNegotiation() seeds a session with the offered options;
// negotiate() runs one round through NegotiationEngine under that session's
// lock; resetNegotiation() discards it.
//
// Every decision and every negotiation round is published on the EventBus
// after the work is done, outside any session lock.
//
// Thread model:
//   processBooking() and the negotiation methods are safe to call
//   concurrently from any number of request threads. Narrator calls run on
//   the owned WorkerPool.
//
// Ownership:
//   DecisionOrchestrator
//    ├── config_         (EngineConfig, value, immutable)
//    ├── scorer_         (IScorer&, non-owning)
//    ├── narrator_       (INarrator&, non-owning)
//    ├── bus_            (EventBus&, non-owning)
//    ├── clock_          (const ITimeProvider&, non-owning)
//    ├── gate_, generator_, validator_, template_narrator_  (values)
//    ├── sessions_       (SessionStore, value)
//    ├── pool_           (unique_ptr<WorkerPool>)
//    └── negotiation_    (unique_ptr<NegotiationEngine>)
//
// The destructor stops the pool first so no Narrator call is still running
// when the engine and its references go away. Non-owning collaborators must
// outlive the orchestrator.
// -----------------------------------------------------------------------------
class DecisionOrchestrator {
 public:
  DecisionOrchestrator(const EngineConfig& config, const IScorer& scorer,
                       INarrator& narrator, EventBus& bus,
                       const ITimeProvider& clock);

  ~DecisionOrchestrator();

  DecisionOrchestrator(const DecisionOrchestrator&) = delete;
  DecisionOrchestrator& operator=(const DecisionOrchestrator&) = delete;
  DecisionOrchestrator(DecisionOrchestrator&&) = delete;
  DecisionOrchestrator& operator=(DecisionOrchestrator&&) = delete;

  // -------------------------------------------------------------------------
  // processBooking(request)
  // -------------------------------------------------------------------------
  // @brief  Full decision for one validated booking request.
  //
  // @details Policy outcomes (blocked, no options) are values in the record;
  //          nothing here throws for them. Publishes one DecisionEvent.
  // -------------------------------------------------------------------------
  domain::DecisionRecord processBooking(const domain::BookingRequest& request);

  // -------------------------------------------------------------------------
  // openNegotiation(request, scores, options)
  // -------------------------------------------------------------------------
  // @brief  Starts a session after the customer declined the offered set.
  // @return The new session's id.
  // -------------------------------------------------------------------------
  domain::SessionId openNegotiation(
      const domain::BookingRequest& request, const domain::RiskScores& scores,
      const std::vector<domain::CreditOption>& options);

  // -------------------------------------------------------------------------
  // negotiate(session_id, customer_message)
  // -------------------------------------------------------------------------
  // @brief  Advances the session by one round.
  // @throws SessionError if session_id is unknown.
  // -------------------------------------------------------------------------
  domain::NegotiationResult negotiate(domain::SessionId session_id,
                                      const std::string& customer_message);

  // @throws SessionError if session_id is unknown.
  void resetNegotiation(domain::SessionId session_id);

  // Drops sessions idle for longer than max_idle_ms. Returns the count.
  std::size_t purgeIdleSessions(std::int64_t max_idle_ms);

  std::optional<domain::NegotiationSession> sessionSnapshot(
      domain::SessionId session_id) const;

  const EngineConfig& config() const { return config_; }

 private:
  // Scores plus whether they came from the fallback set.
  std::pair<domain::RiskScores, bool> scoreCompany(
      const std::string& company_id) const;

  domain::CustomerMessage composeMessage(const DecisionContext& context);

  void publishDecision(const domain::BookingRequest& request,
                       const domain::DecisionRecord& record);

  const EngineConfig config_;
  const IScorer& scorer_;
  INarrator& narrator_;
  EventBus& bus_;
  const ITimeProvider& clock_;

  const RiskGate gate_;
  const OptionsGenerator generator_;
  const ComplianceValidator validator_;
  TemplateNarrator template_narrator_;

  SessionStore sessions_;
  std::unique_ptr<WorkerPool> pool_;
  std::unique_ptr<NegotiationEngine> negotiation_;
};

}  // namespace credit
