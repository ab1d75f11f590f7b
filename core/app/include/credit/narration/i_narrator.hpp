#pragma once

#include "credit/domain/booking_request.hpp"
#include "credit/domain/credit_option.hpp"
#include "credit/domain/decision_record.hpp"
#include "credit/domain/financial_analysis.hpp"
#include "credit/domain/negotiation.hpp"
#include "credit/domain/risk_scores.hpp"

#include <optional>
#include <string>
#include <vector>

namespace credit {

// Everything a Narrator needs to present a validated option set.
struct DecisionContext {
  domain::BookingRequest booking;
  domain::RiskScores scores;
  domain::FinancialAnalysis analysis;
  std::vector<domain::CreditOption> options;
  double max_expected_loss{0.0};
};

// Everything a Narrator needs to propose the next counter-offer.
struct NegotiationContext {
  domain::BookingRequest booking;
  domain::RiskScores scores;
  std::vector<domain::CreditOption> initial_options;
  std::vector<domain::Turn> transcript;
  std::string customer_message;
  int round_number{1};
  double max_expected_loss{0.0};
  double lgd{0.0};
};

// -----------------------------------------------------------------------------
// CounterProposal: unverified Narrator output for one round
// -----------------------------------------------------------------------------
// offer is a suggestion only. The Negotiation Engine re-prices and
// validates it, and ignores escalate_hint beyond logging it.
// -----------------------------------------------------------------------------
struct CounterProposal {
  std::string response_text;
  std::optional<domain::CounterOffer> offer;
  bool escalate_hint{false};
};

// -----------------------------------------------------------------------------
// INarrator: customer-facing language generation
// -----------------------------------------------------------------------------
//
// @brief  Turns engine decisions into customer messages and proposes
//         counter-offers during negotiation.
//
// @details
// Implementations may call out to a language service and may therefore be
// slow or fail. The engine runs every call on its WorkerPool under a
// deadline and treats a timeout or any exception as a failure, replacing
// the output with TemplateNarrator text or the deterministic fallback
// offer. A Narrator can never change a decision or push an offer past the
// risk budget.
//
// Thread-safety contract:
//   Both methods may be called concurrently from pool workers. Contexts are
//   passed by value-owned copies and outlive the call.
// -----------------------------------------------------------------------------
class INarrator {
 public:
  virtual ~INarrator() = default;

  virtual domain::CustomerMessage composeMessage(
      const DecisionContext& context) = 0;

  virtual CounterProposal proposeCounter(const NegotiationContext& context) = 0;
};

}  // namespace credit
