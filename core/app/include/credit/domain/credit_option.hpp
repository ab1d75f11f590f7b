#pragma once

#include <string>

namespace credit {
namespace domain {

// -----------------------------------------------------------------------------
// OptionKind
// -----------------------------------------------------------------------------
// The three term structures the engine knows how to offer. Negotiated
// counter-offers are classified into one of these as well (see
// NegotiationEngine::verifyProposal).
// -----------------------------------------------------------------------------
enum class OptionKind {
  ShortenedSettlement,
  UpfrontPayment,
  PartialApproval,
};

const char* optionKindToString(OptionKind kind);

// -----------------------------------------------------------------------------
// CreditOption: one candidate settlement structure
// -----------------------------------------------------------------------------
//
// @brief  A fully priced alternative to the customer's original request.
//
// @details
// Produced fresh per request by OptionsGenerator and never mutated after
// that; the generator only filters and sorts. ComplianceValidator re-checks
// every field before an option may be offered.
//
// Invariants (checked by ComplianceValidator, guaranteed by the generator):
//   expected_loss   <= RiskConstraints::max_expected_loss
//   0 <= upfront_amount <= approved_amount
//   7 <= settlement_days <= 90
//   approved_amount <= requested booking amount
//
// friction_score ranks options by customer burden. Lower is preferred; the
// generator sorts ascending and labels the result "A", "B", "C".
//
// expected_loss is stored rounded to cents. upfront_amount and
// approved_amount are whole currency units.
// -----------------------------------------------------------------------------
struct CreditOption {
  std::string option_id;                           // "A", "B", "C"
  OptionKind kind{OptionKind::ShortenedSettlement};
  int settlement_days{0};
  double upfront_amount{0.0};
  double approved_amount{0.0};
  double expected_loss{0.0};
  double friction_score{0.0};
  std::string description;                         // customer-facing summary
};

}  // namespace domain
}  // namespace credit
