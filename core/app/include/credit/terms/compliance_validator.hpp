#pragma once

#include "credit/domain/credit_option.hpp"
#include "credit/domain/risk_config.hpp"
#include "credit/domain/validation_result.hpp"

#include <string>
#include <vector>

namespace credit {

// -----------------------------------------------------------------------------
// ComplianceValidator
// -----------------------------------------------------------------------------
//
// @brief  Independent re-check of every option before it may be offered.
//
// @details
// The validator does not trust the Options Generator or the Narrator. For
// each option it applies, in order:
//
//   1. expected_loss <= max_expected_loss
//        "Option B: EL ₹5,100.00 exceeds ₹5,000.00"
//   2. upfront_amount <= approved_amount
//        "Option B: Upfront ₹60,000 exceeds approved ₹50,000"
//   3. 7 <= settlement_days <= 90
//        "Option A: Settlement days 5 out of range [7, 90]"
//   4. all amounts finite and non-negative
//        "Option C: Amounts must be finite and non-negative"
//
// A failing option is reported, never repaired.
//
// Thread model:
//   Immutable after construction; safe to call concurrently.
// -----------------------------------------------------------------------------
class ComplianceValidator {
 public:
  static constexpr int kMinSettlementDays = 7;
  static constexpr int kMaxSettlementDays = 90;

  explicit ComplianceValidator(const domain::RiskConstraints& constraints);

  // -------------------------------------------------------------------------
  // validate(options)
  // -------------------------------------------------------------------------
  // @return ValidationResult with violations in option order, then check
  //         order. compliant == violations.empty().
  // -------------------------------------------------------------------------
  domain::ValidationResult validate(
      const std::vector<domain::CreditOption>& options) const;

  // -------------------------------------------------------------------------
  // check(option)
  // -------------------------------------------------------------------------
  // @brief  Violations for a single option. Used by validate() and by the
  //         Negotiation Engine to verify counter-offers.
  // -------------------------------------------------------------------------
  std::vector<std::string> check(const domain::CreditOption& option) const;

 private:
  const domain::RiskConstraints constraints_;
};

}  // namespace credit
