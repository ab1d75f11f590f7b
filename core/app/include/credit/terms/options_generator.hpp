#pragma once

#include "credit/config/engine_config.hpp"
#include "credit/domain/credit_option.hpp"
#include "credit/domain/financial_analysis.hpp"
#include "credit/domain/risk_config.hpp"
#include "credit/domain/risk_scores.hpp"

#include <vector>

namespace credit {

// Exposure and default-probability inputs for one generation run.
struct OptionsInput {
  double total_exposure{0.0};
  double outstanding{0.0};
  double booking_amount{0.0};
  double pd_7d{0.0};
  double pd_14d{0.0};
  double pd_30d{0.0};

  static OptionsInput from(const domain::FinancialAnalysis& analysis,
                           const domain::RiskScores& scores);
};

// -----------------------------------------------------------------------------
// OptionsGenerator
// -----------------------------------------------------------------------------
//
// @brief  Builds up to three alternative credit structures whose expected
//         loss fits the risk budget.
//
// @details
// Three constructions are attempted independently:
//
//   Shortened settlement  7 days, no upfront, full amount, friction 4.0.
//                         EL = pd_7d * total_exposure * lgd.
//
//   Upfront payment       standard_settlement_days, full amount,
//                         friction 7.0. Solves
//                           required = exposure - max_el / (pd_30d * lgd)
//                         and considers it only when
//                           0 < required < upfront_search_multiplier * booking.
//                         The amount is clamped to the booking, rounded up to
//                         a whole unit and re-priced; the option is dropped
//                         if the re-priced EL misses the budget.
//
//   Partial approval      14 days, no upfront, friction
//                         8 + (1 - fraction) * 2. Fractions from
//                         TermsConfig::partial_fractions are tried in order
//                         with pd_14d against outstanding + reduced booking;
//                         the first that fits wins.
//
// Admitted options are sorted ascending by friction (stable) and labelled
// "A", "B", "C" in that order. An empty result is a normal outcome.
//
// Every stored expected_loss is rounded to cents and the budget comparison
// is made on the rounded value, so an option priced exactly at the budget
// is admitted despite floating-point noise.
//
// Thread model:
//   Stateless apart from immutable configuration; generate() is const and
//   safe to call concurrently.
// -----------------------------------------------------------------------------
class OptionsGenerator {
 public:
  OptionsGenerator(const domain::RiskConstraints& constraints,
                   const TermsConfig& terms);

  std::vector<domain::CreditOption> generate(const OptionsInput& input) const;

 private:
  const domain::RiskConstraints constraints_;
  const TermsConfig terms_;
};

}  // namespace credit
