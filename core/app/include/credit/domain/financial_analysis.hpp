#pragma once

namespace credit {
namespace domain {

// -----------------------------------------------------------------------------
// FinancialAnalysis: baseline exposure snapshot for one request
// -----------------------------------------------------------------------------
//
// @brief  Derived, immutable view of how much is at risk if the booking is
//         approved as requested on standard 30-day terms.
//
// @details
//   total_exposure          = outstanding + booking_amount - upfront
//                             (upfront is 0 for the baseline)
//   baseline_expected_loss  = pd_30d * total_exposure * lgd
//   exceeds_risk_appetite   = baseline_expected_loss > max_expected_loss
//   exceeds_by              = max(0, baseline_expected_loss - max_expected_loss)
//
// Values are stored unrounded. exceeds_by is the only clamped field.
// The remaining members are the inputs used, kept for reporting.
// -----------------------------------------------------------------------------
struct FinancialAnalysis {
  double total_exposure{0.0};
  double baseline_expected_loss{0.0};
  bool exceeds_risk_appetite{false};
  double exceeds_by{0.0};

  double outstanding{0.0};
  double booking_amount{0.0};
  double pd_30d{0.0};
  double lgd{0.0};
  double max_expected_loss{0.0};
};

}  // namespace domain
}  // namespace credit
