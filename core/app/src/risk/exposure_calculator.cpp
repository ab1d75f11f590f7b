#include "credit/risk/exposure_calculator.hpp"

#include <algorithm>
#include <cmath>

namespace credit {

double exposureAtDefault(double outstanding, double booking_amount,
                         double upfront) {
  return outstanding + booking_amount - upfront;
}

double expectedLoss(double pd, double ead, double lgd) {
  return pd * ead * lgd;
}

double roundToCents(double amount) {
  return std::round(amount * 100.0) / 100.0;
}

double ceilToUnit(double amount) { return std::ceil(amount); }

double roundToUnit(double amount) { return std::round(amount); }

// -----------------------------------------------------------------------------
// pdForHorizon(): piecewise-linear interpolation over the 7/14/30 points
// -----------------------------------------------------------------------------
double pdForHorizon(int days, double pd_7d, double pd_14d, double pd_30d) {
  if (days <= 7) {
    return pd_7d;
  }
  if (days <= 14) {
    const double t = static_cast<double>(days - 7) / 7.0;
    return pd_7d + t * (pd_14d - pd_7d);
  }
  if (days <= 30) {
    const double t = static_cast<double>(days - 14) / 16.0;
    return pd_14d + t * (pd_30d - pd_14d);
  }

  // Past the last scored horizon: keep the 14→30 slope, never decrease.
  const double slope = std::max(0.0, (pd_30d - pd_14d) / 16.0);
  return std::min(1.0, pd_30d + slope * static_cast<double>(days - 30));
}

domain::FinancialAnalysis analyzeExposure(
    const domain::BookingRequest& booking, const domain::RiskScores& scores,
    const domain::RiskConstraints& constraints) {
  domain::FinancialAnalysis analysis;
  analysis.outstanding = booking.current_outstanding;
  analysis.booking_amount = booking.booking_amount;
  analysis.pd_30d = scores.pd_30d;
  analysis.lgd = constraints.lgd;
  analysis.max_expected_loss = constraints.max_expected_loss;

  analysis.total_exposure =
      exposureAtDefault(booking.current_outstanding, booking.booking_amount);
  analysis.baseline_expected_loss =
      expectedLoss(scores.pd_30d, analysis.total_exposure, constraints.lgd);
  analysis.exceeds_risk_appetite =
      analysis.baseline_expected_loss > constraints.max_expected_loss;
  analysis.exceeds_by = std::max(
      0.0, analysis.baseline_expected_loss - constraints.max_expected_loss);
  return analysis;
}

}  // namespace credit
