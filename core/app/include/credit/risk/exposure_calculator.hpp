#pragma once

#include "credit/domain/booking_request.hpp"
#include "credit/domain/financial_analysis.hpp"
#include "credit/domain/risk_config.hpp"
#include "credit/domain/risk_scores.hpp"

namespace credit {

// -----------------------------------------------------------------------------
// Exposure Calculator
// -----------------------------------------------------------------------------
//
// @brief  Pure arithmetic for exposure-at-default and expected loss under the
//         Basel-style formula EL = PD × EAD × LGD.
//
// @details
// Every function here is total, side-effect free and safe to call from any
// thread. None of them range-check their inputs: a negative exposure (upfront
// larger than outstanding + booking) is returned as computed and treated as a
// caller error upstream. Range validation belongs to ComplianceValidator.
// -----------------------------------------------------------------------------

// -------------------------------------------------------------------------
// exposureAtDefault
// -------------------------------------------------------------------------
// @return outstanding + booking_amount - upfront, unclamped.
// -------------------------------------------------------------------------
double exposureAtDefault(double outstanding, double booking_amount,
                         double upfront = 0.0);

// -------------------------------------------------------------------------
// expectedLoss
// -------------------------------------------------------------------------
// @return pd * ead * lgd. pd and lgd are expected in [0,1] but not checked.
// -------------------------------------------------------------------------
double expectedLoss(double pd, double ead, double lgd);

// Rounds a currency amount to the nearest cent (half away from zero).
double roundToCents(double amount);

// Rounds a currency amount up to the next whole unit.
double ceilToUnit(double amount);

// Rounds a currency amount to the nearest whole unit.
double roundToUnit(double amount);

// -------------------------------------------------------------------------
// pdForHorizon
// -------------------------------------------------------------------------
// @brief  Default probability for an arbitrary settlement horizon, derived
//         from the three scored horizons.
//
// @details
//   days <= 7        pd_7d
//   7 < days <= 14   linear between pd_7d and pd_14d
//   14 < days <= 30  linear between pd_14d and pd_30d
//   days > 30        linear extrapolation of the 14→30 slope, capped at 1
//
// Used to re-price negotiated offers whose settlement window does not match
// a scored horizon. The result is never below pd_7d's interpolation floor
// and never above 1.
// -------------------------------------------------------------------------
double pdForHorizon(int days, double pd_7d, double pd_14d, double pd_30d);

// -------------------------------------------------------------------------
// analyzeExposure
// -------------------------------------------------------------------------
// @brief  Baseline FinancialAnalysis for a booking taken as requested on
//         standard terms (no upfront, pd_30d).
// -------------------------------------------------------------------------
domain::FinancialAnalysis analyzeExposure(
    const domain::BookingRequest& booking, const domain::RiskScores& scores,
    const domain::RiskConstraints& constraints);

}  // namespace credit
