// =============================================================================
// exposure_calculator_test.cpp
// =============================================================================
// Unit tests for the exposure and expected-loss arithmetic.
//
// Validates:
//   - EAD = outstanding + booking - upfront
//   - EL  = PD x EAD x LGD
//   - Cent / unit rounding helpers
//   - PD interpolation between the 7/14/30-day horizons and beyond
//   - analyzeExposure() on the reference yellow booking
//
// Threading model: pure functions, single-threaded.
// =============================================================================

#include "credit/risk/exposure_calculator.hpp"
#include "test_support.hpp"

#include <gtest/gtest.h>

using namespace credit;

// -----------------------------------------------------------------------------
// 1. Exposure at default sums the open balance and the new booking, net of
//    any upfront payment.
// -----------------------------------------------------------------------------
TEST(ExposureCalculatorTest, ExposureAtDefault) {
  EXPECT_DOUBLE_EQ(exposureAtDefault(45000.0, 50000.0), 95000.0);
  EXPECT_DOUBLE_EQ(exposureAtDefault(45000.0, 50000.0, 10000.0), 85000.0);
  EXPECT_DOUBLE_EQ(exposureAtDefault(0.0, 1000.0, 1000.0), 0.0);
}

// -----------------------------------------------------------------------------
// 2. Expected loss is the product of its three factors.
// -----------------------------------------------------------------------------
TEST(ExposureCalculatorTest, ExpectedLoss) {
  EXPECT_NEAR(expectedLoss(0.15, 95000.0, 0.70), 9975.0, 1e-6);
  EXPECT_NEAR(expectedLoss(0.02, 95000.0, 0.70), 1330.0, 1e-6);
  EXPECT_DOUBLE_EQ(expectedLoss(0.0, 95000.0, 0.70), 0.0);
}

// -----------------------------------------------------------------------------
// 3. Rounding helpers.
// Why: stored EL values are compared with the budget after rounding to cents,
//      and upfront amounts are rounded up so EL never drifts above budget.
// -----------------------------------------------------------------------------
TEST(ExposureCalculatorTest, RoundingHelpers) {
  EXPECT_DOUBLE_EQ(roundToCents(1234.5678), 1234.57);
  EXPECT_DOUBLE_EQ(roundToCents(1330.0), 1330.0);
  EXPECT_DOUBLE_EQ(ceilToUnit(47380.95), 47381.0);
  EXPECT_DOUBLE_EQ(ceilToUnit(47381.0), 47381.0);
  EXPECT_DOUBLE_EQ(roundToUnit(24999.6), 25000.0);
  EXPECT_DOUBLE_EQ(roundToUnit(24999.4), 24999.0);
}

// -----------------------------------------------------------------------------
// 4. PD at the anchor horizons and at or below 7 days.
// -----------------------------------------------------------------------------
TEST(ExposureCalculatorTest, PdAtAnchorHorizons) {
  EXPECT_DOUBLE_EQ(pdForHorizon(7, 0.02, 0.08, 0.15), 0.02);
  EXPECT_DOUBLE_EQ(pdForHorizon(3, 0.02, 0.08, 0.15), 0.02);
  EXPECT_NEAR(pdForHorizon(14, 0.02, 0.08, 0.15), 0.08, 1e-12);
  EXPECT_NEAR(pdForHorizon(30, 0.02, 0.08, 0.15), 0.15, 1e-12);
}

// -----------------------------------------------------------------------------
// 5. Linear interpolation inside each bracket.
// -----------------------------------------------------------------------------
TEST(ExposureCalculatorTest, PdInterpolatesBetweenHorizons) {
  EXPECT_NEAR(pdForHorizon(10, 0.02, 0.08, 0.15), 0.02 + 3.0 / 7.0 * 0.06,
              1e-12);
  EXPECT_NEAR(pdForHorizon(22, 0.02, 0.08, 0.15), 0.115, 1e-12);
  EXPECT_NEAR(pdForHorizon(20, 0.02, 0.08, 0.15), 0.10625, 1e-12);
}

// -----------------------------------------------------------------------------
// 6. Past 30 days the 14-to-30 slope continues, capped at 1.
// Why: a longer window must never look safer than a shorter one.
// -----------------------------------------------------------------------------
TEST(ExposureCalculatorTest, PdExtrapolatesPastThirtyDaysAndCaps) {
  EXPECT_NEAR(pdForHorizon(46, 0.02, 0.08, 0.15), 0.22, 1e-12);
  EXPECT_DOUBLE_EQ(pdForHorizon(1000, 0.02, 0.08, 0.15), 1.0);

  // A decreasing curve does not extrapolate downwards.
  EXPECT_NEAR(pdForHorizon(60, 0.02, 0.20, 0.10), 0.10, 1e-12);
}

// -----------------------------------------------------------------------------
// 7. Financial analysis of the reference yellow booking.
// -----------------------------------------------------------------------------
TEST(ExposureCalculatorTest, AnalyzeExposureForYellowBooking) {
  const domain::RiskConstraints constraints;
  const auto analysis = analyzeExposure(testing_support::yellowBooking(),
                                        testing_support::yellowScores(),
                                        constraints);

  EXPECT_DOUBLE_EQ(analysis.total_exposure, 95000.0);
  EXPECT_NEAR(analysis.baseline_expected_loss, 9975.0, 1e-6);
  EXPECT_TRUE(analysis.exceeds_risk_appetite);
  EXPECT_NEAR(analysis.exceeds_by, 4975.0, 1e-6);
  EXPECT_DOUBLE_EQ(analysis.outstanding, 45000.0);
  EXPECT_DOUBLE_EQ(analysis.booking_amount, 50000.0);
  EXPECT_DOUBLE_EQ(analysis.pd_30d, 0.15);
  EXPECT_DOUBLE_EQ(analysis.lgd, 0.70);
  EXPECT_DOUBLE_EQ(analysis.max_expected_loss, 5000.0);
}

// -----------------------------------------------------------------------------
// 8. Within-budget exposure is not flagged.
// -----------------------------------------------------------------------------
TEST(ExposureCalculatorTest, AnalyzeExposureWithinBudget) {
  const domain::RiskConstraints constraints;
  const auto analysis = analyzeExposure(testing_support::greenBooking(),
                                        testing_support::greenScores(),
                                        constraints);

  EXPECT_DOUBLE_EQ(analysis.total_exposure, 50000.0);
  EXPECT_NEAR(analysis.baseline_expected_loss, 1050.0, 1e-6);
  EXPECT_FALSE(analysis.exceeds_risk_appetite);
  EXPECT_DOUBLE_EQ(analysis.exceeds_by, 0.0);
}
