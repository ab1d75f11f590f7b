#include "credit/terms/options_generator.hpp"
#include "credit/domain/currency_format.hpp"
#include "credit/risk/exposure_calculator.hpp"

#include <algorithm>
#include <iostream>

namespace credit {

namespace {

constexpr int kShortSettlementDays = 7;
constexpr int kPartialSettlementDays = 14;

constexpr double kShortFriction = 4.0;
constexpr double kUpfrontFriction = 7.0;
constexpr double kPartialBaseFriction = 8.0;

}  // namespace

OptionsInput OptionsInput::from(const domain::FinancialAnalysis& analysis,
                                const domain::RiskScores& scores) {
  OptionsInput input;
  input.total_exposure = analysis.total_exposure;
  input.outstanding = analysis.outstanding;
  input.booking_amount = analysis.booking_amount;
  input.pd_7d = scores.pd_7d;
  input.pd_14d = scores.pd_14d;
  input.pd_30d = scores.pd_30d;
  return input;
}

OptionsGenerator::OptionsGenerator(const domain::RiskConstraints& constraints,
                                   const TermsConfig& terms)
    : constraints_(constraints), terms_(terms) {}

// -----------------------------------------------------------------------------
// generate: try each construction, then sort by friction and relabel
// -----------------------------------------------------------------------------
std::vector<domain::CreditOption> OptionsGenerator::generate(
    const OptionsInput& input) const {
  const double lgd = constraints_.lgd;
  const double max_el = constraints_.max_expected_loss;
  std::vector<domain::CreditOption> options;

  // --- Shortened settlement ---------------------------------------------------
  {
    const double el =
        roundToCents(expectedLoss(input.pd_7d, input.total_exposure, lgd));
    if (el <= max_el) {
      domain::CreditOption option;
      option.kind = domain::OptionKind::ShortenedSettlement;
      option.settlement_days = kShortSettlementDays;
      option.upfront_amount = 0.0;
      option.approved_amount = input.booking_amount;
      option.expected_loss = el;
      option.friction_score = kShortFriction;
      option.description = "Settle within 7 days";
      options.push_back(std::move(option));
    }
  }

  // --- Upfront payment --------------------------------------------------------
  if (input.pd_30d * lgd > 0.0) {
    const double required =
        input.total_exposure - max_el / (input.pd_30d * lgd);

    if (required > 0.0 &&
        required < terms_.upfront_search_multiplier * input.booking_amount) {
      const double upfront =
          std::min(ceilToUnit(required), input.booking_amount);
      const double el = roundToCents(
          expectedLoss(input.pd_30d, input.total_exposure - upfront, lgd));

      if (el <= max_el) {
        domain::CreditOption option;
        option.kind = domain::OptionKind::UpfrontPayment;
        option.settlement_days = terms_.standard_settlement_days;
        option.upfront_amount = upfront;
        option.approved_amount = input.booking_amount;
        option.expected_loss = el;
        option.friction_score = kUpfrontFriction;
        option.description =
            "Pay " + formatCurrency(upfront, 0) + " upfront, " +
            formatCurrency(input.booking_amount - upfront, 0) + " in " +
            std::to_string(terms_.standard_settlement_days) + " days";
        options.push_back(std::move(option));
      } else {
        std::cerr << "[OptionsGenerator] Upfront " << upfront
                  << " cannot bring EL within budget (EL=" << el
                  << "). Dropping upfront option.\n";
      }
    }
  }

  // --- Partial approval: first fraction that fits wins ------------------------
  for (double fraction : terms_.partial_fractions) {
    const double approved = roundToUnit(input.booking_amount * fraction);
    if (approved <= 0.0) {
      continue;
    }
    const double el = roundToCents(
        expectedLoss(input.pd_14d, input.outstanding + approved, lgd));
    if (el > max_el) {
      continue;
    }

    domain::CreditOption option;
    option.kind = domain::OptionKind::PartialApproval;
    option.settlement_days = kPartialSettlementDays;
    option.upfront_amount = 0.0;
    option.approved_amount = approved;
    option.expected_loss = el;
    option.friction_score = kPartialBaseFriction + (1.0 - fraction) * 2.0;
    option.description = "Approve " + formatCurrency(approved, 0) +
                         " with 14-day settlement";
    options.push_back(std::move(option));
    break;
  }

  std::stable_sort(options.begin(), options.end(),
                   [](const domain::CreditOption& a,
                      const domain::CreditOption& b) {
                     return a.friction_score < b.friction_score;
                   });

  static const char* const kLabels[] = {"A", "B", "C"};
  for (std::size_t i = 0; i < options.size(); ++i) {
    options[i].option_id = kLabels[i];
  }

  std::cout << "[OptionsGenerator] " << options.size()
            << " option(s) within EL budget " << max_el << "\n";
  return options;
}

}  // namespace credit
