#include "credit/terms/compliance_validator.hpp"
#include "credit/domain/currency_format.hpp"

#include <cmath>
#include <iostream>

namespace credit {

ComplianceValidator::ComplianceValidator(
    const domain::RiskConstraints& constraints)
    : constraints_(constraints) {}

domain::ValidationResult ComplianceValidator::validate(
    const std::vector<domain::CreditOption>& options) const {
  domain::ValidationResult result;
  result.options_count = options.size();

  for (const auto& option : options) {
    auto violations = check(option);
    for (auto& violation : violations) {
      result.violations.push_back(std::move(violation));
    }
  }

  result.compliant = result.violations.empty();
  if (!result.compliant) {
    std::cerr << "[ComplianceValidator] " << result.violations.size()
              << " violation(s) across " << options.size() << " option(s)\n";
  }
  return result;
}

// -----------------------------------------------------------------------------
// check: the four rules, in reporting order
// -----------------------------------------------------------------------------
std::vector<std::string> ComplianceValidator::check(
    const domain::CreditOption& option) const {
  std::vector<std::string> violations;
  const std::string prefix = "Option " + option.option_id + ": ";

  if (option.expected_loss > constraints_.max_expected_loss) {
    violations.push_back(prefix + "EL " +
                         formatCurrency(option.expected_loss, 2) +
                         " exceeds " +
                         formatCurrency(constraints_.max_expected_loss, 2));
  }

  if (option.upfront_amount > option.approved_amount) {
    violations.push_back(prefix + "Upfront " +
                         formatCurrency(option.upfront_amount, 0) +
                         " exceeds approved " +
                         formatCurrency(option.approved_amount, 0));
  }

  if (option.settlement_days < kMinSettlementDays ||
      option.settlement_days > kMaxSettlementDays) {
    violations.push_back(prefix + "Settlement days " +
                         std::to_string(option.settlement_days) +
                         " out of range [7, 90]");
  }

  const bool amounts_ok =
      std::isfinite(option.expected_loss) && option.expected_loss >= 0.0 &&
      std::isfinite(option.upfront_amount) && option.upfront_amount >= 0.0 &&
      std::isfinite(option.approved_amount) && option.approved_amount >= 0.0;
  if (!amounts_ok) {
    violations.push_back(prefix + "Amounts must be finite and non-negative");
  }

  return violations;
}

}  // namespace credit
