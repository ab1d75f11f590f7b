#pragma once

#include "credit/domain/credit_option.hpp"
#include "credit/domain/financial_analysis.hpp"
#include "credit/domain/risk_scores.hpp"
#include "credit/domain/validation_result.hpp"

#include <optional>
#include <string>
#include <vector>

namespace credit {
namespace domain {

enum class Decision {
  Approved,
  Blocked,
  Negotiate,
};

const char* decisionToString(Decision decision);

// Customer-facing message produced by a Narrator.
struct CustomerMessage {
  std::string subject;
  std::string body;
  std::vector<std::string> call_to_action_labels;
};

// -----------------------------------------------------------------------------
// DecisionRecord: result of processing one booking request
// -----------------------------------------------------------------------------
//
// @brief  The full decision the orchestrator hands back to the caller.
//
// @details
// Which optional members are set depends on the path taken:
//
//   APPROVED (green)            approved_amount, settlement_days
//   BLOCKED  (red)              reason
//   BLOCKED  (yellow, no opts)  financial_analysis, reason
//   BLOCKED  (yellow, invalid)  financial_analysis, options, validation,
//                               reason
//   NEGOTIATE                   financial_analysis, options, validation,
//                               message
//
// scores_from_fallback is true when the Scorer failed and the configured
// conservative score set was used instead.
// -----------------------------------------------------------------------------
struct DecisionRecord {
  Decision decision{Decision::Blocked};
  RiskCategory risk_category{RiskCategory::Yellow};
  RiskScores scores;
  bool scores_from_fallback{false};

  std::optional<FinancialAnalysis> financial_analysis;
  std::optional<std::vector<CreditOption>> options;
  std::optional<ValidationResult> validation;
  std::optional<std::string> reason;
  std::optional<double> approved_amount;
  std::optional<int> settlement_days;
  std::optional<CustomerMessage> message;
};

}  // namespace domain
}  // namespace credit
