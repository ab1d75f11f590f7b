#pragma once

namespace credit {
namespace domain {

// -----------------------------------------------------------------------------
// RiskCategory
// -----------------------------------------------------------------------------
// Green auto-approves, Yellow negotiates, Red blocks.
// -----------------------------------------------------------------------------
enum class RiskCategory {
  Green,
  Yellow,
  Red,
};

const char* riskCategoryToString(RiskCategory category);

// -----------------------------------------------------------------------------
// RiskScores: output of the external Scorer for one company
// -----------------------------------------------------------------------------
//
// @brief  Fraud-likeness, credit quality and per-horizon default
//         probabilities for a single company.
//
// @details
//   intent_score    [0,1]  higher = more fraud-like
//   capacity_score  [0,1]  higher = better credit quality
//   pd_7d/14d/30d   [0,1]  default probability within the horizon
//
// The PD values are expected to be non-decreasing with horizon. The engine
// does not enforce that; callers and scorers are trusted on ordering, while
// the range of every value is checked by create().
//
// risk_category is whatever the Scorer reported. The Decision Orchestrator
// replaces it with the Risk Gate's own classification before acting on it.
// -----------------------------------------------------------------------------
struct RiskScores {
  double intent_score{0.0};
  double capacity_score{0.0};
  double pd_7d{0.0};
  double pd_14d{0.0};
  double pd_30d{0.0};
  RiskCategory risk_category{RiskCategory::Yellow};

  // -------------------------------------------------------------------------
  // create(...)
  // -------------------------------------------------------------------------
  // @brief  Validating factory. Every score must be finite and in [0,1].
  //
  // @throws InvalidInputError  naming the first out-of-range field.
  // -------------------------------------------------------------------------
  static RiskScores create(double intent_score, double capacity_score,
                           double pd_7d, double pd_14d, double pd_30d,
                           RiskCategory risk_category = RiskCategory::Yellow);
};

}  // namespace domain
}  // namespace credit
