#include "credit/domain/risk_scores.hpp"
#include "credit/domain/errors.hpp"

#include <cmath>
#include <string>

namespace credit {
namespace domain {

namespace {

void requireUnitInterval(const char* field, double value) {
  if (!std::isfinite(value) || value < 0.0 || value > 1.0) {
    throw InvalidInputError(std::string("risk scores: ") + field +
                            " must lie in [0, 1], got " +
                            std::to_string(value));
  }
}

}  // namespace

// -----------------------------------------------------------------------------
// riskCategoryToString()
// -----------------------------------------------------------------------------
const char* riskCategoryToString(RiskCategory category) {
  switch (category) {
    case RiskCategory::Green:  return "green";
    case RiskCategory::Yellow: return "yellow";
    case RiskCategory::Red:    return "red";
  }
  return "unknown";
}

// -----------------------------------------------------------------------------
// create(): range-check every score
// -----------------------------------------------------------------------------
RiskScores RiskScores::create(double intent_score, double capacity_score,
                              double pd_7d, double pd_14d, double pd_30d,
                              RiskCategory risk_category) {
  requireUnitInterval("intent_score", intent_score);
  requireUnitInterval("capacity_score", capacity_score);
  requireUnitInterval("pd_7d", pd_7d);
  requireUnitInterval("pd_14d", pd_14d);
  requireUnitInterval("pd_30d", pd_30d);

  RiskScores scores;
  scores.intent_score = intent_score;
  scores.capacity_score = capacity_score;
  scores.pd_7d = pd_7d;
  scores.pd_14d = pd_14d;
  scores.pd_30d = pd_30d;
  scores.risk_category = risk_category;
  return scores;
}

}  // namespace domain
}  // namespace credit
