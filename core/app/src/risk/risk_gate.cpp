#include "credit/risk/risk_gate.hpp"

#include <iomanip>
#include <sstream>

namespace credit {

namespace {

std::string twoDecimals(double value) {
  std::ostringstream out;
  out << std::fixed << std::setprecision(2) << value;
  return out.str();
}

}  // namespace

RiskGate::RiskGate(const domain::DecisionMatrix& matrix) : matrix_(matrix) {}

// -----------------------------------------------------------------------------
// categorize: block check first, then approve, yellow is the remainder
// -----------------------------------------------------------------------------
domain::RiskCategory RiskGate::categorize(
    const domain::RiskScores& scores) const {
  if (scores.intent_score >= matrix_.block_intent_threshold) {
    return domain::RiskCategory::Red;
  }
  if (scores.intent_score < matrix_.approve_intent_threshold &&
      scores.capacity_score >= matrix_.approve_capacity_threshold) {
    return domain::RiskCategory::Green;
  }
  return domain::RiskCategory::Yellow;
}

std::vector<std::string> RiskGate::blockReasons(
    const domain::RiskScores& scores) const {
  std::vector<std::string> reasons;
  if (scores.intent_score < matrix_.block_intent_threshold) {
    return reasons;
  }

  reasons.push_back("High intent score (" + twoDecimals(scores.intent_score) + ")");
  if (scores.capacity_score < matrix_.approve_capacity_threshold) {
    reasons.push_back("Low capacity score (" +
                      twoDecimals(scores.capacity_score) + ")");
  }
  return reasons;
}

}  // namespace credit
