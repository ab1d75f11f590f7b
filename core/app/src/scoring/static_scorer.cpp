#include "credit/scoring/static_scorer.hpp"
#include "credit/domain/errors.hpp"

namespace credit {

StaticScorer::StaticScorer(const ScorerConfig& config) {
  for (const auto& [company_id, scores] : config.companies) {
    set(company_id, scores);
  }
}

void StaticScorer::set(const std::string& company_id,
                       const domain::RiskScores& scores) {
  table_[company_id] = scores;
}

domain::RiskScores StaticScorer::score(const std::string& company_id) const {
  auto it = table_.find(company_id);
  if (it == table_.end()) {
    throw CollaboratorError("StaticScorer: no scores for company " +
                            company_id);
  }
  return it->second;
}

}  // namespace credit
