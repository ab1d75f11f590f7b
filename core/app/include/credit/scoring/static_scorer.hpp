#pragma once

#include "credit/config/engine_config.hpp"
#include "credit/scoring/i_scorer.hpp"

#include <string>
#include <unordered_map>

namespace credit {

// -----------------------------------------------------------------------------
// StaticScorer
// -----------------------------------------------------------------------------
//
// @brief  IScorer backed by a fixed table of precomputed scores.
//
// @details
// Seeded from ScorerConfig::companies (usually the "scorer" section of the
// engine config file) or built empty and filled with set(). Stands in for a
// model-serving endpoint in demos and tests, and serves batch-scored
// portfolios in production.
//
// Unknown company ids throw CollaboratorError; the orchestrator then falls
// back to conservative scores.
//
// Thread model:
//   The table is only written through set(), which must complete before
//   score() is called concurrently. score() itself is const and lock-free.
// -----------------------------------------------------------------------------
class StaticScorer final : public IScorer {
 public:
  StaticScorer() = default;
  explicit StaticScorer(const ScorerConfig& config);

  // Adds or replaces the scores for company_id.
  void set(const std::string& company_id, const domain::RiskScores& scores);

  domain::RiskScores score(const std::string& company_id) const override;

  std::size_t size() const { return table_.size(); }

 private:
  std::unordered_map<std::string, domain::RiskScores> table_;
};

}  // namespace credit
