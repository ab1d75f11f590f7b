#pragma once

#include "credit/domain/risk_scores.hpp"

#include <string>

namespace credit {

// -----------------------------------------------------------------------------
// IScorer: source of per-company risk scores
// -----------------------------------------------------------------------------
//
// @brief  Abstracts the model service that produces RiskScores.
//
// @details
// The engine never trains or runs models; it only consumes their output.
// Implementations may block (network, disk) and may throw. The
// orchestrator treats any exception, and any out-of-range value, as a
// scorer failure and substitutes the configured fallback score set.
//
// Thread-safety contract:
//   score() may be called concurrently from multiple request threads.
// -----------------------------------------------------------------------------
class IScorer {
 public:
  virtual ~IScorer() = default;

  // @throws CollaboratorError (or any std::exception) on failure.
  virtual domain::RiskScores score(const std::string& company_id) const = 0;
};

}  // namespace credit
