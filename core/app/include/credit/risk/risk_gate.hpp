#pragma once

#include "credit/domain/risk_config.hpp"
#include "credit/domain/risk_scores.hpp"

#include <string>
#include <vector>

namespace credit {

// -----------------------------------------------------------------------------
// RiskGate
// -----------------------------------------------------------------------------
//
// @brief  Classifies a company into green, yellow or red from its intent and
//         capacity scores.
//
// @details
// The gate is the first decision point for every booking. Its rule is total:
// every score pair maps to exactly one category, evaluated in this order:
//
//   1. intent >= block_intent_threshold                   → Red
//   2. intent <  approve_intent_threshold
//      and capacity >= approve_capacity_threshold         → Green
//   3. otherwise                                          → Yellow
//
// Boundary values follow the comparison operators above: intent exactly at
// the block threshold is red; intent exactly at the approve threshold is
// yellow; capacity exactly at the capacity threshold counts as sufficient.
//
// The PD scores and the scorer-reported category are ignored.
//
// Thread model:
//   Immutable after construction; categorize() and blockReasons() are const
//   and safe to call concurrently.
//
// Ownership:
//   Holds a copy of the DecisionMatrix.
// -----------------------------------------------------------------------------
class RiskGate {
 public:
  explicit RiskGate(const domain::DecisionMatrix& matrix);

  // -------------------------------------------------------------------------
  // categorize(scores)
  // -------------------------------------------------------------------------
  // @return The category for scores under the configured thresholds.
  // -------------------------------------------------------------------------
  domain::RiskCategory categorize(const domain::RiskScores& scores) const;

  // -------------------------------------------------------------------------
  // blockReasons(scores)
  // -------------------------------------------------------------------------
  //
  // @brief  Human-readable explanation for a red classification.
  //
  // @details
  // One entry per failing signal, in this order:
  //   "High intent score (0.85)"   when intent >= block threshold
  //   "Low capacity score (0.25)"  when capacity < approve capacity threshold
  //
  // Scores are printed with two decimals. Empty when the company is not
  // red. The orchestrator joins the entries with " | ".
  // -------------------------------------------------------------------------
  std::vector<std::string> blockReasons(const domain::RiskScores& scores) const;

  const domain::DecisionMatrix& matrix() const { return matrix_; }

 private:
  const domain::DecisionMatrix matrix_;
};

}  // namespace credit
