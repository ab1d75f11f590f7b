#pragma once

namespace credit {
namespace domain {

// -----------------------------------------------------------------------------
// RiskConstraints: the expected-loss budget
// -----------------------------------------------------------------------------
//
// @brief  Process-wide risk appetite. Every offer the engine makes must keep
//         its expected loss at or below max_expected_loss.
//
// @details
// Loaded once at startup as part of EngineConfig and passed by const
// reference into every component. There is no runtime mutation path.
//
//   max_expected_loss  currency, > 0
//   lgd                loss given default, in (0, 1]
// -----------------------------------------------------------------------------
struct RiskConstraints {
  double max_expected_loss{5000.0};
  double lgd{0.70};
};

// -----------------------------------------------------------------------------
// DecisionMatrix: Risk Gate thresholds
// -----------------------------------------------------------------------------
//
// @brief  Thresholds the Risk Gate compares intent and capacity scores
//         against.
//
// @details
//   intent >= block_intent_threshold                       → red
//   intent <  approve_intent_threshold
//     and capacity >= approve_capacity_threshold           → green
//   anything else                                          → yellow
//
// The yellow band is the gap between approve_intent_threshold and
// block_intent_threshold (plus low-capacity companies below the block
// line). EngineConfig validation requires approve <= block.
// -----------------------------------------------------------------------------
struct DecisionMatrix {
  double block_intent_threshold{0.60};
  double approve_intent_threshold{0.40};
  double approve_capacity_threshold{0.70};
};

}  // namespace domain
}  // namespace credit
