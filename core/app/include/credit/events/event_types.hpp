#pragma once

#include "credit/domain/decision_record.hpp"
#include "credit/domain/risk_scores.hpp"

#include <cstddef>
#include <cstdint>
#include <string>

namespace credit {

// -----------------------------------------------------------------------------
// DecisionEvent
// -----------------------------------------------------------------------------
//
// @brief  Published by DecisionOrchestrator once per processed booking,
//         whatever the outcome.
//
// @details
// Carries a summary rather than the full DecisionRecord so subscribers such
// as audit loggers do not copy option lists they never read. reason is
// empty for APPROVED and NEGOTIATE outcomes.
//
// Thread model:
//   Published synchronously on the thread that called processBooking().
//   Plain data; safe to copy between threads.
// -----------------------------------------------------------------------------
struct DecisionEvent {
  std::string company_id;
  domain::Decision decision{domain::Decision::Blocked};
  domain::RiskCategory risk_category{domain::RiskCategory::Yellow};
  bool scores_from_fallback{false};
  std::size_t options_count{0};
  std::string reason;
  std::int64_t timestamp_ms{0};
};

}  // namespace credit
