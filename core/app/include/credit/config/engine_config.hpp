#pragma once

#include "credit/domain/risk_config.hpp"
#include "credit/domain/risk_scores.hpp"

#include <nlohmann/json.hpp>

#include <string>
#include <utility>
#include <vector>

namespace credit {

// -----------------------------------------------------------------------------
// TermsConfig: tunables of the Options Generator
// -----------------------------------------------------------------------------
struct TermsConfig {
  /// Settlement window for green auto-approvals and the upfront-payment
  /// option.
  int standard_settlement_days{30};

  /// The upfront-payment option is only considered when the unclamped
  /// required upfront is below this multiple of the booking amount.
  double upfront_search_multiplier{1.2};

  /// Partial-approval fractions, tried in order; the first that clears the
  /// budget wins.
  std::vector<double> partial_fractions{0.5, 0.4, 0.3, 0.2};
};

// -----------------------------------------------------------------------------
// NegotiationConfig: tunables of the Negotiation Engine
// -----------------------------------------------------------------------------
struct NegotiationConfig {
  int fallback_settlement_days{10};
  double fallback_upfront_cap_fraction{0.5};

  /// Upper bound on one Narrator proposeCounter() call. On expiry the
  /// deterministic fallback is used for that round.
  int narrator_timeout_ms{2000};

  /// Threads in the pool that runs Narrator calls.
  int narrator_workers{4};

  /// Narrator calls allowed to wait or run at once. A call beyond this
  /// falls back immediately instead of queueing.
  int narrator_queue_limit{16};
};

// -----------------------------------------------------------------------------
// NarratorConfig
// -----------------------------------------------------------------------------
// endpoint empty → TemplateNarrator only (no external narration service).
// -----------------------------------------------------------------------------
struct NarratorConfig {
  std::string endpoint;
};

// -----------------------------------------------------------------------------
// ScorerConfig
// -----------------------------------------------------------------------------
// fallback_scores is the conservative score set used whenever the Scorer
// fails. companies seeds the StaticScorer table (company_id → scores).
// -----------------------------------------------------------------------------
struct ScorerConfig {
  domain::RiskScores fallback_scores{0.32, 0.55, 0.02, 0.08, 0.15,
                                     domain::RiskCategory::Yellow};
  std::vector<std::pair<std::string, domain::RiskScores>> companies;
};

// -----------------------------------------------------------------------------
// EngineConfig: everything the engine reads at startup
// -----------------------------------------------------------------------------
//
// @brief  Explicit configuration object constructed once at process start
//         and passed by const reference into every component.
//
// @details
// There is no global config and no reload path. Defaults reproduce the
// production risk appetite (EL budget 5,000 at LGD 0.70) and the decision
// matrix {block 0.60, approve-intent 0.40, approve-capacity 0.70}.
//
// JSON layout (all sections optional; missing keys keep their defaults):
//
//   {
//     "risk_constraints": {"max_expected_loss": 5000, "lgd": 0.7},
//     "decision_matrix":  {"block_intent_threshold": 0.6,
//                          "approve_intent_threshold": 0.4,
//                          "approve_capacity_threshold": 0.7},
//     "terms":            {"standard_settlement_days": 30,
//                          "upfront_search_multiplier": 1.2,
//                          "partial_fractions": [0.5, 0.4, 0.3, 0.2]},
//     "negotiation":      {"fallback_settlement_days": 10,
//                          "fallback_upfront_cap_fraction": 0.5,
//                          "narrator_timeout_ms": 2000,
//                          "narrator_workers": 4,
//                          "narrator_queue_limit": 16},
//     "narrator":         {"endpoint": "tcp://127.0.0.1:5560"},
//     "scorer":           {"fallback_scores": {...},
//                          "companies": [{"company_id": "...", ...}]}
//   }
//
// Thread model:
//   Immutable after loading; safe to read from any thread.
// -----------------------------------------------------------------------------
struct EngineConfig {
  domain::RiskConstraints risk_constraints;
  domain::DecisionMatrix decision_matrix;
  TermsConfig terms;
  NegotiationConfig negotiation;
  NarratorConfig narrator;
  ScorerConfig scorer;

  // -------------------------------------------------------------------------
  // validate()
  // -------------------------------------------------------------------------
  // @brief  Range-checks every field.
  //
  // @throws ConfigError naming the offending key.
  // -------------------------------------------------------------------------
  void validate() const;
};

// -----------------------------------------------------------------------------
// parseConfig(json)
// -----------------------------------------------------------------------------
// @brief  Builds a validated EngineConfig from a parsed JSON document.
//
// @throws ConfigError on wrong types, out-of-range values or invalid score
//         entries. nlohmann::json exceptions never escape.
// -----------------------------------------------------------------------------
EngineConfig parseConfig(const nlohmann::json& json);

// -----------------------------------------------------------------------------
// loadConfigFile(path)
// -----------------------------------------------------------------------------
// @brief  Reads and parses a JSON configuration file.
//
// @throws ConfigError if the file cannot be opened or is not valid JSON.
// -----------------------------------------------------------------------------
EngineConfig loadConfigFile(const std::string& path);

}  // namespace credit
