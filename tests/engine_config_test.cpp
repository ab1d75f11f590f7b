// =============================================================================
// engine_config_test.cpp
// =============================================================================
// Unit tests for EngineConfig parsing, validation and file loading.
//
// Validates:
//   - Defaults are valid and match the documented policy values
//   - Present keys override defaults; absent sections keep them
//   - Wrong types, out-of-range values and inconsistent thresholds raise
//     ConfigError
//   - The scorer company table and fallback scores are parsed and checked
//   - loadConfigFile() on the shipped sample, a missing file and bad JSON
//
// Threading model: single-threaded.
// =============================================================================

#include "credit/config/engine_config.hpp"
#include "credit/domain/errors.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <cstdio>
#include <fstream>
#include <string>

using credit::ConfigError;
using credit::EngineConfig;
using nlohmann::json;

namespace {

std::string writeTempFile(const std::string& name, const std::string& text) {
  const std::string path = ::testing::TempDir() + name;
  std::ofstream out(path);
  out << text;
  return path;
}

}  // namespace

// -----------------------------------------------------------------------------
// 1. Defaults.
// -----------------------------------------------------------------------------
TEST(EngineConfigTest, DefaultsAreValid) {
  const EngineConfig config;
  EXPECT_NO_THROW(config.validate());

  EXPECT_DOUBLE_EQ(config.risk_constraints.max_expected_loss, 5000.0);
  EXPECT_DOUBLE_EQ(config.risk_constraints.lgd, 0.70);
  EXPECT_DOUBLE_EQ(config.decision_matrix.block_intent_threshold, 0.60);
  EXPECT_DOUBLE_EQ(config.decision_matrix.approve_intent_threshold, 0.40);
  EXPECT_DOUBLE_EQ(config.decision_matrix.approve_capacity_threshold, 0.70);
  EXPECT_EQ(config.terms.standard_settlement_days, 30);
  EXPECT_EQ(config.terms.partial_fractions.size(), 4u);
  EXPECT_EQ(config.negotiation.fallback_settlement_days, 10);
  EXPECT_TRUE(config.narrator.endpoint.empty());
  EXPECT_DOUBLE_EQ(config.scorer.fallback_scores.intent_score, 0.32);
  EXPECT_TRUE(config.scorer.companies.empty());
}

// -----------------------------------------------------------------------------
// 2. An empty document yields the defaults.
// -----------------------------------------------------------------------------
TEST(EngineConfigTest, EmptyDocumentKeepsDefaults) {
  const auto config = credit::parseConfig(json::object());
  EXPECT_DOUBLE_EQ(config.risk_constraints.max_expected_loss, 5000.0);
  EXPECT_EQ(config.negotiation.narrator_workers, 4);
  EXPECT_EQ(config.negotiation.narrator_queue_limit, 16);
}

// -----------------------------------------------------------------------------
// 3. Present keys override, absent keys in the same section do not.
// -----------------------------------------------------------------------------
TEST(EngineConfigTest, OverridesApplied) {
  const json doc = {
      {"risk_constraints", {{"max_expected_loss", 8000.0}}},
      {"terms", {{"partial_fractions", {0.6, 0.3}}}},
      {"negotiation", {{"narrator_timeout_ms", 750}}},
      {"narrator", {{"endpoint", "tcp://127.0.0.1:5599"}}},
  };
  const auto config = credit::parseConfig(doc);

  EXPECT_DOUBLE_EQ(config.risk_constraints.max_expected_loss, 8000.0);
  EXPECT_DOUBLE_EQ(config.risk_constraints.lgd, 0.70);
  ASSERT_EQ(config.terms.partial_fractions.size(), 2u);
  EXPECT_DOUBLE_EQ(config.terms.partial_fractions[0], 0.6);
  EXPECT_EQ(config.terms.standard_settlement_days, 30);
  EXPECT_EQ(config.negotiation.narrator_timeout_ms, 750);
  EXPECT_EQ(config.narrator.endpoint, "tcp://127.0.0.1:5599");
}

// -----------------------------------------------------------------------------
// 4. Wrong JSON types are config errors, not nlohmann exceptions.
// -----------------------------------------------------------------------------
TEST(EngineConfigTest, WrongTypeRaisesConfigError) {
  const json doc = {{"risk_constraints", {{"lgd", "seventy percent"}}}};
  EXPECT_THROW(credit::parseConfig(doc), ConfigError);

  EXPECT_THROW(
      credit::parseConfig({{"negotiation", {{"narrator_timeout_ms", 750.5}}}}),
      ConfigError);
  EXPECT_THROW(
      credit::parseConfig({{"terms", {{"standard_settlement_days", 1e20}}}}),
      ConfigError);
}

// -----------------------------------------------------------------------------
// 5. Out-of-range values.
// -----------------------------------------------------------------------------
TEST(EngineConfigTest, OutOfRangeValuesRejected) {
  EXPECT_THROW(credit::parseConfig({{"risk_constraints", {{"lgd", 1.5}}}}),
               ConfigError);
  EXPECT_THROW(credit::parseConfig({{"risk_constraints", {{"lgd", 0.0}}}}),
               ConfigError);
  EXPECT_THROW(
      credit::parseConfig({{"risk_constraints", {{"max_expected_loss", -1.0}}}}),
      ConfigError);
  EXPECT_THROW(
      credit::parseConfig({{"terms", {{"standard_settlement_days", 120}}}}),
      ConfigError);
  EXPECT_THROW(
      credit::parseConfig({{"terms", {{"partial_fractions", json::array()}}}}),
      ConfigError);
  EXPECT_THROW(credit::parseConfig({{"terms", {{"partial_fractions", {1.2}}}}}),
               ConfigError);
  EXPECT_THROW(
      credit::parseConfig({{"negotiation", {{"narrator_timeout_ms", 0}}}}),
      ConfigError);
  EXPECT_THROW(
      credit::parseConfig({{"negotiation", {{"narrator_workers", 0}}}}),
      ConfigError);
  EXPECT_THROW(credit::parseConfig({{"negotiation",
                                     {{"narrator_workers", 8},
                                      {"narrator_queue_limit", 4}}}}),
               ConfigError);
}

// -----------------------------------------------------------------------------
// 6. The approve band must sit below the block band.
// -----------------------------------------------------------------------------
TEST(EngineConfigTest, InconsistentThresholdsRejected) {
  EngineConfig config;
  config.decision_matrix.approve_intent_threshold = 0.7;
  config.decision_matrix.block_intent_threshold = 0.6;
  EXPECT_THROW(config.validate(), ConfigError);
}

// -----------------------------------------------------------------------------
// 7. Scorer table and fallback scores.
// -----------------------------------------------------------------------------
TEST(EngineConfigTest, ScorerSectionParsed) {
  const json doc = {
      {"scorer",
       {{"fallback_scores",
         {{"intent_score", 0.45},
          {"capacity_score", 0.5},
          {"pd_7d", 0.03},
          {"pd_14d", 0.09},
          {"pd_30d", 0.2}}},
        {"companies",
         {{{"company_id", "IN-TRV-000123"},
           {"intent_score", 0.15},
           {"capacity_score", 0.85},
           {"pd_7d", 0.005},
           {"pd_14d", 0.01},
           {"pd_30d", 0.03},
           {"risk_category", "green"}}}}}},
  };
  const auto config = credit::parseConfig(doc);

  EXPECT_DOUBLE_EQ(config.scorer.fallback_scores.intent_score, 0.45);
  EXPECT_EQ(config.scorer.fallback_scores.risk_category,
            credit::domain::RiskCategory::Yellow);
  ASSERT_EQ(config.scorer.companies.size(), 1u);
  EXPECT_EQ(config.scorer.companies[0].first, "IN-TRV-000123");
  EXPECT_EQ(config.scorer.companies[0].second.risk_category,
            credit::domain::RiskCategory::Green);
}

// -----------------------------------------------------------------------------
// 8. Invalid scorer entries.
// -----------------------------------------------------------------------------
TEST(EngineConfigTest, InvalidScorerEntriesRejected) {
  EXPECT_THROW(credit::parseConfig({{"scorer", {{"companies", "none"}}}}),
               ConfigError);

  const json out_of_range = {
      {"scorer",
       {{"companies",
         {{{"company_id", "X"},
           {"intent_score", 2.0},
           {"capacity_score", 0.5},
           {"pd_7d", 0.1},
           {"pd_14d", 0.1},
           {"pd_30d", 0.1}}}}}},
  };
  EXPECT_THROW(credit::parseConfig(out_of_range), ConfigError);

  const json bad_category = {
      {"scorer",
       {{"fallback_scores",
         {{"intent_score", 0.3},
          {"capacity_score", 0.5},
          {"pd_7d", 0.1},
          {"pd_14d", 0.1},
          {"pd_30d", 0.1},
          {"risk_category", "purple"}}}}},
  };
  EXPECT_THROW(credit::parseConfig(bad_category), ConfigError);
}

// -----------------------------------------------------------------------------
// 9. The shipped sample config loads.
// -----------------------------------------------------------------------------
TEST(EngineConfigTest, SampleConfigLoads) {
  const auto config = credit::loadConfigFile(CREDIT_SAMPLE_CONFIG);
  EXPECT_DOUBLE_EQ(config.risk_constraints.max_expected_loss, 5000.0);
  EXPECT_EQ(config.scorer.companies.size(), 4u);
}

// -----------------------------------------------------------------------------
// 10. File errors.
// -----------------------------------------------------------------------------
TEST(EngineConfigTest, FileErrors) {
  EXPECT_THROW(credit::loadConfigFile("/nonexistent/credit_engine.json"),
               ConfigError);

  const auto bad = writeTempFile("credit_bad_config.json", "{ not json");
  EXPECT_THROW(credit::loadConfigFile(bad), ConfigError);
  std::remove(bad.c_str());

  const auto good = writeTempFile("credit_good_config.json",
                                  R"({"risk_constraints": {"lgd": 0.5}})");
  const auto config = credit::loadConfigFile(good);
  EXPECT_DOUBLE_EQ(config.risk_constraints.lgd, 0.5);
  std::remove(good.c_str());
}
