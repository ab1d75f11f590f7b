#include "credit/config/engine_config.hpp"
#include "credit/domain/errors.hpp"
#include "credit/serialization/json_codec.hpp"

#include <cmath>
#include <cstdint>
#include <fstream>
#include <iostream>
#include <limits>
#include <type_traits>

namespace credit {

namespace {

void requireRange(const char* key, double value, double lo, double hi) {
  if (!std::isfinite(value) || value < lo || value > hi) {
    throw ConfigError(std::string("config: ") + key + " out of range [" +
                      std::to_string(lo) + ", " + std::to_string(hi) +
                      "], got " + std::to_string(value));
  }
}

// Overwrites target with json[key] if the key is present. Integer settings
// must be written as whole numbers that fit an int.
template <typename T>
void readOptional(const nlohmann::json& section, const char* key, T& target) {
  auto it = section.find(key);
  if (it == section.end()) {
    return;
  }
  if constexpr (std::is_same_v<T, int>) {
    if (!it->is_number_integer() ||
        (it->is_number_unsigned() &&
         it->template get<std::uint64_t>() >
             static_cast<std::uint64_t>(std::numeric_limits<int>::max())) ||
        (!it->is_number_unsigned() &&
         (it->template get<std::int64_t>() > std::numeric_limits<int>::max() ||
          it->template get<std::int64_t>() < std::numeric_limits<int>::min()))) {
      throw ConfigError(std::string("config: ") + key +
                        " must be an integer in int range");
    }
  }
  target = it->template get<T>();
}

}  // namespace

// -----------------------------------------------------------------------------
// validate(): reject configs the engine cannot run on
// -----------------------------------------------------------------------------
void EngineConfig::validate() const {
  if (!std::isfinite(risk_constraints.max_expected_loss) ||
      risk_constraints.max_expected_loss <= 0.0) {
    throw ConfigError("config: risk_constraints.max_expected_loss must be > 0");
  }
  if (!std::isfinite(risk_constraints.lgd) || risk_constraints.lgd <= 0.0 ||
      risk_constraints.lgd > 1.0) {
    throw ConfigError("config: risk_constraints.lgd must lie in (0, 1]");
  }

  requireRange("decision_matrix.block_intent_threshold",
               decision_matrix.block_intent_threshold, 0.0, 1.0);
  requireRange("decision_matrix.approve_intent_threshold",
               decision_matrix.approve_intent_threshold, 0.0, 1.0);
  requireRange("decision_matrix.approve_capacity_threshold",
               decision_matrix.approve_capacity_threshold, 0.0, 1.0);
  if (decision_matrix.approve_intent_threshold >
      decision_matrix.block_intent_threshold) {
    throw ConfigError(
        "config: decision_matrix.approve_intent_threshold must not exceed "
        "block_intent_threshold");
  }

  if (terms.standard_settlement_days < 7 ||
      terms.standard_settlement_days > 90) {
    throw ConfigError("config: terms.standard_settlement_days must lie in "
                      "[7, 90]");
  }
  if (!std::isfinite(terms.upfront_search_multiplier) ||
      terms.upfront_search_multiplier <= 0.0) {
    throw ConfigError("config: terms.upfront_search_multiplier must be > 0");
  }
  if (terms.partial_fractions.empty()) {
    throw ConfigError("config: terms.partial_fractions must not be empty");
  }
  for (double fraction : terms.partial_fractions) {
    if (!std::isfinite(fraction) || fraction <= 0.0 || fraction >= 1.0) {
      throw ConfigError("config: terms.partial_fractions entries must lie "
                        "in (0, 1)");
    }
  }

  if (negotiation.fallback_settlement_days < 7 ||
      negotiation.fallback_settlement_days > 90) {
    throw ConfigError("config: negotiation.fallback_settlement_days must lie "
                      "in [7, 90]");
  }
  requireRange("negotiation.fallback_upfront_cap_fraction",
               negotiation.fallback_upfront_cap_fraction, 0.0, 1.0);
  if (negotiation.narrator_timeout_ms <= 0) {
    throw ConfigError("config: negotiation.narrator_timeout_ms must be > 0");
  }
  if (negotiation.narrator_workers <= 0) {
    throw ConfigError("config: negotiation.narrator_workers must be > 0");
  }
  if (negotiation.narrator_queue_limit < negotiation.narrator_workers) {
    throw ConfigError(
        "config: negotiation.narrator_queue_limit must be >= narrator_workers");
  }
}

// -----------------------------------------------------------------------------
// parseConfig(): JSON document → validated EngineConfig
// -----------------------------------------------------------------------------
EngineConfig parseConfig(const nlohmann::json& json) {
  EngineConfig config;

  try {
    if (auto it = json.find("risk_constraints"); it != json.end()) {
      readOptional(*it, "max_expected_loss",
                   config.risk_constraints.max_expected_loss);
      readOptional(*it, "lgd", config.risk_constraints.lgd);
    }

    if (auto it = json.find("decision_matrix"); it != json.end()) {
      readOptional(*it, "block_intent_threshold",
                   config.decision_matrix.block_intent_threshold);
      readOptional(*it, "approve_intent_threshold",
                   config.decision_matrix.approve_intent_threshold);
      readOptional(*it, "approve_capacity_threshold",
                   config.decision_matrix.approve_capacity_threshold);
    }

    if (auto it = json.find("terms"); it != json.end()) {
      readOptional(*it, "standard_settlement_days",
                   config.terms.standard_settlement_days);
      readOptional(*it, "upfront_search_multiplier",
                   config.terms.upfront_search_multiplier);
      readOptional(*it, "partial_fractions", config.terms.partial_fractions);
    }

    if (auto it = json.find("negotiation"); it != json.end()) {
      readOptional(*it, "fallback_settlement_days",
                   config.negotiation.fallback_settlement_days);
      readOptional(*it, "fallback_upfront_cap_fraction",
                   config.negotiation.fallback_upfront_cap_fraction);
      readOptional(*it, "narrator_timeout_ms",
                   config.negotiation.narrator_timeout_ms);
      readOptional(*it, "narrator_workers",
                   config.negotiation.narrator_workers);
      readOptional(*it, "narrator_queue_limit",
                   config.negotiation.narrator_queue_limit);
    }

    if (auto it = json.find("narrator"); it != json.end()) {
      readOptional(*it, "endpoint", config.narrator.endpoint);
    }

    if (auto it = json.find("scorer"); it != json.end()) {
      if (auto fb = it->find("fallback_scores"); fb != it->end()) {
        config.scorer.fallback_scores = riskScoresFromJson(*fb);
      }
      if (auto companies = it->find("companies"); companies != it->end()) {
        if (!companies->is_array()) {
          throw ConfigError("config: scorer.companies must be an array");
        }
        for (const auto& entry : *companies) {
          config.scorer.companies.emplace_back(
              entry.at("company_id").get<std::string>(),
              riskScoresFromJson(entry));
        }
      }
    }
  } catch (const nlohmann::json::exception& e) {
    throw ConfigError(std::string("config: ") + e.what());
  } catch (const InvalidInputError& e) {
    throw ConfigError(std::string("config: ") + e.what());
  }

  config.validate();
  return config;
}

// -----------------------------------------------------------------------------
// loadConfigFile(): read file, parse, validate
// -----------------------------------------------------------------------------
EngineConfig loadConfigFile(const std::string& path) {
  std::ifstream in(path);
  if (!in) {
    throw ConfigError("config: cannot open " + path);
  }

  nlohmann::json json;
  try {
    json = nlohmann::json::parse(in);
  } catch (const nlohmann::json::parse_error& e) {
    throw ConfigError("config: " + path + " is not valid JSON: " + e.what());
  }

  EngineConfig config = parseConfig(json);
  std::cout << "[EngineConfig] loaded " << path
            << " (max_expected_loss=" << config.risk_constraints.max_expected_loss
            << ", lgd=" << config.risk_constraints.lgd << ", "
            << config.scorer.companies.size() << " scored companies)\n";
  return config;
}

}  // namespace credit
