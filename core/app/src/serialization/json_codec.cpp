#include "credit/serialization/json_codec.hpp"
#include "credit/domain/errors.hpp"
#include "credit/risk/exposure_calculator.hpp"

#include <cstdint>
#include <limits>

namespace credit {

namespace {

// Whole JSON integers only; 10.9 or 1e20 are rejected rather than cast.
int readInt(const nlohmann::json& json, const char* key) {
  const auto& value = json.at(key);
  if (!value.is_number_integer()) {
    throw InvalidInputError(std::string(key) + " must be an integer");
  }
  constexpr auto kMax = std::numeric_limits<int>::max();
  constexpr auto kMin = std::numeric_limits<int>::min();
  if (value.is_number_unsigned()) {
    if (value.get<std::uint64_t>() > static_cast<std::uint64_t>(kMax)) {
      throw InvalidInputError(std::string(key) + " out of range");
    }
  } else {
    const auto wide = value.get<std::int64_t>();
    if (wide > kMax || wide < kMin) {
      throw InvalidInputError(std::string(key) + " out of range");
    }
  }
  return value.get<int>();
}

}  // namespace

nlohmann::json toJson(const domain::BookingRequest& booking) {
  return nlohmann::json{
      {"company_id", booking.company_id},
      {"company_name", booking.company_name},
      {"booking_amount", booking.booking_amount},
      {"current_outstanding", booking.current_outstanding},
      {"credit_limit", booking.credit_limit},
      {"route", booking.route},
      {"booking_date", booking.booking_date},
  };
}

nlohmann::json toJson(const domain::RiskScores& scores) {
  return nlohmann::json{
      {"intent_score", scores.intent_score},
      {"capacity_score", scores.capacity_score},
      {"pd_7d", scores.pd_7d},
      {"pd_14d", scores.pd_14d},
      {"pd_30d", scores.pd_30d},
      {"risk_category", domain::riskCategoryToString(scores.risk_category)},
  };
}

nlohmann::json toJson(const domain::FinancialAnalysis& analysis) {
  return nlohmann::json{
      {"total_exposure", roundToCents(analysis.total_exposure)},
      {"baseline_expected_loss", roundToCents(analysis.baseline_expected_loss)},
      {"exceeds_risk_appetite", analysis.exceeds_risk_appetite},
      {"exceeds_by", roundToCents(analysis.exceeds_by)},
      {"calculation",
       {{"outstanding", analysis.outstanding},
        {"booking_amount", analysis.booking_amount},
        {"pd_30d", analysis.pd_30d},
        {"lgd", analysis.lgd},
        {"max_expected_loss", analysis.max_expected_loss}}},
  };
}

nlohmann::json toJson(const domain::CreditOption& option) {
  return nlohmann::json{
      {"option_id", option.option_id},
      {"type", domain::optionKindToString(option.kind)},
      {"settlement_days", option.settlement_days},
      {"upfront_amount", option.upfront_amount},
      {"approved_amount", option.approved_amount},
      {"expected_loss", roundToCents(option.expected_loss)},
      {"friction_score", option.friction_score},
      {"description", option.description},
  };
}

nlohmann::json toJson(const domain::ValidationResult& validation) {
  return nlohmann::json{
      {"compliant", validation.compliant},
      {"violations", validation.violations},
      {"options_count", validation.options_count},
  };
}

nlohmann::json toJson(const domain::CustomerMessage& message) {
  return nlohmann::json{
      {"subject", message.subject},
      {"body", message.body},
      {"call_to_action_labels", message.call_to_action_labels},
  };
}

// -----------------------------------------------------------------------------
// DecisionRecord: optional members are omitted when empty
// -----------------------------------------------------------------------------
nlohmann::json toJson(const domain::DecisionRecord& record) {
  nlohmann::json json{
      {"decision", domain::decisionToString(record.decision)},
      {"risk_category", domain::riskCategoryToString(record.risk_category)},
      {"scores", toJson(record.scores)},
      {"scores_from_fallback", record.scores_from_fallback},
  };

  if (record.financial_analysis) {
    json["financial_analysis"] = toJson(*record.financial_analysis);
  }
  if (record.options) {
    auto options = nlohmann::json::array();
    for (const auto& option : *record.options) {
      options.push_back(toJson(option));
    }
    json["options"] = std::move(options);
  }
  if (record.validation) {
    json["validation"] = toJson(*record.validation);
  }
  if (record.reason) {
    json["reason"] = *record.reason;
  }
  if (record.approved_amount) {
    json["approved_amount"] = *record.approved_amount;
  }
  if (record.settlement_days) {
    json["settlement_days"] = *record.settlement_days;
  }
  if (record.message) {
    json["message"] = toJson(*record.message);
  }
  return json;
}

nlohmann::json toJson(const domain::CounterOffer& offer) {
  return nlohmann::json{
      {"upfront", offer.upfront},
      {"settlement_days", offer.settlement_days},
      {"approved_amount", offer.approved_amount},
  };
}

nlohmann::json toJson(const domain::NegotiationResult& result) {
  nlohmann::json json{
      {"response_text", result.response_text},
      {"escalate", result.escalate},
      {"round_number", result.round_number},
      {"state", domain::negotiationStateToString(result.state)},
      {"source", domain::offerSourceToString(result.source)},
  };
  json["offer"] = result.offer ? toJson(*result.offer) : nlohmann::json(nullptr);
  json["expected_loss"] = result.expected_loss
                              ? nlohmann::json(roundToCents(*result.expected_loss))
                              : nlohmann::json(nullptr);
  return json;
}

domain::RiskCategory riskCategoryFromString(const std::string& text) {
  if (text == "green") return domain::RiskCategory::Green;
  if (text == "yellow") return domain::RiskCategory::Yellow;
  if (text == "red") return domain::RiskCategory::Red;
  throw InvalidInputError("unknown risk_category: " + text);
}

domain::BookingRequest bookingRequestFromJson(const nlohmann::json& json) {
  try {
    return domain::BookingRequest::create(
        json.at("company_id").get<std::string>(),
        json.value("company_name", std::string{}),
        json.at("booking_amount").get<double>(),
        json.at("current_outstanding").get<double>(),
        json.at("credit_limit").get<double>(),
        json.value("route", std::string{}),
        json.value("booking_date", std::string{}));
  } catch (const nlohmann::json::exception& e) {
    throw InvalidInputError(std::string("booking request: ") + e.what());
  }
}

domain::RiskScores riskScoresFromJson(const nlohmann::json& json) {
  try {
    const auto category =
        riskCategoryFromString(json.value("risk_category", std::string{"yellow"}));
    return domain::RiskScores::create(
        json.at("intent_score").get<double>(),
        json.at("capacity_score").get<double>(),
        json.at("pd_7d").get<double>(),
        json.at("pd_14d").get<double>(),
        json.at("pd_30d").get<double>(),
        category);
  } catch (const nlohmann::json::exception& e) {
    throw InvalidInputError(std::string("risk scores: ") + e.what());
  }
}

domain::CounterOffer counterOfferFromJson(const nlohmann::json& json) {
  try {
    domain::CounterOffer offer;
    offer.upfront = json.at("upfront").get<double>();
    offer.settlement_days = readInt(json, "settlement_days");
    offer.approved_amount = json.at("approved_amount").get<double>();
    return offer;
  } catch (const nlohmann::json::exception& e) {
    throw InvalidInputError(std::string("counter offer: ") + e.what());
  } catch (const InvalidInputError& e) {
    throw InvalidInputError(std::string("counter offer: ") + e.what());
  }
}

}  // namespace credit
