#pragma once

#include "credit/domain/booking_request.hpp"
#include "credit/domain/credit_option.hpp"
#include "credit/domain/decision_record.hpp"
#include "credit/domain/financial_analysis.hpp"
#include "credit/domain/negotiation.hpp"
#include "credit/domain/risk_scores.hpp"
#include "credit/domain/validation_result.hpp"

#include <nlohmann/json.hpp>

namespace credit {

// -----------------------------------------------------------------------------
// JSON codec
// -----------------------------------------------------------------------------
//
// @brief  Conversions between engine value types and nlohmann::json.
//
// @details
// Encoders produce the wire shape used by the demo output, the event log and
// the narration service requests. Optional DecisionRecord members are
// omitted rather than written as null. Currency values are written rounded
// to cents; FinancialAnalysis is stored unrounded and rounded here.
//
// Decoders validate through the domain factories and rethrow every
// nlohmann::json exception (missing key, wrong type) as InvalidInputError,
// so callers only ever see the engine's own error taxonomy.
// -----------------------------------------------------------------------------

nlohmann::json toJson(const domain::BookingRequest& booking);
nlohmann::json toJson(const domain::RiskScores& scores);
nlohmann::json toJson(const domain::FinancialAnalysis& analysis);
nlohmann::json toJson(const domain::CreditOption& option);
nlohmann::json toJson(const domain::ValidationResult& validation);
nlohmann::json toJson(const domain::CustomerMessage& message);
nlohmann::json toJson(const domain::DecisionRecord& record);
nlohmann::json toJson(const domain::CounterOffer& offer);
nlohmann::json toJson(const domain::NegotiationResult& result);

// Parses "green" / "yellow" / "red". @throws InvalidInputError otherwise.
domain::RiskCategory riskCategoryFromString(const std::string& text);

// -------------------------------------------------------------------------
// bookingRequestFromJson
// -------------------------------------------------------------------------
// Required keys: company_id, booking_amount, current_outstanding,
// credit_limit. Optional: company_name, route, booking_date (default "").
//
// @throws InvalidInputError on missing keys, wrong types or values rejected
//         by BookingRequest::create().
// -------------------------------------------------------------------------
domain::BookingRequest bookingRequestFromJson(const nlohmann::json& json);

// -------------------------------------------------------------------------
// riskScoresFromJson
// -------------------------------------------------------------------------
// Required keys: intent_score, capacity_score, pd_7d, pd_14d, pd_30d.
// Optional: risk_category (default "yellow").
//
// @throws InvalidInputError as above.
// -------------------------------------------------------------------------
domain::RiskScores riskScoresFromJson(const nlohmann::json& json);

// Parses {"upfront", "settlement_days", "approved_amount"}.
// @throws InvalidInputError on missing keys or wrong types.
domain::CounterOffer counterOfferFromJson(const nlohmann::json& json);

}  // namespace credit
