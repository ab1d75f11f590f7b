// =============================================================================
// domain_test.cpp
// =============================================================================
// Unit tests for the domain value types and their small collaborators.
//
// Validates:
//   - BookingRequest::create and RiskScores::create input checks
//   - Enum string names used on the wire and in logs
//   - Currency formatting, including non-finite and huge amounts
//   - StaticScorer lookups and its CollaboratorError on unknown companies
//   - TemplateNarrator message layout and its offer-less counter
//   - ManualTimeProvider and session id generation
//
// Threading model: single-threaded.
// =============================================================================

#include "credit/concurrent/session_id_generator.hpp"
#include "credit/domain/currency_format.hpp"
#include "credit/domain/decision_record.hpp"
#include "credit/domain/errors.hpp"
#include "credit/narration/template_narrator.hpp"
#include "credit/scoring/static_scorer.hpp"
#include "credit/time/manual_time_provider.hpp"
#include "test_support.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <limits>

using credit::InvalidInputError;
using credit::domain::BookingRequest;
using credit::domain::RiskCategory;
using credit::domain::RiskScores;
using ::testing::HasSubstr;

namespace ts = credit::testing_support;

// -----------------------------------------------------------------------------
// 1. Booking request validation.
// -----------------------------------------------------------------------------
TEST(DomainTest, BookingRequestRejectsMalformedInput) {
  const double nan = std::numeric_limits<double>::quiet_NaN();
  EXPECT_THROW(BookingRequest::create("", "n", 100.0, 0.0, 0.0, "", ""),
               InvalidInputError);
  EXPECT_THROW(BookingRequest::create("X", "n", 0.0, 0.0, 0.0, "", ""),
               InvalidInputError);
  EXPECT_THROW(BookingRequest::create("X", "n", nan, 0.0, 0.0, "", ""),
               InvalidInputError);
  EXPECT_THROW(BookingRequest::create("X", "n", 100.0, -1.0, 0.0, "", ""),
               InvalidInputError);
  EXPECT_THROW(BookingRequest::create("X", "n", 100.0, 0.0, -1.0, "", ""),
               InvalidInputError);

  const auto ok = BookingRequest::create("X", "n", 100.0, 0.0, 0.0, "", "");
  EXPECT_EQ(ok.company_id, "X");
}

// -----------------------------------------------------------------------------
// 2. Scores must lie in [0, 1]; the bounds themselves are allowed.
// -----------------------------------------------------------------------------
TEST(DomainTest, RiskScoresRange) {
  EXPECT_NO_THROW(RiskScores::create(0.0, 1.0, 0.0, 0.5, 1.0));
  EXPECT_THROW(RiskScores::create(1.1, 0.5, 0.1, 0.1, 0.1), InvalidInputError);
  EXPECT_THROW(RiskScores::create(0.5, -0.1, 0.1, 0.1, 0.1), InvalidInputError);
  EXPECT_THROW(RiskScores::create(0.5, 0.5, 0.1, 0.1,
                                  std::numeric_limits<double>::infinity()),
               InvalidInputError);
}

// -----------------------------------------------------------------------------
// 3. Enum names.
// -----------------------------------------------------------------------------
TEST(DomainTest, EnumNames) {
  using namespace credit::domain;
  EXPECT_STREQ(riskCategoryToString(RiskCategory::Green), "green");
  EXPECT_STREQ(riskCategoryToString(RiskCategory::Red), "red");
  EXPECT_STREQ(decisionToString(Decision::Negotiate), "NEGOTIATE");
  EXPECT_STREQ(optionKindToString(OptionKind::UpfrontPayment), "upfront_payment");
  EXPECT_STREQ(negotiationStateToString(NegotiationState::Escalated), "escalated");
  EXPECT_STREQ(offerSourceToString(OfferSource::Narrator), "narrator");
}

// -----------------------------------------------------------------------------
// 4. Currency formatting.
// -----------------------------------------------------------------------------
TEST(DomainTest, FormatCurrency) {
  EXPECT_EQ(credit::formatCurrency(47381.0, 0), "₹47,381");
  EXPECT_EQ(credit::formatCurrency(5100.0, 2), "₹5,100.00");
  EXPECT_EQ(credit::formatCurrency(999.0, 0), "₹999");
  EXPECT_EQ(credit::formatCurrency(1234567.891, 2), "₹1,234,567.89");
  EXPECT_EQ(credit::formatCurrency(0.0, 2), "₹0.00");
  EXPECT_EQ(credit::formatCurrency(2619.4, 0), "₹2,619");
  EXPECT_EQ(credit::formatCurrency(-1250.0, 0), "-₹1,250");
}

// -----------------------------------------------------------------------------
// 5. Amounts that cannot be rounded print a marker instead.
// -----------------------------------------------------------------------------
TEST(DomainTest, FormatCurrencyNonFinite) {
  EXPECT_EQ(credit::formatCurrency(std::numeric_limits<double>::infinity(), 2),
            "non-finite");
  EXPECT_EQ(credit::formatCurrency(-std::numeric_limits<double>::infinity(), 0),
            "non-finite");
  EXPECT_EQ(credit::formatCurrency(std::numeric_limits<double>::quiet_NaN(), 2),
            "non-finite");
  EXPECT_EQ(credit::formatCurrency(1e300, 2), "out-of-range");
}

// -----------------------------------------------------------------------------
// 6. StaticScorer.
// -----------------------------------------------------------------------------
TEST(DomainTest, StaticScorerLookup) {
  credit::ScorerConfig config;
  config.companies.emplace_back("IN-TRV-000567", ts::yellowScores());
  credit::StaticScorer scorer(config);
  EXPECT_EQ(scorer.size(), 1u);

  EXPECT_DOUBLE_EQ(scorer.score("IN-TRV-000567").pd_30d, 0.15);
  EXPECT_THROW(scorer.score("IN-TRV-000000"), credit::CollaboratorError);

  scorer.set("IN-TRV-000567", ts::redScores());
  EXPECT_DOUBLE_EQ(scorer.score("IN-TRV-000567").intent_score, 0.85);
}

// -----------------------------------------------------------------------------
// 7. TemplateNarrator message layout.
// -----------------------------------------------------------------------------
TEST(DomainTest, TemplateNarratorMessage) {
  credit::TemplateNarrator narrator;
  credit::DecisionContext context;
  context.booking = ts::yellowBooking();
  context.scores = ts::yellowScores();

  credit::domain::CreditOption a;
  a.option_id = "A";
  a.kind = credit::domain::OptionKind::ShortenedSettlement;
  a.settlement_days = 7;
  a.approved_amount = 50000.0;
  credit::domain::CreditOption b;
  b.option_id = "B";
  b.kind = credit::domain::OptionKind::UpfrontPayment;
  b.settlement_days = 30;
  b.upfront_amount = 47381.0;
  b.approved_amount = 50000.0;
  context.options = {a, b};

  const auto message = narrator.composeMessage(context);
  EXPECT_EQ(message.subject, "Credit Options for ₹50,000 Booking");
  EXPECT_THAT(message.body, HasSubstr("Your ₹50,000 booking (Chennai-Dubai)"));
  EXPECT_THAT(message.body, HasSubstr("Settle within 7 days (no upfront)"));
  EXPECT_THAT(message.body, HasSubstr("-> Remaining ₹2,619 in 30 days"));
  EXPECT_THAT(message.body, HasSubstr("Reply A or B to proceed."));
  EXPECT_THAT(message.body, HasSubstr("- Credit Team"));
  EXPECT_THAT(message.call_to_action_labels,
              ::testing::ElementsAre("Select A", "Select B", "Support"));
}

// -----------------------------------------------------------------------------
// 8. TemplateNarrator never proposes terms.
// Why: pricing is the engine's job; without a live narration service every
//      counter-offer comes from the deterministic fallback.
// -----------------------------------------------------------------------------
TEST(DomainTest, TemplateNarratorCounterHasNoOffer) {
  credit::TemplateNarrator narrator;
  credit::NegotiationContext context;
  context.round_number = 2;

  const auto proposal = narrator.proposeCounter(context);
  EXPECT_FALSE(proposal.offer.has_value());
  EXPECT_FALSE(proposal.escalate_hint);
  EXPECT_THAT(proposal.response_text, HasSubstr("round 2"));
}

// -----------------------------------------------------------------------------
// 9. Manual clock and id generator.
// -----------------------------------------------------------------------------
TEST(DomainTest, ManualClockAndIdGenerator) {
  credit::ManualTimeProvider clock(100);
  EXPECT_EQ(clock.now_ms(), 100);
  clock.advance_by(50);
  EXPECT_EQ(clock.now_ms(), 150);
  clock.set_time(10);
  EXPECT_EQ(clock.now_ms(), 10);

  credit::SessionIdGenerator ids;
  const auto first = ids.next_id();
  EXPECT_EQ(first, 1u);
  EXPECT_EQ(ids.next_id(), 2u);
}
