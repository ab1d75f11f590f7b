#include "credit/negotiation/negotiation_engine.hpp"
#include "credit/domain/currency_format.hpp"
#include "credit/risk/exposure_calculator.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <future>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace credit {

namespace {

constexpr const char* kCustomerRole = "Customer";
constexpr const char* kAgentRole = "Agent";

const char* const kCannotMeetText =
    "I can't meet that within our risk limits. Would a shorter settlement "
    "window, a partial upfront payment or a smaller approved amount work "
    "for you?";

domain::OptionKind classify(const domain::CounterOffer& offer,
                            double booking_amount) {
  if (offer.approved_amount < booking_amount) {
    return domain::OptionKind::PartialApproval;
  }
  if (offer.upfront > 0.0) {
    return domain::OptionKind::UpfrontPayment;
  }
  return domain::OptionKind::ShortenedSettlement;
}

// Customer-facing explanation of a verified offer, with the EL arithmetic.
std::string describeOffer(const domain::NegotiationSession& session,
                          const VerifiedOffer& verified, double lgd) {
  const auto& offer = verified.offer;
  const double ead = session.booking.current_outstanding +
                     offer.approved_amount - offer.upfront;

  std::ostringstream out;
  out << "I understand. How about ";
  if (offer.approved_amount < session.booking.booking_amount) {
    out << "approving " << formatCurrency(offer.approved_amount, 0) << " ";
  }
  if (offer.upfront > 0.0) {
    out << formatCurrency(offer.upfront, 0) << " upfront with "
        << offer.settlement_days << "-day settlement?";
  } else {
    out << "a " << offer.settlement_days
        << "-day settlement with no upfront payment?";
  }
  out << " This keeps Expected Loss at "
      << formatCurrency(verified.expected_loss, 2) << " (calculation: "
      << std::fixed << std::setprecision(3) << verified.pd << " x "
      << formatCurrency(ead, 0) << " x " << std::setprecision(2) << lgd
      << " = " << formatCurrency(verified.expected_loss, 2) << ").";
  return out.str();
}

}  // namespace

NegotiationEngine::NegotiationEngine(const EngineConfig& config,
                                     INarrator& narrator, WorkerPool& pool,
                                     const ComplianceValidator& validator)
    : constraints_(config.risk_constraints),
      negotiation_(config.negotiation),
      narrator_(narrator),
      pool_(pool),
      validator_(validator) {}

// -----------------------------------------------------------------------------
// advance(): one round of the protocol
// -----------------------------------------------------------------------------
domain::NegotiationResult NegotiationEngine::advance(
    domain::NegotiationSession& session,
    const std::string& customer_message) const {
  using domain::NegotiationSession;

  // --- Terminal: replay the stored escalation ---------------------------------
  if (session.escalated && session.escalation_result) {
    std::cout << "[NegotiationEngine] session " << session.id
              << " already escalated, replaying result\n";
    return *session.escalation_result;
  }

  // --- Round ceiling ------------------------------------------------------------
  if (session.rounds_completed >= NegotiationSession::kMaxRounds) {
    return escalate(session, customer_message);
  }

  const int round = session.round_number;
  std::optional<VerifiedOffer> verified;
  domain::OfferSource source = domain::OfferSource::Fallback;
  std::string narrator_text;

  // --- Preferred path: Narrator proposal, re-verified -------------------------
  if (auto proposal = askNarrator(session, customer_message)) {
    if (proposal->escalate_hint) {
      std::cout << "[NegotiationEngine] session " << session.id
                << " narrator suggested escalation (ignored)\n";
    }
    if (proposal->offer) {
      verified = verifyProposal(session, *proposal->offer);
      if (verified) {
        source = domain::OfferSource::Narrator;
        narrator_text = proposal->response_text;
      } else {
        std::cerr << "[NegotiationEngine] WARNING: session " << session.id
                  << " narrator offer rejected, using fallback\n";
      }
    }
  }

  // --- Deterministic fallback -----------------------------------------------------
  if (!verified) {
    verified = fallbackOffer(session);
  }

  domain::NegotiationResult result;
  result.round_number = round;
  result.source = source;

  if (verified) {
    result.state = domain::NegotiationState::Resolved;
    result.offer = verified->offer;
    result.expected_loss = verified->expected_loss;
    result.response_text = narrator_text.empty()
                               ? describeOffer(session, *verified,
                                               constraints_.lgd)
                               : narrator_text;
  } else if (round < NegotiationSession::kMaxRounds) {
    result.state = domain::NegotiationState::Open;
    result.source = domain::OfferSource::Fallback;
    result.response_text = kCannotMeetText;
  } else {
    return escalate(session, customer_message);
  }

  session.transcript.push_back({kCustomerRole, customer_message});
  session.transcript.push_back({kAgentRole, result.response_text});
  session.rounds_completed += 1;
  session.round_number = std::min(round + 1, NegotiationSession::kMaxRounds);
  session.state = result.state;

  std::cout << "[NegotiationEngine] session " << session.id << " round "
            << round << ": " << domain::negotiationStateToString(result.state)
            << " via " << domain::offerSourceToString(result.source);
  if (result.expected_loss) {
    std::cout << " (EL=" << *result.expected_loss << ")";
  }
  std::cout << "\n";
  return result;
}

// -----------------------------------------------------------------------------
// verifyProposal(): the engine's own pricing of a suggested offer
// -----------------------------------------------------------------------------
std::optional<VerifiedOffer> NegotiationEngine::verifyProposal(
    const domain::NegotiationSession& session,
    const domain::CounterOffer& offer) const {
  const auto& booking = session.booking;

  if (!std::isfinite(offer.upfront) || !std::isfinite(offer.approved_amount) ||
      offer.upfront < 0.0 || offer.approved_amount <= 0.0) {
    std::cerr << "[NegotiationEngine] WARNING: offer has invalid amounts\n";
    return std::nullopt;
  }
  if (offer.approved_amount > booking.booking_amount) {
    std::cerr << "[NegotiationEngine] WARNING: offer approves "
              << offer.approved_amount << ", more than requested "
              << booking.booking_amount << "\n";
    return std::nullopt;
  }

  const auto& scores = session.scores;
  const double pd = pdForHorizon(offer.settlement_days, scores.pd_7d,
                                 scores.pd_14d, scores.pd_30d);
  const double ead = exposureAtDefault(booking.current_outstanding,
                                       offer.approved_amount, offer.upfront);
  const double el = roundToCents(expectedLoss(pd, ead, constraints_.lgd));

  domain::CreditOption option;
  option.option_id = "R" + std::to_string(session.round_number);
  option.kind = classify(offer, booking.booking_amount);
  option.settlement_days = offer.settlement_days;
  option.upfront_amount = offer.upfront;
  option.approved_amount = offer.approved_amount;
  option.expected_loss = el;

  const auto violations = validator_.check(option);
  if (!violations.empty()) {
    for (const auto& violation : violations) {
      std::cerr << "[NegotiationEngine] WARNING: " << violation << "\n";
    }
    return std::nullopt;
  }

  return VerifiedOffer{offer, el, pd};
}

// -----------------------------------------------------------------------------
// fallbackOffer(): mid-horizon settlement with a capped upfront
// -----------------------------------------------------------------------------
std::optional<VerifiedOffer> NegotiationEngine::fallbackOffer(
    const domain::NegotiationSession& session) const {
  const auto& booking = session.booking;
  const auto& scores = session.scores;
  const double lgd = constraints_.lgd;
  const double max_el = constraints_.max_expected_loss;

  const double pd = (scores.pd_7d + scores.pd_14d) / 2.0;
  const double exposure =
      exposureAtDefault(booking.current_outstanding, booking.booking_amount);

  double required = 0.0;
  if (pd * lgd > 0.0) {
    required = exposure - max_el / (pd * lgd);
  }
  const double cap =
      negotiation_.fallback_upfront_cap_fraction * booking.booking_amount;
  const double upfront =
      std::min(ceilToUnit(std::clamp(required, 0.0, cap)), cap);

  domain::CounterOffer offer;
  offer.upfront = upfront;
  offer.settlement_days = negotiation_.fallback_settlement_days;
  offer.approved_amount = booking.booking_amount;

  const double el = roundToCents(expectedLoss(pd, exposure - upfront, lgd));

  domain::CreditOption option;
  option.option_id = "F" + std::to_string(session.round_number);
  option.kind = classify(offer, booking.booking_amount);
  option.settlement_days = offer.settlement_days;
  option.upfront_amount = offer.upfront;
  option.approved_amount = offer.approved_amount;
  option.expected_loss = el;

  const auto violations = validator_.check(option);
  if (!violations.empty()) {
    std::cerr << "[NegotiationEngine] fallback cannot fit budget for "
              << booking.company_id << " (" << violations.front() << ")\n";
    return std::nullopt;
  }
  return VerifiedOffer{offer, el, pd};
}

std::string NegotiationEngine::escalationReference(
    const domain::BookingRequest& booking) {
  const std::string& id = booking.company_id;
  const std::string tail = id.size() > 4 ? id.substr(id.size() - 4) : id;
  return "REF-" + booking.booking_date + "-" + tail;
}

// -----------------------------------------------------------------------------
// askNarrator(): bounded call on the worker pool
// -----------------------------------------------------------------------------
std::optional<CounterProposal> NegotiationEngine::askNarrator(
    const domain::NegotiationSession& session,
    const std::string& customer_message) const {
  NegotiationContext context;
  context.booking = session.booking;
  context.scores = session.scores;
  context.initial_options = session.initial_options;
  context.transcript = session.transcript;
  context.customer_message = customer_message;
  context.round_number = session.round_number;
  context.max_expected_loss = constraints_.max_expected_loss;
  context.lgd = constraints_.lgd;

  const auto deadline =
      WorkerPool::Clock::now() +
      std::chrono::milliseconds(negotiation_.narrator_timeout_ms);

  try {
    // The context is moved into the task: a call that outlives the deadline
    // must not reference this frame. If no worker reaches it before the
    // deadline the pool drops it unrun.
    auto future = pool_.submit(
        [&narrator = narrator_, context = std::move(context)] {
          return narrator.proposeCounter(context);
        },
        deadline);

    if (future.wait_until(deadline) != std::future_status::ready) {
      std::cerr << "[NegotiationEngine] WARNING: narrator timed out after "
                << negotiation_.narrator_timeout_ms << " ms (session "
                << session.id << ")\n";
      return std::nullopt;
    }
    return future.get();
  } catch (const std::exception& e) {
    std::cerr << "[NegotiationEngine] WARNING: narrator failed (session "
              << session.id << "): " << e.what() << "\n";
    return std::nullopt;
  }
}

// -----------------------------------------------------------------------------
// escalate(): terminal transition, result stored for replay
// -----------------------------------------------------------------------------
domain::NegotiationResult NegotiationEngine::escalate(
    domain::NegotiationSession& session,
    const std::string& customer_message) const {
  domain::NegotiationResult result;
  result.response_text =
      "I've tried multiple combinations but can't find one that fits both "
      "your needs and our risk limits. I'm escalating this to our senior "
      "credit team for manual review. They'll contact you within 2 hours. "
      "Reference: " +
      escalationReference(session.booking);
  result.escalate = true;
  result.round_number = session.round_number;
  result.state = domain::NegotiationState::Escalated;
  result.source = domain::OfferSource::Escalation;

  session.transcript.push_back({kCustomerRole, customer_message});
  session.transcript.push_back({kAgentRole, result.response_text});
  if (session.rounds_completed < domain::NegotiationSession::kMaxRounds) {
    session.rounds_completed += 1;
  }
  session.state = domain::NegotiationState::Escalated;
  session.escalated = true;
  session.escalation_result = result;

  std::cerr << "[NegotiationEngine] session " << session.id
            << " escalated to manual review ("
            << escalationReference(session.booking) << ")\n";
  return result;
}

}  // namespace credit
