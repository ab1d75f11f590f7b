#include "credit/engine/decision_orchestrator.hpp"
#include "credit/domain/errors.hpp"
#include "credit/risk/exposure_calculator.hpp"

#include <chrono>
#include <future>
#include <iostream>

namespace credit {

namespace {

std::string join(const std::vector<std::string>& parts, const char* sep) {
  std::string out;
  for (std::size_t i = 0; i < parts.size(); ++i) {
    if (i > 0) {
      out += sep;
    }
    out += parts[i];
  }
  return out;
}

}  // namespace

// -----------------------------------------------------------------------------
// Constructor: validate config, build components, start the narrator pool
// -----------------------------------------------------------------------------
DecisionOrchestrator::DecisionOrchestrator(const EngineConfig& config,
                                           const IScorer& scorer,
                                           INarrator& narrator, EventBus& bus,
                                           const ITimeProvider& clock)
    : config_(config),
      scorer_(scorer),
      narrator_(narrator),
      bus_(bus),
      clock_(clock),
      gate_(config.decision_matrix),
      generator_(config.risk_constraints, config.terms),
      validator_(config.risk_constraints),
      sessions_(clock) {
  config_.validate();
  pool_ = std::make_unique<WorkerPool>(
      config_.negotiation.narrator_workers,
      static_cast<std::size_t>(config_.negotiation.narrator_queue_limit));
  negotiation_ = std::make_unique<NegotiationEngine>(config_, narrator_,
                                                     *pool_, validator_);
}

DecisionOrchestrator::~DecisionOrchestrator() {
  // Let in-flight Narrator calls finish before the engine goes away.
  if (pool_) {
    pool_->stop();
  }
}

// -----------------------------------------------------------------------------
// processBooking()
// -----------------------------------------------------------------------------
domain::DecisionRecord DecisionOrchestrator::processBooking(
    const domain::BookingRequest& request) {
  // Hand-built requests bypass create(); malformed ones never reach the gate.
  request.validate();

  auto [scores, from_fallback] = scoreCompany(request.company_id);
  scores.risk_category = gate_.categorize(scores);

  domain::DecisionRecord record;
  record.risk_category = scores.risk_category;
  record.scores = scores;
  record.scores_from_fallback = from_fallback;

  std::cout << "[DecisionOrchestrator] " << request.company_id << " -> "
            << domain::riskCategoryToString(scores.risk_category)
            << " (intent=" << scores.intent_score
            << ", capacity=" << scores.capacity_score << ")\n";

  switch (scores.risk_category) {
    // --- Green: approve as requested --------------------------------------------
    case domain::RiskCategory::Green:
      record.decision = domain::Decision::Approved;
      record.approved_amount = request.booking_amount;
      record.settlement_days = config_.terms.standard_settlement_days;
      break;

    // --- Red: hard block -----------------------------------------------------------
    case domain::RiskCategory::Red:
      record.decision = domain::Decision::Blocked;
      record.reason = join(gate_.blockReasons(scores), " | ");
      break;

    // --- Yellow: price alternatives ------------------------------------------------
    case domain::RiskCategory::Yellow: {
      const auto analysis =
          analyzeExposure(request, scores, config_.risk_constraints);
      record.financial_analysis = analysis;

      auto options = generator_.generate(OptionsInput::from(analysis, scores));
      if (options.empty()) {
        record.decision = domain::Decision::Blocked;
        record.reason = "No options satisfy risk constraints";
        break;
      }

      auto validation = validator_.validate(options);
      record.validation = validation;
      record.options = options;
      if (!validation.compliant) {
        record.decision = domain::Decision::Blocked;
        record.reason = "Compliance validation failed: " +
                        join(validation.violations, "; ");
        break;
      }

      DecisionContext context;
      context.booking = request;
      context.scores = scores;
      context.analysis = analysis;
      context.options = std::move(options);
      context.max_expected_loss = config_.risk_constraints.max_expected_loss;

      record.message = composeMessage(context);
      record.decision = domain::Decision::Negotiate;
      break;
    }
  }

  publishDecision(request, record);
  return record;
}

domain::SessionId DecisionOrchestrator::openNegotiation(
    const domain::BookingRequest& request, const domain::RiskScores& scores,
    const std::vector<domain::CreditOption>& options) {
  request.validate();
  return sessions_.create(request, scores, options);
}

// -----------------------------------------------------------------------------
// negotiate(): one round under the session lock, events published after
// -----------------------------------------------------------------------------
domain::NegotiationResult DecisionOrchestrator::negotiate(
    domain::SessionId session_id, const std::string& customer_message) {
  bool replayed = false;
  std::string company_id;
  std::string reference;
  int rounds_completed = 0;

  domain::NegotiationResult result = sessions_.advance(
      session_id, [&](domain::NegotiationSession& session) {
        replayed = session.escalated;
        company_id = session.booking.company_id;
        auto round = negotiation_->advance(session, customer_message);
        reference = NegotiationEngine::escalationReference(session.booking);
        rounds_completed = session.rounds_completed;
        return round;
      });

  if (replayed) {
    return result;
  }

  const std::int64_t now = clock_.now_ms();

  NegotiationRoundEvent round_event;
  round_event.session_id = session_id;
  round_event.company_id = company_id;
  round_event.round_number = result.round_number;
  round_event.state = result.state;
  round_event.source = result.source;
  round_event.expected_loss = result.expected_loss;
  round_event.timestamp_ms = now;
  bus_.publish(round_event);

  if (result.escalate) {
    EscalationEvent escalation;
    escalation.session_id = session_id;
    escalation.company_id = company_id;
    escalation.reference = reference;
    escalation.rounds_completed = rounds_completed;
    escalation.timestamp_ms = now;
    bus_.publish(escalation);
  }
  return result;
}

void DecisionOrchestrator::resetNegotiation(domain::SessionId session_id) {
  sessions_.reset(session_id);
}

std::size_t DecisionOrchestrator::purgeIdleSessions(std::int64_t max_idle_ms) {
  return sessions_.purgeIdle(max_idle_ms);
}

std::optional<domain::NegotiationSession>
DecisionOrchestrator::sessionSnapshot(domain::SessionId session_id) const {
  return sessions_.snapshot(session_id);
}

// -----------------------------------------------------------------------------
// scoreCompany(): scorer output re-validated, fallback on any failure
// -----------------------------------------------------------------------------
std::pair<domain::RiskScores, bool> DecisionOrchestrator::scoreCompany(
    const std::string& company_id) const {
  try {
    const auto raw = scorer_.score(company_id);
    // Re-run the factory so out-of-range scorer output is treated as failure.
    auto checked = domain::RiskScores::create(
        raw.intent_score, raw.capacity_score, raw.pd_7d, raw.pd_14d,
        raw.pd_30d, raw.risk_category);
    return {checked, false};
  } catch (const std::exception& e) {
    std::cerr << "[DecisionOrchestrator] WARNING: scorer failed for "
              << company_id << " (" << e.what()
              << "), using fallback scores\n";
    return {config_.scorer.fallback_scores, true};
  }
}

// -----------------------------------------------------------------------------
// composeMessage(): bounded Narrator call, template text on failure
// -----------------------------------------------------------------------------
domain::CustomerMessage DecisionOrchestrator::composeMessage(
    const DecisionContext& context) {
  const auto deadline =
      WorkerPool::Clock::now() +
      std::chrono::milliseconds(config_.negotiation.narrator_timeout_ms);

  try {
    auto future = pool_->submit(
        [&narrator = narrator_, context] {
          return narrator.composeMessage(context);
        },
        deadline);

    if (future.wait_until(deadline) == std::future_status::ready) {
      return future.get();
    }
    std::cerr << "[DecisionOrchestrator] WARNING: narrator timed out, "
                 "using template message\n";
  } catch (const std::exception& e) {
    std::cerr << "[DecisionOrchestrator] WARNING: narrator failed ("
              << e.what() << "), using template message\n";
  }
  return template_narrator_.composeMessage(context);
}

void DecisionOrchestrator::publishDecision(
    const domain::BookingRequest& request,
    const domain::DecisionRecord& record) {
  DecisionEvent event;
  event.company_id = request.company_id;
  event.decision = record.decision;
  event.risk_category = record.risk_category;
  event.scores_from_fallback = record.scores_from_fallback;
  event.options_count = record.options ? record.options->size() : 0;
  event.reason = record.reason.value_or("");
  event.timestamp_ms = clock_.now_ms();
  bus_.publish(event);
}

}  // namespace credit
