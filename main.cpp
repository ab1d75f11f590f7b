// -----------------------------------------------------------------------------
// credit_engine: demo entry point.
//
// Runs five booking scenarios through the DecisionOrchestrator and prints
// each decision as JSON:
//   1) yellow company: alternatives offered, NEGOTIATE
//   2) red company: hard block
//   3) green company: auto-approval
//   4) yellow company declines the options: negotiation rounds until the
//      session escalates
//   5) yellow company whose exposure no option can bring within budget
//
// Usage:
//   credit_engine [config.json]
//
// With no argument the built-in defaults and demo score table are used.
// If the config names a narrator endpoint, customer messages and
// counter-proposals are requested from that service over ZeroMQ;
// otherwise the template narrator is used.
//
// No global state; everything lives on main()'s stack.
// -----------------------------------------------------------------------------

#include "credit/config/engine_config.hpp"
#include "credit/domain/booking_request.hpp"
#include "credit/domain/errors.hpp"
#include "credit/engine/decision_orchestrator.hpp"
#include "credit/eventbus/event_bus.hpp"
#include "credit/narration/template_narrator.hpp"
#include "credit/narration/zmq_narrator.hpp"
#include "credit/scoring/static_scorer.hpp"
#include "credit/serialization/json_codec.hpp"
#include "credit/time/live_time_provider.hpp"

#include <iostream>
#include <memory>
#include <string>
#include <vector>

namespace {

using credit::domain::BookingRequest;
using credit::domain::RiskCategory;
using credit::domain::RiskScores;

void printHeader(const std::string& title) {
  std::cout << "\n" << std::string(78, '=') << "\n"
            << "  " << title << "\n"
            << std::string(78, '=') << "\n";
}

// Score table used when the config does not provide one.
void seedDemoScores(credit::StaticScorer& scorer) {
  scorer.set("IN-TRV-000567",
             RiskScores::create(0.32, 0.55, 0.02, 0.08, 0.15,
                                RiskCategory::Yellow));
  scorer.set("IN-TRV-000123",
             RiskScores::create(0.15, 0.85, 0.005, 0.01, 0.03,
                                RiskCategory::Green));
  scorer.set("IN-TRV-000999",
             RiskScores::create(0.85, 0.25, 0.25, 0.40, 0.60,
                                RiskCategory::Red));
  scorer.set("IN-TRV-999999",
             RiskScores::create(0.50, 0.40, 0.30, 0.40, 0.50,
                                RiskCategory::Yellow));
}

}  // namespace

int main(int argc, char** argv) {
  // -------------------------------------------------------------------------
  // 1) Configuration: file if given, defaults otherwise.
  // -------------------------------------------------------------------------
  credit::EngineConfig config;
  try {
    if (argc > 1) {
      config = credit::loadConfigFile(argv[1]);
    } else {
      config.validate();
    }
  } catch (const credit::ConfigError& e) {
    std::cerr << "[main] " << e.what() << "\n";
    return 1;
  }

  // -------------------------------------------------------------------------
  // 2) Collaborators.
  // -------------------------------------------------------------------------
  credit::StaticScorer scorer(config.scorer);
  if (scorer.size() == 0) {
    seedDemoScores(scorer);
  }

  std::unique_ptr<credit::INarrator> narrator;
  if (!config.narrator.endpoint.empty()) {
    narrator = std::make_unique<credit::ZmqNarrator>(
        config.narrator.endpoint, config.negotiation.narrator_timeout_ms);
  } else {
    narrator = std::make_unique<credit::TemplateNarrator>();
  }

  credit::LiveTimeProvider clock;
  credit::EventBus bus;

  // -------------------------------------------------------------------------
  // 3) Logging subscribers.
  // -------------------------------------------------------------------------
  bus.subscribe<credit::DecisionEvent>([](const credit::DecisionEvent& e) {
    std::cout << "[Decision] company=" << e.company_id << " decision="
              << credit::domain::decisionToString(e.decision) << " category="
              << credit::domain::riskCategoryToString(e.risk_category)
              << " options=" << e.options_count
              << (e.scores_from_fallback ? " (fallback scores)" : "")
              << (e.reason.empty() ? "" : " reason=\"" + e.reason + "\"")
              << "\n";
  });

  bus.subscribe<credit::NegotiationRoundEvent>(
      [](const credit::NegotiationRoundEvent& e) {
        std::cout << "[Negotiation] session=" << e.session_id
                  << " round=" << e.round_number << " state="
                  << credit::domain::negotiationStateToString(e.state)
                  << " source=" << credit::domain::offerSourceToString(e.source);
        if (e.expected_loss) {
          std::cout << " EL=" << *e.expected_loss;
        }
        std::cout << "\n";
      });

  bus.subscribe<credit::EscalationEvent>([](const credit::EscalationEvent& e) {
    std::cout << "[Escalation] session=" << e.session_id
              << " company=" << e.company_id << " reference=" << e.reference
              << " after " << e.rounds_completed << " round(s)\n";
  });

  credit::DecisionOrchestrator orchestrator(config, scorer, *narrator, bus,
                                            clock);

  try {
    // -----------------------------------------------------------------------
    // Scenario 1: yellow, options offered.
    // -----------------------------------------------------------------------
    printHeader("1. Yellow company: alternatives offered");
    const auto yellow = BookingRequest::create(
        "IN-TRV-000567", "MediumRisk Agency", 50000.0, 45000.0, 80000.0,
        "Chennai-Dubai", "2026-02-15");
    const auto yellow_record = orchestrator.processBooking(yellow);
    std::cout << credit::toJson(yellow_record).dump(2) << "\n";

    // -----------------------------------------------------------------------
    // Scenario 2: red, hard block.
    // -----------------------------------------------------------------------
    printHeader("2. Red company: blocked");
    const auto red = BookingRequest::create(
        "IN-TRV-000999", "HighRisk Agency", 100000.0, 150000.0, 120000.0,
        "Delhi-London", "2026-02-15");
    std::cout << credit::toJson(orchestrator.processBooking(red)).dump(2)
              << "\n";

    // -----------------------------------------------------------------------
    // Scenario 3: green, approved as requested.
    // -----------------------------------------------------------------------
    printHeader("3. Green company: approved");
    const auto green = BookingRequest::create(
        "IN-TRV-000123", "LowRisk Travels", 30000.0, 20000.0, 100000.0,
        "Mumbai-Singapore", "2026-02-15");
    std::cout << credit::toJson(orchestrator.processBooking(green)).dump(2)
              << "\n";

    // -----------------------------------------------------------------------
    // Scenario 4: the yellow customer declines and negotiates.
    // -----------------------------------------------------------------------
    printHeader("4. Negotiation: three rounds, then escalation");
    if (yellow_record.options) {
      const auto session = orchestrator.openNegotiation(
          yellow, yellow_record.scores, *yellow_record.options);

      const std::vector<std::string> messages = {
          "Can't do 7 days, and ₹25K upfront is too much.",
          "What about ₹15,000 upfront with 20 days?",
          "This doesn't work for us, can you do better?",
          "We still need better terms.",
      };
      for (const auto& message : messages) {
        std::cout << "\nCustomer: " << message << "\n";
        const auto result = orchestrator.negotiate(session, message);
        std::cout << credit::toJson(result).dump(2) << "\n";
      }
      orchestrator.resetNegotiation(session);
    } else {
      std::cout << "No options were offered; nothing to negotiate.\n";
    }

    // -----------------------------------------------------------------------
    // Scenario 5: yellow, but no option fits the budget.
    // -----------------------------------------------------------------------
    printHeader("5. Edge case: no option fits the budget");
    const auto edge = BookingRequest::create(
        "IN-TRV-999999", "HighRisk Travels Pvt Ltd", 50000.0, 80000.0,
        100000.0, "DEL-BOM", "2026-02-15");
    std::cout << credit::toJson(orchestrator.processBooking(edge)).dump(2)
              << "\n";
  } catch (const credit::InvalidInputError& e) {
    std::cerr << "[main] invalid input: " << e.what() << "\n";
    return 1;
  } catch (const credit::SessionError& e) {
    std::cerr << "[main] session error: " << e.what() << "\n";
    return 1;
  }

  std::cout << "\n[main] done.\n";
  return 0;
}
