#pragma once

#include "credit/narration/i_narrator.hpp"

#include <nlohmann/json.hpp>
#include <zmq.hpp>

#include <string>

namespace credit {

// -----------------------------------------------------------------------------
// ZmqNarrator
// -----------------------------------------------------------------------------
//
// @brief  INarrator client for an external narration service reached over a
//         ZeroMQ REQ socket.
//
// @details
// Each call sends one JSON request and waits for one JSON reply.
//
//   compose_message request:
//     {"type": "compose_message", "booking": {...}, "scores": {...},
//      "financial_analysis": {...}, "options": [...],
//      "max_expected_loss": 5000.0}
//   reply:
//     {"subject": "...", "body": "...", "cta_buttons": ["...", ...]}
//
//   propose_counter request:
//     {"type": "propose_counter", "booking": {...}, "scores": {...},
//      "initial_options": [...], "transcript": [{"role", "text"}, ...],
//      "customer_message": "...", "round_number": 2,
//      "max_expected_loss": 5000.0, "lgd": 0.7}
//   reply:
//     {"response": "...",
//      "offer": null | {"upfront", "settlement_days", "approved_amount"},
//      "escalate": false}
//
// Replies are schema-checked here (required keys, types). Any numbers in
// them are still re-verified by the Negotiation Engine.
//
// Socket policy:
//   A fresh REQ socket per call on the shared context, so a timed-out
//   exchange never leaves a REQ socket stuck in the wrong send/recv state.
//   The whole exchange shares one timeout_ms budget: ZMQ_SNDTIMEO is set to
//   it and ZMQ_RCVTIMEO to whatever the send left. linger 0 discards unsent
//   data when the socket closes.
//
// Errors:
//   Timeouts, transport errors, unparsable or malformed replies all throw
//   CollaboratorError.
//
// Thread model:
//   zmq::context_t is thread-safe; sockets are created and closed on the
//   calling thread. Both methods are safe to call concurrently.
// -----------------------------------------------------------------------------
class ZmqNarrator final : public INarrator {
 public:
  ZmqNarrator(std::string endpoint, int timeout_ms);

  ZmqNarrator(const ZmqNarrator&) = delete;
  ZmqNarrator& operator=(const ZmqNarrator&) = delete;

  domain::CustomerMessage composeMessage(
      const DecisionContext& context) override;

  CounterProposal proposeCounter(const NegotiationContext& context) override;

  const std::string& endpoint() const { return endpoint_; }

  // Reply parsers, exposed for tests. @throws CollaboratorError.
  static domain::CustomerMessage parseMessageReply(const nlohmann::json& reply);
  static CounterProposal parseCounterReply(const nlohmann::json& reply);

 private:
  // Sends request, returns the parsed reply. @throws CollaboratorError.
  nlohmann::json exchange(const nlohmann::json& request);

  std::string endpoint_;
  int timeout_ms_;
  zmq::context_t context_{1};
};

}  // namespace credit
