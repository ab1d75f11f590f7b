#include "credit/narration/zmq_narrator.hpp"
#include "credit/domain/errors.hpp"
#include "credit/serialization/json_codec.hpp"

#include <chrono>
#include <iostream>
#include <utility>

namespace credit {

namespace {

nlohmann::json optionsToJson(const std::vector<domain::CreditOption>& options) {
  auto array = nlohmann::json::array();
  for (const auto& option : options) {
    array.push_back(toJson(option));
  }
  return array;
}

}  // namespace

ZmqNarrator::ZmqNarrator(std::string endpoint, int timeout_ms)
    : endpoint_(std::move(endpoint)), timeout_ms_(timeout_ms) {
  std::cout << "[ZmqNarrator] narration service at " << endpoint_
            << " (timeout " << timeout_ms_ << " ms)\n";
}

// -----------------------------------------------------------------------------
// composeMessage()
// -----------------------------------------------------------------------------
domain::CustomerMessage ZmqNarrator::composeMessage(
    const DecisionContext& context) {
  nlohmann::json request;
  request["type"] = "compose_message";
  request["booking"] = toJson(context.booking);
  request["scores"] = toJson(context.scores);
  request["financial_analysis"] = toJson(context.analysis);
  request["options"] = optionsToJson(context.options);
  request["max_expected_loss"] = context.max_expected_loss;

  return parseMessageReply(exchange(request));
}

// -----------------------------------------------------------------------------
// proposeCounter()
// -----------------------------------------------------------------------------
CounterProposal ZmqNarrator::proposeCounter(const NegotiationContext& context) {
  nlohmann::json request;
  request["type"] = "propose_counter";
  request["booking"] = toJson(context.booking);
  request["scores"] = toJson(context.scores);
  request["initial_options"] = optionsToJson(context.initial_options);

  auto transcript = nlohmann::json::array();
  for (const auto& turn : context.transcript) {
    transcript.push_back({{"role", turn.role}, {"text", turn.text}});
  }
  request["transcript"] = std::move(transcript);
  request["customer_message"] = context.customer_message;
  request["round_number"] = context.round_number;
  request["max_expected_loss"] = context.max_expected_loss;
  request["lgd"] = context.lgd;

  return parseCounterReply(exchange(request));
}

// -----------------------------------------------------------------------------
// exchange(): one REQ/REP round trip on a fresh socket
// -----------------------------------------------------------------------------
nlohmann::json ZmqNarrator::exchange(const nlohmann::json& request) {
  const std::string payload = request.dump();

  // One budget for the whole exchange: the receive gets what the send left.
  const auto deadline = std::chrono::steady_clock::now() +
                        std::chrono::milliseconds(timeout_ms_);

  try {
    zmq::socket_t socket(context_, zmq::socket_type::req);
    socket.set(zmq::sockopt::linger, 0);
    socket.set(zmq::sockopt::sndtimeo, timeout_ms_);
    socket.connect(endpoint_);

    zmq::message_t out(payload.data(), payload.size());
    if (!socket.send(out, zmq::send_flags::none)) {
      throw CollaboratorError("ZmqNarrator: send timed out on " + endpoint_);
    }

    const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now());
    if (remaining.count() <= 0) {
      throw CollaboratorError("ZmqNarrator: no time left to wait for " +
                              endpoint_);
    }
    socket.set(zmq::sockopt::rcvtimeo, static_cast<int>(remaining.count()));

    zmq::message_t reply;
    zmq::recv_result_t result = socket.recv(reply, zmq::recv_flags::none);
    if (!result.has_value()) {
      throw CollaboratorError("ZmqNarrator: no reply within " +
                              std::to_string(timeout_ms_) + " ms from " +
                              endpoint_);
    }

    return nlohmann::json::parse(
        std::string(static_cast<const char*>(reply.data()), reply.size()));
  } catch (const zmq::error_t& e) {
    throw CollaboratorError(std::string("ZmqNarrator: ") + e.what());
  } catch (const nlohmann::json::parse_error& e) {
    throw CollaboratorError(std::string("ZmqNarrator: malformed reply: ") +
                            e.what());
  }
}

// -----------------------------------------------------------------------------
// parseMessageReply(): {"subject", "body", "cta_buttons"}
// -----------------------------------------------------------------------------
domain::CustomerMessage ZmqNarrator::parseMessageReply(
    const nlohmann::json& reply) {
  try {
    domain::CustomerMessage message;
    message.subject = reply.at("subject").get<std::string>();
    message.body = reply.at("body").get<std::string>();
    message.call_to_action_labels =
        reply.at("cta_buttons").get<std::vector<std::string>>();
    if (message.body.empty()) {
      throw CollaboratorError("ZmqNarrator: empty message body");
    }
    return message;
  } catch (const nlohmann::json::exception& e) {
    throw CollaboratorError(std::string("ZmqNarrator: bad message reply: ") +
                            e.what());
  }
}

// -----------------------------------------------------------------------------
// parseCounterReply(): {"response", "offer", "escalate"}
// -----------------------------------------------------------------------------
CounterProposal ZmqNarrator::parseCounterReply(const nlohmann::json& reply) {
  try {
    CounterProposal proposal;
    proposal.response_text = reply.at("response").get<std::string>();
    proposal.escalate_hint = reply.value("escalate", false);

    if (auto it = reply.find("offer"); it != reply.end() && !it->is_null()) {
      proposal.offer = counterOfferFromJson(*it);
    }
    return proposal;
  } catch (const nlohmann::json::exception& e) {
    throw CollaboratorError(std::string("ZmqNarrator: bad counter reply: ") +
                            e.what());
  } catch (const InvalidInputError& e) {
    throw CollaboratorError(std::string("ZmqNarrator: bad counter offer: ") +
                            e.what());
  }
}

}  // namespace credit
