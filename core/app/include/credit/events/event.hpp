#pragma once

#include "credit/events/event_types.hpp"
#include "credit/events/negotiation_events.hpp"

#include <variant>

namespace credit {

// -----------------------------------------------------------------------------
// Event
// -----------------------------------------------------------------------------
// The single envelope carried by EventBus. A variant keeps value semantics
// and lets subscribers dispatch with std::get_if or std::visit; adding a new
// event kind means adding it here.
// -----------------------------------------------------------------------------
using Event = std::variant<
    DecisionEvent,
    NegotiationRoundEvent,
    EscalationEvent>;

// Short name of the held alternative, for log lines.
inline const char* eventName(const Event& event) {
  switch (event.index()) {
    case 0: return "decision";
    case 1: return "negotiation_round";
    case 2: return "escalation";
    default: return "unknown";
  }
}

}  // namespace credit
