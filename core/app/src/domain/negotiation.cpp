#include "credit/domain/negotiation.hpp"

namespace credit {
namespace domain {

const char* negotiationStateToString(NegotiationState state) {
  switch (state) {
    case NegotiationState::Open:      return "open";
    case NegotiationState::Resolved:  return "resolved";
    case NegotiationState::Escalated: return "escalated";
  }
  return "unknown";
}

const char* offerSourceToString(OfferSource source) {
  switch (source) {
    case OfferSource::Narrator:   return "narrator";
    case OfferSource::Fallback:   return "fallback";
    case OfferSource::Escalation: return "escalation";
  }
  return "unknown";
}

}  // namespace domain
}  // namespace credit
