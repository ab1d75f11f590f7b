#include "credit/domain/credit_option.hpp"

namespace credit {
namespace domain {

// -----------------------------------------------------------------------------
// optionKindToString()
// -----------------------------------------------------------------------------
const char* optionKindToString(OptionKind kind) {
  switch (kind) {
    case OptionKind::ShortenedSettlement: return "shortened_settlement";
    case OptionKind::UpfrontPayment:      return "upfront_payment";
    case OptionKind::PartialApproval:     return "partial_approval";
  }
  return "unknown";
}

}  // namespace domain
}  // namespace credit
