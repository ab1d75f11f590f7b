#include "credit/domain/decision_record.hpp"

namespace credit {
namespace domain {

const char* decisionToString(Decision decision) {
  switch (decision) {
    case Decision::Approved:  return "APPROVED";
    case Decision::Blocked:   return "BLOCKED";
    case Decision::Negotiate: return "NEGOTIATE";
  }
  return "UNKNOWN";
}

}  // namespace domain
}  // namespace credit
