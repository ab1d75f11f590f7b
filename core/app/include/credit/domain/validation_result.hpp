#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace credit {
namespace domain {

// Outcome of ComplianceValidator::validate(). compliant is true exactly when
// violations is empty; violations are in option order, then check order.
struct ValidationResult {
  bool compliant{true};
  std::vector<std::string> violations;
  std::size_t options_count{0};
};

}  // namespace domain
}  // namespace credit
