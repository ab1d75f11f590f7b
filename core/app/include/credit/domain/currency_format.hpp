#pragma once

#include <cmath>
#include <cstdint>
#include <string>

namespace credit {

// -----------------------------------------------------------------------------
// Currency formatting
// -----------------------------------------------------------------------------
//
// @brief  Renders currency amounts for option descriptions, validator
//         violations and customer messages.
//
// @details
// Amounts are grouped in thousands with ',' and prefixed with the rupee
// sign, e.g. formatCurrency(47381.0, 0) == "₹47,381" and
// formatCurrency(5100.0, 2) == "₹5,100.00". Rounding is half away from
// zero at the requested number of decimals (0 or 2 are the only values
// used).
//
// NaN and infinities render as "non-finite", and magnitudes too large for
// a 64-bit count of cents as "out-of-range", so a violation message about a
// broken amount stays readable instead of printing an arbitrary number.
//
// Inline because it is small and has no dependencies beyond <string>.
//
// Thread-safety: Stateless.
// -----------------------------------------------------------------------------
inline std::string formatCurrency(double amount, int decimals) {
  if (!std::isfinite(amount)) {
    return "non-finite";
  }
  const double scale = decimals == 2 ? 100.0 : 1.0;
  if (std::fabs(amount) * scale >= 9.0e18) {
    return "out-of-range";
  }
  const bool negative = amount < 0.0;
  const auto scaled =
      static_cast<std::int64_t>(std::llround(std::fabs(amount) * scale));

  const std::int64_t whole = decimals == 2 ? scaled / 100 : scaled;
  std::string digits = std::to_string(whole);

  std::string grouped;
  const int len = static_cast<int>(digits.size());
  for (int i = 0; i < len; ++i) {
    if (i > 0 && (len - i) % 3 == 0) {
      grouped += ',';
    }
    grouped += digits[static_cast<std::size_t>(i)];
  }

  if (decimals == 2) {
    const std::int64_t cents = scaled % 100;
    grouped += '.';
    if (cents < 10) {
      grouped += '0';
    }
    grouped += std::to_string(cents);
  }

  return std::string(negative ? "-" : "") + "₹" + grouped;
}

}  // namespace credit
