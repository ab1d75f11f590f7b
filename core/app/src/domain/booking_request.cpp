#include "credit/domain/booking_request.hpp"
#include "credit/domain/errors.hpp"

#include <cmath>
#include <utility>

namespace credit {
namespace domain {

// -----------------------------------------------------------------------------
// create(): reject malformed requests before they reach the gate
// -----------------------------------------------------------------------------
BookingRequest BookingRequest::create(std::string company_id,
                                      std::string company_name,
                                      double booking_amount,
                                      double current_outstanding,
                                      double credit_limit,
                                      std::string route,
                                      std::string booking_date) {
  BookingRequest request;
  request.company_id = std::move(company_id);
  request.company_name = std::move(company_name);
  request.booking_amount = booking_amount;
  request.current_outstanding = current_outstanding;
  request.credit_limit = credit_limit;
  request.route = std::move(route);
  request.booking_date = std::move(booking_date);
  request.validate();
  return request;
}

// -----------------------------------------------------------------------------
// validate()
// -----------------------------------------------------------------------------
void BookingRequest::validate() const {
  if (company_id.empty()) {
    throw InvalidInputError("booking request: company_id is required");
  }
  if (!std::isfinite(booking_amount) || booking_amount <= 0.0) {
    throw InvalidInputError(
        "booking request: booking_amount must be a positive amount");
  }
  if (!std::isfinite(current_outstanding) || current_outstanding < 0.0) {
    throw InvalidInputError(
        "booking request: current_outstanding must be >= 0");
  }
  if (!std::isfinite(credit_limit) || credit_limit < 0.0) {
    throw InvalidInputError("booking request: credit_limit must be >= 0");
  }
}

}  // namespace domain
}  // namespace credit
