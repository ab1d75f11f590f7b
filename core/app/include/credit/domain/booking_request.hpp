#pragma once

#include <string>

namespace credit {
namespace domain {

// -----------------------------------------------------------------------------
// BookingRequest: one customer's proposed transaction
// -----------------------------------------------------------------------------
//
// @brief  Identifies the company asking for credit and the booking it wants
//         to put on account.
//
// @details
// Instances should be produced by create(), which validates every field and
// throws InvalidInputError on the first problem found. The orchestrator
// calls validate() again on entry, so a hand-filled request is held to the
// same rules. After creation the
// request is treated as immutable: the orchestrator, the generator and the
// negotiation engine all receive it by const reference or copy it into a
// session.
//
// Amount rules:
//   booking_amount       finite and > 0
//   current_outstanding  finite and >= 0
//   credit_limit         finite and >= 0
//
// credit_limit is carried for messaging (how far the booking overshoots the
// available line). It does not enter the expected-loss arithmetic.
//
// Thread model:
//   Plain value type; safe to copy between threads.
// -----------------------------------------------------------------------------
struct BookingRequest {
  std::string company_id;
  std::string company_name;
  double booking_amount{0.0};
  double current_outstanding{0.0};
  double credit_limit{0.0};
  std::string route;
  std::string booking_date;  // ISO date, e.g. "2026-02-15"

  // -------------------------------------------------------------------------
  // create(...)
  // -------------------------------------------------------------------------
  // @brief  Validating factory.
  //
  // @throws InvalidInputError  empty company_id, non-finite amounts,
  //                            booking_amount <= 0, negative outstanding or
  //                            credit limit.
  // -------------------------------------------------------------------------
  static BookingRequest create(std::string company_id,
                               std::string company_name,
                               double booking_amount,
                               double current_outstanding,
                               double credit_limit,
                               std::string route,
                               std::string booking_date);

  // Re-checks the create() rules on an already built request. Entry points
  // call this because the struct can also be filled in field by field.
  //
  // @throws InvalidInputError  same conditions as create().
  void validate() const;
};

}  // namespace domain
}  // namespace credit
