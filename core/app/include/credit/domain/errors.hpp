#pragma once

#include <stdexcept>
#include <string>

namespace credit {

// -----------------------------------------------------------------------------
// Error taxonomy
// -----------------------------------------------------------------------------
//
// @brief  Exception types thrown by the engine. Each type maps to one class
//         of failure and tells the caller how it is handled.
//
// @details
//   InvalidInputError: malformed booking request or score set. Thrown by
//     the value-type factories before anything reaches
//     the Risk Gate. Reported to the caller verbatim.
//
//   ConfigError: unreadable or out-of-range configuration. Fatal at
//     startup; the engine never runs on a partial config.
//
//   CollaboratorError: the Scorer or Narrator failed (unknown company,
//     timeout, malformed reply). Always caught inside the
//     engine and replaced by fallback data or templates.
//
//   SessionError: a negotiation call named a session id the store
//     does not hold (never created, or already reset).
//
// Policy outcomes (no options possible, failed validation, escalation) are
// NOT exceptions. They are ordinary values carried in DecisionRecord and
// NegotiationResult.
// -----------------------------------------------------------------------------
class InvalidInputError : public std::invalid_argument {
 public:
  explicit InvalidInputError(const std::string& what)
      : std::invalid_argument(what) {}
};

class ConfigError : public std::runtime_error {
 public:
  explicit ConfigError(const std::string& what) : std::runtime_error(what) {}
};

class CollaboratorError : public std::runtime_error {
 public:
  explicit CollaboratorError(const std::string& what)
      : std::runtime_error(what) {}
};

class SessionError : public std::runtime_error {
 public:
  explicit SessionError(const std::string& what) : std::runtime_error(what) {}
};

}  // namespace credit
