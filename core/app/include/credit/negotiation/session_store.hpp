#pragma once

#include "credit/concurrent/session_id_generator.hpp"
#include "credit/domain/negotiation.hpp"
#include "credit/time/i_time_provider.hpp"

#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <unordered_map>
#include <vector>

namespace credit {

// -----------------------------------------------------------------------------
// SessionStore
// -----------------------------------------------------------------------------
//
// @brief  Owns every live NegotiationSession and serializes rounds per
//         session.
//
// @details
// Sessions are kept in a map guarded by a std::shared_mutex. Each entry is a
// heap-allocated slot carrying its own std::mutex:
//
//   map lock (shared)   held only long enough to find the slot
//   map lock (unique)   create, reset and purge
//   slot lock           held for the whole of one negotiation round
//
// Two rounds on the same session therefore run one after the other, while
// rounds on different sessions never contend beyond the brief shared map
// lookup. Slots are reference counted, so a slot found by advance() stays
// alive even if reset() removes it from the map concurrently; the round
// completes on the detached session and its result is discarded with it.
//
// Thread model:
//   All public methods are safe from any thread.
//
// Ownership:
//   The store owns the sessions. Callers only see them through the
//   callback passed to advance() or through copies from snapshot().
// -----------------------------------------------------------------------------
class SessionStore {
 public:
  using RoundFn =
      std::function<domain::NegotiationResult(domain::NegotiationSession&)>;

  explicit SessionStore(const ITimeProvider& clock);

  SessionStore(const SessionStore&) = delete;
  SessionStore& operator=(const SessionStore&) = delete;

  // -------------------------------------------------------------------------
  // create(booking, scores, initial_options)
  // -------------------------------------------------------------------------
  // @brief  Opens a session in state Open, round 1, and returns its id.
  // -------------------------------------------------------------------------
  domain::SessionId create(const domain::BookingRequest& booking,
                           const domain::RiskScores& scores,
                           std::vector<domain::CreditOption> initial_options);

  // -------------------------------------------------------------------------
  // advance(id, round)
  // -------------------------------------------------------------------------
  //
  // @brief  Runs round against the session while holding its lock.
  //
  // @details
  // last_activity_ms is refreshed after round returns. Exceptions thrown by
  // round propagate unchanged; the session keeps whatever state round left
  // it in.
  //
  // @throws SessionError if id is unknown.
  // -------------------------------------------------------------------------
  domain::NegotiationResult advance(domain::SessionId id, const RoundFn& round);

  // -------------------------------------------------------------------------
  // reset(id)
  // -------------------------------------------------------------------------
  // @brief  Removes the session. Its id is never reissued.
  // @throws SessionError if id is unknown.
  // -------------------------------------------------------------------------
  void reset(domain::SessionId id);

  // -------------------------------------------------------------------------
  // purgeIdle(max_idle_ms)
  // -------------------------------------------------------------------------
  //
  // @brief  Removes sessions whose last activity is more than max_idle_ms
  //         before now.
  //
  // @details
  // A session with a round in progress is skipped, whatever its age.
  //
  // @return Number of sessions removed.
  // -------------------------------------------------------------------------
  std::size_t purgeIdle(std::int64_t max_idle_ms);

  // Copy of the session state, or nullopt if id is unknown. Waits for an
  // in-flight round on that session to finish.
  std::optional<domain::NegotiationSession> snapshot(domain::SessionId id) const;

  bool contains(domain::SessionId id) const;
  std::size_t size() const;

 private:
  struct Slot {
    std::mutex mutex;
    domain::NegotiationSession session;
  };

  std::shared_ptr<Slot> find(domain::SessionId id) const;

  const ITimeProvider& clock_;
  SessionIdGenerator id_gen_;

  mutable std::shared_mutex map_mutex_;
  std::unordered_map<domain::SessionId, std::shared_ptr<Slot>> sessions_;
};

}  // namespace credit
