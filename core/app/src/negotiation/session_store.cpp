#include "credit/negotiation/session_store.hpp"
#include "credit/domain/errors.hpp"

#include <iostream>
#include <string>

namespace credit {

SessionStore::SessionStore(const ITimeProvider& clock) : clock_(clock) {}

domain::SessionId SessionStore::create(
    const domain::BookingRequest& booking, const domain::RiskScores& scores,
    std::vector<domain::CreditOption> initial_options) {
  auto slot = std::make_shared<Slot>();
  auto& session = slot->session;
  session.id = id_gen_.next_id();
  session.booking = booking;
  session.scores = scores;
  session.initial_options = std::move(initial_options);
  session.last_activity_ms = clock_.now_ms();

  const domain::SessionId id = session.id;
  {
    std::unique_lock lock(map_mutex_);
    sessions_.emplace(id, std::move(slot));
  }

  std::cout << "[SessionStore] opened session " << id << " for "
            << booking.company_id << "\n";
  return id;
}

// -----------------------------------------------------------------------------
// advance(): look up under the shared lock, run the round under the slot lock
// -----------------------------------------------------------------------------
domain::NegotiationResult SessionStore::advance(domain::SessionId id,
                                                const RoundFn& round) {
  std::shared_ptr<Slot> slot = find(id);
  if (!slot) {
    throw SessionError("unknown negotiation session " + std::to_string(id));
  }

  std::lock_guard lock(slot->mutex);
  domain::NegotiationResult result = round(slot->session);
  slot->session.last_activity_ms = clock_.now_ms();
  return result;
}

void SessionStore::reset(domain::SessionId id) {
  std::size_t erased = 0;
  {
    std::unique_lock lock(map_mutex_);
    erased = sessions_.erase(id);
  }
  if (erased == 0) {
    throw SessionError("unknown negotiation session " + std::to_string(id));
  }
  std::cout << "[SessionStore] reset session " << id << "\n";
}

// -----------------------------------------------------------------------------
// purgeIdle(): skip busy slots, drop the rest if older than the cutoff
// -----------------------------------------------------------------------------
std::size_t SessionStore::purgeIdle(std::int64_t max_idle_ms) {
  const std::int64_t now = clock_.now_ms();
  std::size_t removed = 0;

  std::unique_lock lock(map_mutex_);
  for (auto it = sessions_.begin(); it != sessions_.end();) {
    std::shared_ptr<Slot> slot = it->second;
    std::unique_lock slot_lock(slot->mutex, std::try_to_lock);
    if (slot_lock.owns_lock() &&
        now - slot->session.last_activity_ms > max_idle_ms) {
      it = sessions_.erase(it);
      ++removed;
    } else {
      ++it;
    }
  }

  if (removed > 0) {
    std::cout << "[SessionStore] purged " << removed << " idle session(s)\n";
  }
  return removed;
}

std::optional<domain::NegotiationSession> SessionStore::snapshot(
    domain::SessionId id) const {
  std::shared_ptr<Slot> slot = find(id);
  if (!slot) {
    return std::nullopt;
  }
  std::lock_guard lock(slot->mutex);
  return slot->session;
}

bool SessionStore::contains(domain::SessionId id) const {
  std::shared_lock lock(map_mutex_);
  return sessions_.count(id) != 0;
}

std::size_t SessionStore::size() const {
  std::shared_lock lock(map_mutex_);
  return sessions_.size();
}

std::shared_ptr<SessionStore::Slot> SessionStore::find(
    domain::SessionId id) const {
  std::shared_lock lock(map_mutex_);
  auto it = sessions_.find(id);
  if (it == sessions_.end()) {
    return nullptr;
  }
  return it->second;
}

}  // namespace credit
