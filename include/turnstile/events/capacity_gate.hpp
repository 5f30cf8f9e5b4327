#pragma once
#include <turnstile/ledger/backend.hpp>
#include <turnstile/schema/event_state.hpp>
#include <turnstile/schema/operation_result.hpp>
#include <turnstile/schema/primitives.hpp>

#include <cstdint>

namespace turnstile::events {

/// Seat admitted by the gate. The event row stays locked until the enclosing
/// transaction ends.
struct slot_grant final {
  turnstile::schema::event_state_t event;
  uint64_t active_tickets{};
};

/// Serialization point for seat sales.
///
/// The event key is the mutex: whoever holds its lock is the only one who may
/// count tickets and add one, so concurrent buyers cannot oversell.
class capacity_gate final {
 public:
  explicit capacity_gate(turnstile::ledger::encoder_t& encoder);

  /// Take the event lock and return the event as seen under it.
  turnstile::schema::operation_result<turnstile::schema::event_state_t>
  lock_event(turnstile::ledger::transaction_t& txn,
             const turnstile::schema::event_id_t& event_id) const;

  /// Lock the event and admit one more ticket holder if a seat is free.
  turnstile::schema::operation_result<slot_grant> reserve_slot(
      turnstile::ledger::transaction_t& txn,
      const turnstile::schema::event_id_t& event_id) const;

  /// Tickets with no refund stamp, seen through txn.
  uint64_t count_active_tickets(
      turnstile::ledger::transaction_t& txn,
      const turnstile::schema::event_id_t& event_id) const;

 private:
  turnstile::ledger::encoder_t& encoder_;
};

}  // namespace turnstile::events
