#include <turnstile/events/capacity_gate.hpp>
#include <turnstile/schema/event_ticket.hpp>
#include <turnstile/schema/key/engine_keys.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <utility>

namespace turnstile::events {

using turnstile::schema::ledger_error_code;

capacity_gate::capacity_gate(turnstile::ledger::encoder_t& encoder)
    : encoder_{encoder} {}

turnstile::schema::operation_result<turnstile::schema::event_state_t>
capacity_gate::lock_event(turnstile::ledger::transaction_t& txn,
                          const turnstile::schema::event_id_t& event_id) const {
  auto key = turnstile::schema::key::make_event_key(event_id);
  auto locked = txn.get_for_update<turnstile::schema::event_state_t>(encoder_, key);
  if (locked.contended()) {
    spdlog::warn("Storage contention while locking event {}",
                 turnstile::schema::to_hex(event_id));
    return turnstile::schema::make_failure<turnstile::schema::event_state_t>(
        ledger_error_code::storage_contention,
        "storage contention while locking event",
        turnstile::schema::kEventCodespace);
  }
  if (!locked.value.has_value()) {
    return turnstile::schema::make_failure<turnstile::schema::event_state_t>(
        ledger_error_code::event_not_found,
        fmt::format("event {} not found", turnstile::schema::to_hex(event_id)),
        turnstile::schema::kEventCodespace);
  }
  return turnstile::schema::make_success(std::move(locked.value.value()));
}

turnstile::schema::operation_result<slot_grant> capacity_gate::reserve_slot(
    turnstile::ledger::transaction_t& txn,
    const turnstile::schema::event_id_t& event_id) const {
  auto locked = lock_event(txn, event_id);
  if (!locked.ok()) {
    return turnstile::schema::forward_failure<slot_grant>(locked);
  }

  auto grant = slot_grant{};
  grant.event = std::move(locked.value.value());
  grant.active_tickets = count_active_tickets(txn, event_id);
  if (grant.event.max_attendees.has_value() &&
      grant.active_tickets >= grant.event.max_attendees.value()) {
    spdlog::debug("Event {} is sold out at {} ticket(s)",
                  turnstile::schema::to_hex(event_id), grant.active_tickets);
    return turnstile::schema::make_failure<slot_grant>(
        ledger_error_code::sold_out,
        fmt::format("event sold out ({} of {} seats taken)",
                    grant.active_tickets, grant.event.max_attendees.value()),
        turnstile::schema::kEventCodespace);
  }
  return turnstile::schema::make_success(std::move(grant));
}

uint64_t capacity_gate::count_active_tickets(
    turnstile::ledger::transaction_t& txn,
    const turnstile::schema::event_id_t& event_id) const {
  auto active = uint64_t{};
  auto prefix = turnstile::schema::key::make_ticket_prefix(event_id);
  for (const auto& [key, value] : txn.list_by_prefix(prefix)) {
    auto ticket = encoder_.decode<turnstile::schema::event_ticket_t>(value);
    if (turnstile::schema::is_active(ticket)) {
      ++active;
    }
  }
  return active;
}

}  // namespace turnstile::events
