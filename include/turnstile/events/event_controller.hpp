#pragma once
#include <turnstile/events/capacity_gate.hpp>
#include <turnstile/events/collaborators.hpp>
#include <turnstile/ledger/backend.hpp>
#include <turnstile/ledger/transfer_engine.hpp>
#include <turnstile/schema/broadcast_attribute.hpp>
#include <turnstile/schema/event_attendance.hpp>
#include <turnstile/schema/event_draft.hpp>
#include <turnstile/schema/event_state.hpp>
#include <turnstile/schema/event_stats.hpp>
#include <turnstile/schema/event_status.hpp>
#include <turnstile/schema/event_ticket.hpp>
#include <turnstile/schema/event_tip.hpp>
#include <turnstile/schema/operation_result.hpp>
#include <turnstile/schema/primitives.hpp>

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace turnstile::events {

/// Filters for list_events. Results come back in scheduled start order,
/// earliest first; a limit of zero returns every match.
struct event_query final {
  std::optional<turnstile::schema::event_status_t> status;
  std::optional<turnstile::schema::user_id_t> creator_id;
  std::size_t limit{};
};

/// Event lifecycle state machine and the money flows it gates.
///
/// scheduled -> live -> ended, scheduled|live -> cancelled. Each business
/// action (purchase, tip, join, lifecycle move) is one storage transaction
/// that locks keys in the global order event, ticket, attendance, wallets
/// (ascending user id). Broadcasts go out only after that transaction
/// commits.
class event_controller final {
 public:
  event_controller(turnstile::ledger::encoder_t& encoder,
                   turnstile::ledger::storage_t& storage,
                   turnstile::ledger::transfer_engine& transfers,
                   capacity_gate& gate,
                   broadcaster_t broadcaster = {},
                   entitlement_checker_t entitlement_checker = {});

  /// Create a scheduled event and open the creator's wallet if needed.
  turnstile::schema::operation_result<turnstile::schema::event_state_t>
  create_event(const turnstile::schema::user_id_t& creator_id,
               const turnstile::schema::event_draft_t& draft);

  turnstile::schema::operation_result<turnstile::schema::event_state_t>
  start_event(const turnstile::schema::event_id_t& event_id,
              const turnstile::schema::user_id_t& creator_id);

  /// Move live -> ended and close every open attendance.
  turnstile::schema::operation_result<turnstile::schema::event_state_t>
  end_event(const turnstile::schema::event_id_t& event_id,
            const turnstile::schema::user_id_t& creator_id);

  /// Cancel and refund every unrefunded ticket, one transaction per ticket.
  ///
  /// Safe to call again after refund_cascade_incomplete: refunded tickets
  /// are skipped and the cascade resumes where it stopped. Revenue is reset
  /// only once every ticket has been refunded.
  turnstile::schema::operation_result<turnstile::schema::event_state_t>
  cancel_event(const turnstile::schema::event_id_t& event_id,
               const turnstile::schema::user_id_t& creator_id);

  turnstile::schema::operation_result<turnstile::schema::event_ticket_t>
  purchase_ticket(const turnstile::schema::event_id_t& event_id,
                  const turnstile::schema::user_id_t& fan_id,
                  turnstile::schema::cents_t price_cents);

  turnstile::schema::operation_result<turnstile::schema::event_tip_t> send_tip(
      const turnstile::schema::event_id_t& event_id,
      const turnstile::schema::user_id_t& from_user_id,
      const turnstile::schema::user_id_t& to_user_id,
      turnstile::schema::cents_t amount_cents,
      const std::optional<std::string>& message,
      bool is_anonymous);

  /// Idempotent while the attendance is already active.
  turnstile::schema::operation_result<turnstile::schema::event_attendance_t>
  join_event(const turnstile::schema::event_id_t& event_id,
             const turnstile::schema::user_id_t& user_id);

  turnstile::schema::operation_result<turnstile::schema::event_attendance_t>
  leave_event(const turnstile::schema::event_id_t& event_id,
              const turnstile::schema::user_id_t& user_id);

  std::optional<turnstile::schema::event_state_t> get_event(
      const turnstile::schema::event_id_t& event_id) const;

  std::vector<turnstile::schema::event_state_t> list_events(
      const event_query& query = {}) const;

  std::optional<turnstile::schema::event_ticket_t> get_ticket(
      const turnstile::schema::event_id_t& event_id,
      const turnstile::schema::user_id_t& fan_id) const;

  std::vector<turnstile::schema::event_ticket_t> list_tickets(
      const turnstile::schema::event_id_t& event_id) const;

  /// Newest first. A limit of zero returns every tip.
  std::vector<turnstile::schema::event_tip_t> event_tips(
      const turnstile::schema::event_id_t& event_id,
      std::size_t limit) const;

  std::vector<turnstile::schema::event_attendance_t> active_attendees(
      const turnstile::schema::event_id_t& event_id) const;

  std::optional<turnstile::schema::event_stats_t> event_stats(
      const turnstile::schema::event_id_t& event_id) const;

  void set_broadcaster(broadcaster_t broadcaster);
  void set_entitlement_checker(entitlement_checker_t checker);

 private:
  /// Refund one ticket in its own transaction. Already refunded tickets are
  /// returned unchanged.
  turnstile::schema::operation_result<turnstile::schema::event_ticket_t>
  refund_ticket(const turnstile::schema::event_state_t& event,
                const turnstile::schema::user_id_t& fan_id);

  /// Lock the event and check that caller is its creator.
  turnstile::schema::operation_result<turnstile::schema::event_state_t>
  lock_owned_event(turnstile::ledger::transaction_t& txn,
                   const turnstile::schema::event_id_t& event_id,
                   const turnstile::schema::user_id_t& creator_id) const;

  bool has_access(turnstile::ledger::transaction_t& txn,
                  const turnstile::schema::event_state_t& event,
                  const turnstile::schema::user_id_t& user_id) const;

  void publish(const turnstile::schema::event_id_t& event_id,
               std::string_view type,
               std::vector<turnstile::schema::broadcast_attribute_t>
                   attributes) const;

  turnstile::ledger::encoder_t& encoder_;
  turnstile::ledger::storage_t& storage_;
  turnstile::ledger::transfer_engine& transfers_;
  capacity_gate& gate_;
  broadcaster_t broadcaster_;
  entitlement_checker_t entitlement_checker_;
};

}  // namespace turnstile::events
