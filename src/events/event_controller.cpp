#include <turnstile/events/event_controller.hpp>
#include <turnstile/schema/key/engine_keys.hpp>
#include <turnstile/schema/ledger_metadata.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <exception>
#include <utility>

namespace turnstile::events {

namespace {

using turnstile::schema::ledger_error_code;
using turnstile::storage::storage_status;

constexpr auto kEventIdDomain = std::string_view{"turnstile.event.v1"};
constexpr auto kTicketIdDomain = std::string_view{"turnstile.ticket.v1"};
constexpr auto kTipIdDomain = std::string_view{"turnstile.tip.v1"};

template <typename T>
turnstile::schema::operation_result<T> rejected(const ledger_error_code code,
                                                std::string log) {
  spdlog::debug("Event operation rejected ({}): {}",
                turnstile::schema::to_string(code), log);
  return turnstile::schema::make_failure<T>(
      code, std::move(log), turnstile::schema::kEventCodespace);
}

template <typename T>
turnstile::schema::operation_result<T> contended(const std::string_view what) {
  spdlog::warn("Storage contention while {}", what);
  return turnstile::schema::make_failure<T>(
      ledger_error_code::storage_contention,
      fmt::format("storage contention while {}", what),
      turnstile::schema::kEventCodespace);
}

turnstile::schema::broadcast_attribute_t attribute(std::string key,
                                                   std::string value) {
  auto result = turnstile::schema::broadcast_attribute_t{};
  result.key = std::move(key);
  result.value = std::move(value);
  return result;
}

uint64_t elapsed_seconds(const turnstile::schema::timestamp_milliseconds_t from,
                         const turnstile::schema::timestamp_milliseconds_t to) {
  return to > from ? (to - from) / 1000 : 0;
}

bool is_purchasable(const turnstile::schema::event_state_t& event) {
  return event.access_type == turnstile::schema::access_type_t::ticketed &&
         (event.status == turnstile::schema::event_status_t::scheduled ||
          event.status == turnstile::schema::event_status_t::live);
}

}  // namespace

event_controller::event_controller(turnstile::ledger::encoder_t& encoder,
                                   turnstile::ledger::storage_t& storage,
                                   turnstile::ledger::transfer_engine& transfers,
                                   capacity_gate& gate,
                                   broadcaster_t broadcaster,
                                   entitlement_checker_t entitlement_checker)
    : encoder_{encoder},
      storage_{storage},
      transfers_{transfers},
      gate_{gate},
      broadcaster_{std::move(broadcaster)},
      entitlement_checker_{std::move(entitlement_checker)} {}

turnstile::schema::operation_result<turnstile::schema::event_state_t>
event_controller::create_event(const turnstile::schema::user_id_t& creator_id,
                               const turnstile::schema::event_draft_t& draft) {
  using turnstile::schema::event_state_t;

  if (draft.access_type == turnstile::schema::access_type_t::ticketed &&
      draft.ticket_price_cents == 0) {
    return rejected<event_state_t>(ledger_error_code::invalid_amount,
                                   "ticketed events need a ticket price");
  }
  if (draft.max_attendees.has_value() && draft.max_attendees.value() == 0) {
    return rejected<event_state_t>(ledger_error_code::invalid_amount,
                                   "max_attendees must be positive");
  }

  const auto now = transfers_.now();
  auto event = event_state_t{};
  event.event_id = transfers_.ids().next(kEventIdDomain, creator_id, now);
  event.creator_id = creator_id;
  event.title = draft.title;
  event.access_type = draft.access_type;
  event.ticket_price_cents = draft.ticket_price_cents;
  event.max_attendees = draft.max_attendees;
  event.scheduled_start_at = draft.scheduled_start_at;

  auto txn = storage_.begin();
  if (txn.put(encoder_, turnstile::schema::key::make_event_key(event.event_id),
              event) != storage_status::ok) {
    return contended<event_state_t>("creating event");
  }
  auto creator_wallet = transfers_.wallets().open_wallet(
      txn, creator_id, transfers_.currency(), now);
  if (creator_wallet.contended()) {
    return contended<event_state_t>("opening creator wallet");
  }
  if (txn.commit() != storage_status::ok) {
    return contended<event_state_t>("committing event");
  }

  spdlog::info("Created event {} '{}' for creator {}",
               turnstile::schema::to_hex(event.event_id), event.title,
               turnstile::schema::to_hex(creator_id));
  return turnstile::schema::make_success(std::move(event));
}

turnstile::schema::operation_result<turnstile::schema::event_state_t>
event_controller::start_event(const turnstile::schema::event_id_t& event_id,
                              const turnstile::schema::user_id_t& creator_id) {
  using turnstile::schema::event_state_t;

  auto txn = storage_.begin();
  auto locked = lock_owned_event(txn, event_id, creator_id);
  if (!locked.ok()) {
    return locked;
  }
  auto event = std::move(locked.value.value());
  if (event.status != turnstile::schema::event_status_t::scheduled) {
    return rejected<event_state_t>(
        ledger_error_code::invalid_transition,
        fmt::format("cannot start an event that is {}",
                    turnstile::schema::to_string(event.status)));
  }

  event.status = turnstile::schema::event_status_t::live;
  event.actual_start_at = transfers_.now();
  if (txn.put(encoder_, turnstile::schema::key::make_event_key(event_id),
              event) != storage_status::ok ||
      txn.commit() != storage_status::ok) {
    return contended<event_state_t>("starting event");
  }

  spdlog::info("Event {} is live", turnstile::schema::to_hex(event_id));
  publish(event_id, "stream_update", {attribute("status", "live")});
  return turnstile::schema::make_success(std::move(event));
}

turnstile::schema::operation_result<turnstile::schema::event_state_t>
event_controller::end_event(const turnstile::schema::event_id_t& event_id,
                            const turnstile::schema::user_id_t& creator_id) {
  using turnstile::schema::event_state_t;

  auto txn = storage_.begin();
  auto locked = lock_owned_event(txn, event_id, creator_id);
  if (!locked.ok()) {
    return locked;
  }
  auto event = std::move(locked.value.value());
  if (event.status != turnstile::schema::event_status_t::live) {
    return rejected<event_state_t>(
        ledger_error_code::invalid_transition,
        fmt::format("cannot end an event that is {}",
                    turnstile::schema::to_string(event.status)));
  }

  const auto now = transfers_.now();
  event.status = turnstile::schema::event_status_t::ended;
  event.actual_end_at = now;

  auto closed = uint64_t{};
  auto prefix = turnstile::schema::key::make_attendance_prefix(event_id);
  for (const auto& [key, value] : txn.list_by_prefix(prefix)) {
    auto locked_attendance =
        txn.get_for_update<turnstile::schema::event_attendance_t>(encoder_,
                                                                  key);
    if (locked_attendance.contended()) {
      return contended<event_state_t>("closing attendance");
    }
    if (!locked_attendance.value.has_value() ||
        !locked_attendance.value->is_active) {
      continue;
    }
    auto attendance = std::move(locked_attendance.value.value());
    attendance.duration_seconds += elapsed_seconds(attendance.joined_at, now);
    attendance.left_at = now;
    attendance.is_active = false;
    if (txn.put(encoder_, key, attendance) != storage_status::ok) {
      return contended<event_state_t>("closing attendance");
    }
    ++closed;
  }

  if (txn.put(encoder_, turnstile::schema::key::make_event_key(event_id),
              event) != storage_status::ok ||
      txn.commit() != storage_status::ok) {
    return contended<event_state_t>("ending event");
  }

  spdlog::info("Event {} ended, closed {} attendance(s)",
               turnstile::schema::to_hex(event_id), closed);
  publish(event_id, "stream_update", {attribute("status", "ended")});
  return turnstile::schema::make_success(std::move(event));
}

turnstile::schema::operation_result<turnstile::schema::event_state_t>
event_controller::cancel_event(const turnstile::schema::event_id_t& event_id,
                               const turnstile::schema::user_id_t& creator_id) {
  using turnstile::schema::event_state_t;

  auto event = event_state_t{};
  {
    auto txn = storage_.begin();
    auto locked = lock_owned_event(txn, event_id, creator_id);
    if (!locked.ok()) {
      return locked;
    }
    event = std::move(locked.value.value());
    if (event.status == turnstile::schema::event_status_t::ended) {
      return rejected<event_state_t>(ledger_error_code::invalid_transition,
                                     "cannot cancel an event that has ended");
    }
    if (event.status != turnstile::schema::event_status_t::cancelled) {
      event.status = turnstile::schema::event_status_t::cancelled;
      if (txn.put(encoder_, turnstile::schema::key::make_event_key(event_id),
                  event) != storage_status::ok ||
          txn.commit() != storage_status::ok) {
        return contended<event_state_t>("cancelling event");
      }
      spdlog::info("Event {} cancelled", turnstile::schema::to_hex(event_id));
    }
  }

  auto refunded = uint64_t{};
  for (const auto& ticket : list_tickets(event_id)) {
    if (!turnstile::schema::is_active(ticket)) {
      continue;
    }
    auto refund = refund_ticket(event, ticket.fan_id);
    if (!refund.ok()) {
      spdlog::critical(
          "Refund cascade for event {} stopped at ticket {} after {} "
          "refund(s): {}",
          turnstile::schema::to_hex(event_id),
          turnstile::schema::to_hex(ticket.ticket_id), refunded, refund.log);
      return turnstile::schema::make_failure<event_state_t>(
          ledger_error_code::refund_cascade_incomplete,
          fmt::format("refund of ticket {} failed: {}",
                      turnstile::schema::to_hex(ticket.ticket_id), refund.log),
          turnstile::schema::kEventCodespace);
    }
    ++refunded;
  }

  {
    auto txn = storage_.begin();
    auto locked = gate_.lock_event(txn, event_id);
    if (!locked.ok()) {
      return locked;
    }
    event = std::move(locked.value.value());
    event.total_revenue_cents = 0;
    if (txn.put(encoder_, turnstile::schema::key::make_event_key(event_id),
                event) != storage_status::ok ||
        txn.commit() != storage_status::ok) {
      return contended<event_state_t>("resetting event revenue");
    }
  }

  spdlog::info("Event {} refund cascade complete, {} ticket(s) refunded",
               turnstile::schema::to_hex(event_id), refunded);
  publish(event_id, "stream_update",
          {attribute("status", "cancelled"),
           attribute("refunded_tickets", std::to_string(refunded))});
  return turnstile::schema::make_success(std::move(event));
}

turnstile::schema::operation_result<turnstile::schema::event_ticket_t>
event_controller::refund_ticket(const turnstile::schema::event_state_t& event,
                                const turnstile::schema::user_id_t& fan_id) {
  using turnstile::schema::event_ticket_t;

  auto txn = storage_.begin();
  auto key = turnstile::schema::key::make_ticket_key(event.event_id, fan_id);
  auto locked = txn.get_for_update<event_ticket_t>(encoder_, key);
  if (locked.contended()) {
    return contended<event_ticket_t>("locking ticket for refund");
  }
  if (!locked.value.has_value()) {
    return rejected<event_ticket_t>(ledger_error_code::integrity_error,
                                    "ticket vanished during refund cascade");
  }
  auto ticket = std::move(locked.value.value());
  if (!turnstile::schema::is_active(ticket)) {
    return turnstile::schema::make_success(std::move(ticket));
  }

  auto request = turnstile::schema::transfer_request_t{};
  request.from_user_id = event.creator_id;
  request.to_user_id = ticket.fan_id;
  request.amount = ticket.price_paid_cents;
  request.transaction_type = turnstile::schema::transaction_type_t::refund;
  request.reference_type = turnstile::schema::reference_type_t::event_refund;
  request.reference_id = ticket.ticket_id;
  request.debit_description = fmt::format("Refund for '{}'", event.title);
  request.credit_description = fmt::format("Refund for '{}'", event.title);
  auto metadata = turnstile::schema::refund_metadata_t{};
  metadata.event_id = event.event_id;
  metadata.ticket_id = ticket.ticket_id;
  metadata.fan_id = ticket.fan_id;
  metadata.original_transaction_id = ticket.transaction_id;
  request.metadata = metadata;

  auto staged = transfers_.stage(txn, request);
  if (!staged.ok()) {
    return turnstile::schema::forward_failure<event_ticket_t>(staged);
  }

  ticket.refunded_at = transfers_.now();
  ticket.refund_transaction_id = staged.value->transaction_id;
  if (txn.put(encoder_, key, ticket) != storage_status::ok ||
      txn.commit() != storage_status::ok) {
    return contended<event_ticket_t>("committing refund");
  }

  transfers_.notify_committed(staged.value.value());
  spdlog::debug("Refunded ticket {} ({} cents)",
                turnstile::schema::to_hex(ticket.ticket_id),
                ticket.price_paid_cents);
  return turnstile::schema::make_success(std::move(ticket));
}

turnstile::schema::operation_result<turnstile::schema::event_ticket_t>
event_controller::purchase_ticket(const turnstile::schema::event_id_t& event_id,
                                  const turnstile::schema::user_id_t& fan_id,
                                  const turnstile::schema::cents_t price_cents) {
  using turnstile::schema::event_ticket_t;

  auto txn = storage_.begin();
  auto locked = gate_.lock_event(txn, event_id);
  if (!locked.ok()) {
    return turnstile::schema::forward_failure<event_ticket_t>(locked);
  }
  const auto& event = locked.value.value();
  if (!is_purchasable(event)) {
    return rejected<event_ticket_t>(
        ledger_error_code::event_not_purchasable,
        fmt::format("tickets are not on sale for a {} {} event",
                    turnstile::schema::to_string(event.status),
                    turnstile::schema::to_string(event.access_type)));
  }
  if (price_cents < event.ticket_price_cents) {
    return rejected<event_ticket_t>(
        ledger_error_code::event_not_purchasable,
        fmt::format("offered {} cents, ticket price is {}", price_cents,
                    event.ticket_price_cents));
  }

  auto ticket_key = turnstile::schema::key::make_ticket_key(event_id, fan_id);
  auto existing = txn.get_for_update<event_ticket_t>(encoder_, ticket_key);
  if (existing.contended()) {
    return contended<event_ticket_t>("locking ticket");
  }
  if (existing.value.has_value()) {
    return rejected<event_ticket_t>(ledger_error_code::duplicate_ticket,
                                    "fan already holds a ticket for this event");
  }

  auto slot = gate_.reserve_slot(txn, event_id);
  if (!slot.ok()) {
    return turnstile::schema::forward_failure<event_ticket_t>(slot);
  }
  auto updated_event = std::move(slot.value->event);

  auto ticket = event_ticket_t{};
  ticket.ticket_id = transfers_.ids().next(kTicketIdDomain, event_id, fan_id);
  ticket.event_id = event_id;
  ticket.fan_id = fan_id;
  ticket.price_paid_cents = price_cents;

  auto request = turnstile::schema::transfer_request_t{};
  request.from_user_id = fan_id;
  request.to_user_id = updated_event.creator_id;
  request.amount = price_cents;
  request.transaction_type = turnstile::schema::transaction_type_t::payment;
  request.reference_type = turnstile::schema::reference_type_t::event_ticket;
  request.reference_id = ticket.ticket_id;
  request.debit_description =
      fmt::format("Ticket for '{}'", updated_event.title);
  request.credit_description =
      fmt::format("Ticket sale for '{}'", updated_event.title);
  auto metadata = turnstile::schema::ticket_sale_metadata_t{};
  metadata.event_id = event_id;
  metadata.ticket_id = ticket.ticket_id;
  metadata.fan_id = fan_id;
  metadata.creator_id = updated_event.creator_id;
  request.metadata = metadata;

  auto staged = transfers_.stage(txn, request);
  if (!staged.ok()) {
    return turnstile::schema::forward_failure<event_ticket_t>(staged);
  }

  ticket.transaction_id = staged.value->transaction_id;
  ticket.purchased_at = staged.value->credit.created_at;
  updated_event.total_revenue_cents += price_cents;
  if (txn.put(encoder_, ticket_key, ticket) != storage_status::ok ||
      txn.put(encoder_, turnstile::schema::key::make_event_key(event_id),
              updated_event) != storage_status::ok ||
      txn.commit() != storage_status::ok) {
    return contended<event_ticket_t>("committing ticket purchase");
  }

  transfers_.notify_committed(staged.value.value());
  spdlog::info("Sold ticket {} for event {} ({} cents)",
               turnstile::schema::to_hex(ticket.ticket_id),
               turnstile::schema::to_hex(event_id), price_cents);
  publish(event_id, "ticket_purchased",
          {attribute("ticket_id", turnstile::schema::to_hex(ticket.ticket_id)),
           attribute("fan_id", turnstile::schema::to_hex(fan_id)),
           attribute("tickets_sold",
                     std::to_string(slot.value->active_tickets + 1))});
  return turnstile::schema::make_success(std::move(ticket));
}

turnstile::schema::operation_result<turnstile::schema::event_tip_t>
event_controller::send_tip(const turnstile::schema::event_id_t& event_id,
                           const turnstile::schema::user_id_t& from_user_id,
                           const turnstile::schema::user_id_t& to_user_id,
                           const turnstile::schema::cents_t amount_cents,
                           const std::optional<std::string>& message,
                           const bool is_anonymous) {
  using turnstile::schema::event_tip_t;

  auto txn = storage_.begin();
  auto locked = gate_.lock_event(txn, event_id);
  if (!locked.ok()) {
    return turnstile::schema::forward_failure<event_tip_t>(locked);
  }
  auto event = std::move(locked.value.value());
  if (event.status != turnstile::schema::event_status_t::live) {
    return rejected<event_tip_t>(
        ledger_error_code::event_not_live,
        fmt::format("cannot tip during a {} event",
                    turnstile::schema::to_string(event.status)));
  }

  const auto now = transfers_.now();
  auto tip = event_tip_t{};
  tip.tip_id = transfers_.ids().next(kTipIdDomain, event_id, from_user_id,
                                     to_user_id, amount_cents);
  tip.event_id = event_id;
  tip.from_user_id = from_user_id;
  tip.to_user_id = to_user_id;
  tip.amount_cents = amount_cents;
  tip.message = message;
  tip.is_anonymous = is_anonymous;
  tip.tipped_at = now;

  auto request = turnstile::schema::transfer_request_t{};
  request.from_user_id = from_user_id;
  request.to_user_id = to_user_id;
  request.amount = amount_cents;
  request.transaction_type = turnstile::schema::transaction_type_t::tip;
  request.reference_type = turnstile::schema::reference_type_t::event_tip;
  request.reference_id = tip.tip_id;
  request.debit_description = fmt::format("Tip during '{}'", event.title);
  request.credit_description = fmt::format("Tip received during '{}'",
                                           event.title);
  auto metadata = turnstile::schema::tip_metadata_t{};
  metadata.event_id = event_id;
  metadata.from_user_id = from_user_id;
  metadata.to_user_id = to_user_id;
  metadata.message = message;
  metadata.is_anonymous = is_anonymous;
  request.metadata = metadata;

  auto staged = transfers_.stage(txn, request);
  if (!staged.ok()) {
    return turnstile::schema::forward_failure<event_tip_t>(staged);
  }

  tip.transaction_id = staged.value->transaction_id;
  event.total_tips_cents += amount_cents;
  event.total_revenue_cents += amount_cents;
  if (txn.put(encoder_,
              turnstile::schema::key::make_tip_key(event_id, tip.tipped_at,
                                                   tip.tip_id),
              tip) != storage_status::ok ||
      txn.put(encoder_, turnstile::schema::key::make_event_key(event_id),
              event) != storage_status::ok ||
      txn.commit() != storage_status::ok) {
    return contended<event_tip_t>("committing tip");
  }

  transfers_.notify_committed(staged.value.value());

  auto attributes = std::vector<turnstile::schema::broadcast_attribute_t>{
      attribute("tip_id", turnstile::schema::to_hex(tip.tip_id)),
      attribute("amount_cents", std::to_string(amount_cents)),
      attribute("is_anonymous", is_anonymous ? "true" : "false")};
  if (!is_anonymous) {
    attributes.push_back(
        attribute("from_user_id", turnstile::schema::to_hex(from_user_id)));
  }
  if (message.has_value()) {
    attributes.push_back(attribute("message", message.value()));
  }
  publish(event_id, "tip", std::move(attributes));
  return turnstile::schema::make_success(std::move(tip));
}

turnstile::schema::operation_result<turnstile::schema::event_attendance_t>
event_controller::join_event(const turnstile::schema::event_id_t& event_id,
                             const turnstile::schema::user_id_t& user_id) {
  using turnstile::schema::event_attendance_t;

  auto txn = storage_.begin();
  auto locked = gate_.lock_event(txn, event_id);
  if (!locked.ok()) {
    return turnstile::schema::forward_failure<event_attendance_t>(locked);
  }
  auto event = std::move(locked.value.value());
  if (event.status != turnstile::schema::event_status_t::live) {
    return rejected<event_attendance_t>(
        ledger_error_code::event_not_live,
        fmt::format("cannot join a {} event",
                    turnstile::schema::to_string(event.status)));
  }
  if (!has_access(txn, event, user_id)) {
    return rejected<event_attendance_t>(
        ledger_error_code::access_denied,
        fmt::format("no access to {} event",
                    turnstile::schema::to_string(event.access_type)));
  }

  auto key = turnstile::schema::key::make_attendance_key(event_id, user_id);
  auto existing = txn.get_for_update<event_attendance_t>(encoder_, key);
  if (existing.contended()) {
    return contended<event_attendance_t>("locking attendance");
  }
  if (existing.value.has_value() && existing.value->is_active) {
    return turnstile::schema::make_success(std::move(existing.value.value()));
  }

  const auto now = transfers_.now();
  auto attendance = event_attendance_t{};
  if (existing.value.has_value()) {
    attendance = std::move(existing.value.value());
  } else {
    attendance.event_id = event_id;
    attendance.user_id = user_id;
    ++event.total_attendees;
  }
  attendance.joined_at = now;
  attendance.left_at.reset();
  attendance.is_active = true;
  if (txn.put(encoder_, key, attendance) != storage_status::ok) {
    return contended<event_attendance_t>("recording attendance");
  }

  auto active = uint32_t{};
  auto prefix = turnstile::schema::key::make_attendance_prefix(event_id);
  for (const auto& [row_key, value] : txn.list_by_prefix(prefix)) {
    if (encoder_.decode<event_attendance_t>(value).is_active) {
      ++active;
    }
  }
  event.peak_concurrent_viewers = std::max(event.peak_concurrent_viewers, active);

  if (txn.put(encoder_, turnstile::schema::key::make_event_key(event_id),
              event) != storage_status::ok ||
      txn.commit() != storage_status::ok) {
    return contended<event_attendance_t>("committing join");
  }

  publish(event_id, "user_joined",
          {attribute("user_id", turnstile::schema::to_hex(user_id)),
           attribute("active_viewers", std::to_string(active))});
  return turnstile::schema::make_success(std::move(attendance));
}

turnstile::schema::operation_result<turnstile::schema::event_attendance_t>
event_controller::leave_event(const turnstile::schema::event_id_t& event_id,
                              const turnstile::schema::user_id_t& user_id) {
  using turnstile::schema::event_attendance_t;

  if (!get_event(event_id).has_value()) {
    return rejected<event_attendance_t>(
        ledger_error_code::event_not_found,
        fmt::format("event {} not found", turnstile::schema::to_hex(event_id)));
  }

  auto txn = storage_.begin();
  auto key = turnstile::schema::key::make_attendance_key(event_id, user_id);
  auto existing = txn.get_for_update<event_attendance_t>(encoder_, key);
  if (existing.contended()) {
    return contended<event_attendance_t>("locking attendance");
  }
  if (!existing.value.has_value()) {
    return rejected<event_attendance_t>(ledger_error_code::attendance_missing,
                                        "user never joined this event");
  }
  auto attendance = std::move(existing.value.value());
  if (!attendance.is_active) {
    return turnstile::schema::make_success(std::move(attendance));
  }

  const auto now = transfers_.now();
  attendance.duration_seconds += elapsed_seconds(attendance.joined_at, now);
  attendance.left_at = now;
  attendance.is_active = false;
  if (txn.put(encoder_, key, attendance) != storage_status::ok ||
      txn.commit() != storage_status::ok) {
    return contended<event_attendance_t>("committing leave");
  }

  publish(event_id, "user_left",
          {attribute("user_id", turnstile::schema::to_hex(user_id)),
           attribute("duration_seconds",
                     std::to_string(attendance.duration_seconds))});
  return turnstile::schema::make_success(std::move(attendance));
}

std::optional<turnstile::schema::event_state_t> event_controller::get_event(
    const turnstile::schema::event_id_t& event_id) const {
  return storage_.get<turnstile::schema::event_state_t>(
      encoder_, turnstile::schema::key::make_event_key(event_id));
}

std::vector<turnstile::schema::event_state_t> event_controller::list_events(
    const event_query& query) const {
  auto events = std::vector<turnstile::schema::event_state_t>{};
  auto prefix = turnstile::schema::key::make_prefix(
      turnstile::schema::key::kEventKeyPrefix);
  for (const auto& [key, value] : storage_.list_by_prefix(prefix)) {
    auto event = encoder_.decode<turnstile::schema::event_state_t>(value);
    if (query.status.has_value() && event.status != query.status.value()) {
      continue;
    }
    if (query.creator_id.has_value() &&
        event.creator_id != query.creator_id.value()) {
      continue;
    }
    events.push_back(std::move(event));
  }
  std::stable_sort(std::begin(events), std::end(events),
                   [](const auto& lhs, const auto& rhs) {
                     return lhs.scheduled_start_at < rhs.scheduled_start_at;
                   });
  if (query.limit != 0 && events.size() > query.limit) {
    events.resize(query.limit);
  }
  return events;
}

std::optional<turnstile::schema::event_ticket_t> event_controller::get_ticket(
    const turnstile::schema::event_id_t& event_id,
    const turnstile::schema::user_id_t& fan_id) const {
  return storage_.get<turnstile::schema::event_ticket_t>(
      encoder_, turnstile::schema::key::make_ticket_key(event_id, fan_id));
}

std::vector<turnstile::schema::event_ticket_t> event_controller::list_tickets(
    const turnstile::schema::event_id_t& event_id) const {
  auto tickets = std::vector<turnstile::schema::event_ticket_t>{};
  auto prefix = turnstile::schema::key::make_ticket_prefix(event_id);
  for (const auto& [key, value] : storage_.list_by_prefix(prefix)) {
    tickets.push_back(encoder_.decode<turnstile::schema::event_ticket_t>(value));
  }
  return tickets;
}

std::vector<turnstile::schema::event_tip_t> event_controller::event_tips(
    const turnstile::schema::event_id_t& event_id,
    const std::size_t limit) const {
  auto tips = std::vector<turnstile::schema::event_tip_t>{};
  auto rows = storage_.list_by_prefix(
      turnstile::schema::key::make_tip_prefix(event_id));
  for (auto it = rows.rbegin(); it != rows.rend(); ++it) {
    if (limit != 0 && tips.size() >= limit) {
      break;
    }
    tips.push_back(encoder_.decode<turnstile::schema::event_tip_t>(it->second));
  }
  return tips;
}

std::vector<turnstile::schema::event_attendance_t>
event_controller::active_attendees(
    const turnstile::schema::event_id_t& event_id) const {
  auto attendees = std::vector<turnstile::schema::event_attendance_t>{};
  auto prefix = turnstile::schema::key::make_attendance_prefix(event_id);
  for (const auto& [key, value] : storage_.list_by_prefix(prefix)) {
    auto attendance =
        encoder_.decode<turnstile::schema::event_attendance_t>(value);
    if (attendance.is_active) {
      attendees.push_back(std::move(attendance));
    }
  }
  return attendees;
}

std::optional<turnstile::schema::event_stats_t> event_controller::event_stats(
    const turnstile::schema::event_id_t& event_id) const {
  auto event = get_event(event_id);
  if (!event.has_value()) {
    return std::nullopt;
  }
  auto stats = turnstile::schema::event_stats_t{};
  stats.event = std::move(event.value());
  for (const auto& ticket : list_tickets(event_id)) {
    ++stats.tickets_sold;
    if (turnstile::schema::is_active(ticket)) {
      ++stats.active_tickets;
    }
  }
  for (const auto& tip : event_tips(event_id, 0)) {
    ++stats.tip_count;
    stats.tip_total_cents += tip.amount_cents;
  }
  stats.active_attendees = active_attendees(event_id).size();
  return stats;
}

void event_controller::set_broadcaster(broadcaster_t broadcaster) {
  broadcaster_ = std::move(broadcaster);
}

void event_controller::set_entitlement_checker(entitlement_checker_t checker) {
  entitlement_checker_ = std::move(checker);
}

turnstile::schema::operation_result<turnstile::schema::event_state_t>
event_controller::lock_owned_event(
    turnstile::ledger::transaction_t& txn,
    const turnstile::schema::event_id_t& event_id,
    const turnstile::schema::user_id_t& creator_id) const {
  auto locked = gate_.lock_event(txn, event_id);
  if (!locked.ok()) {
    return locked;
  }
  if (locked.value->creator_id != creator_id) {
    return rejected<turnstile::schema::event_state_t>(
        ledger_error_code::unauthorized,
        "only the event creator may change its lifecycle");
  }
  return locked;
}

bool event_controller::has_access(
    turnstile::ledger::transaction_t& txn,
    const turnstile::schema::event_state_t& event,
    const turnstile::schema::user_id_t& user_id) const {
  if (user_id == event.creator_id) {
    return true;
  }
  switch (event.access_type) {
    case turnstile::schema::access_type_t::free:
      return true;
    case turnstile::schema::access_type_t::ticketed: {
      auto ticket = txn.get<turnstile::schema::event_ticket_t>(
          encoder_,
          turnstile::schema::key::make_ticket_key(event.event_id, user_id));
      return ticket.value.has_value() &&
             turnstile::schema::is_active(ticket.value.value());
    }
    case turnstile::schema::access_type_t::subscription_only:
    case turnstile::schema::access_type_t::tier_gated:
      return entitlement_checker_ &&
             entitlement_checker_(user_id, event.event_id);
  }
  return false;
}

void event_controller::publish(
    const turnstile::schema::event_id_t& event_id,
    const std::string_view type,
    std::vector<turnstile::schema::broadcast_attribute_t> attributes) const {
  if (!broadcaster_) {
    return;
  }
  auto message = turnstile::schema::broadcast_message_t{};
  message.type = std::string{type};
  message.event_id = event_id;
  message.attributes = std::move(attributes);
  message.timestamp = transfers_.now();
  auto room = turnstile::schema::make_event_room(event_id);
  try {
    broadcaster_(room, message);
  } catch (const std::exception& e) {
    spdlog::error("Broadcast of {} to {} failed: {}", message.type, room,
                  e.what());
  }
}

}  // namespace turnstile::events
