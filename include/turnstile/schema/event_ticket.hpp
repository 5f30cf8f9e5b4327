#pragma once
#include <turnstile/schema/primitives.hpp>

#include <cstdint>
#include <optional>

namespace turnstile::schema {

template <uint16_t Version>
struct event_ticket;

/// At most one per (event, fan). Occupies a seat while refunded_at is empty.
template <>
struct event_ticket<1> final {
  uint16_t version{1};
  ticket_id_t ticket_id{};
  event_id_t event_id{};
  user_id_t fan_id{};
  cents_t price_paid_cents{};
  transaction_id_t transaction_id{};
  timestamp_milliseconds_t purchased_at{};
  std::optional<timestamp_milliseconds_t> refunded_at;
  std::optional<transaction_id_t> refund_transaction_id;
};

using event_ticket_t = event_ticket<1>;

inline bool is_active(const event_ticket_t& ticket) {
  return !ticket.refunded_at.has_value();
}

}  // namespace turnstile::schema
