#pragma once
#include <turnstile/schema/access_type.hpp>
#include <turnstile/schema/event_status.hpp>
#include <turnstile/schema/primitives.hpp>

#include <cstdint>
#include <optional>
#include <string>

namespace turnstile::schema {

template <uint16_t Version>
struct event_state;

template <>
struct event_state<1> final {
  uint16_t version{1};
  event_id_t event_id{};
  user_id_t creator_id{};
  std::string title;
  event_status_t status{event_status_t::scheduled};
  access_type_t access_type{access_type_t::free};
  cents_t ticket_price_cents{};
  // Empty means unlimited seating.
  std::optional<uint32_t> max_attendees;
  timestamp_milliseconds_t scheduled_start_at{};
  std::optional<timestamp_milliseconds_t> actual_start_at;
  std::optional<timestamp_milliseconds_t> actual_end_at;
  cents_t total_revenue_cents{};
  cents_t total_tips_cents{};
  uint32_t total_attendees{};
  uint32_t peak_concurrent_viewers{};
};

using event_state_t = event_state<1>;

}  // namespace turnstile::schema
