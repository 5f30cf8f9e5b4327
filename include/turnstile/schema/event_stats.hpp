#pragma once
#include <turnstile/schema/event_state.hpp>

#include <cstdint>

namespace turnstile::schema {

struct event_stats_t final {
  event_state_t event;
  uint64_t tickets_sold{};
  uint64_t active_tickets{};
  uint64_t tip_count{};
  cents_t tip_total_cents{};
  uint64_t active_attendees{};
};

}  // namespace turnstile::schema
