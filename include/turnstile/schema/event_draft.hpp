#pragma once
#include <turnstile/schema/access_type.hpp>
#include <turnstile/schema/primitives.hpp>

#include <cstdint>
#include <optional>
#include <string>

// Schema type: event draft.
// Event workflow: creator-supplied fields for a new scheduled event.
namespace turnstile::schema {

struct event_draft_t final {
  std::string title;
  access_type_t access_type{access_type_t::free};
  cents_t ticket_price_cents{};
  std::optional<uint32_t> max_attendees;
  timestamp_milliseconds_t scheduled_start_at{};
};

}  // namespace turnstile::schema
