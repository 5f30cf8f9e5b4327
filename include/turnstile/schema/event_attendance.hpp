#pragma once
#include <turnstile/schema/primitives.hpp>

#include <cstdint>
#include <optional>

// Schema type: event attendance.
// Event workflow: presence tracking, one row per (event, user). Not
// financial; drives viewer counts and broadcast fan-out.
namespace turnstile::schema {

template <uint16_t Version>
struct event_attendance;

template <>
struct event_attendance<1> final {
  uint16_t version{1};
  event_id_t event_id{};
  user_id_t user_id{};
  timestamp_milliseconds_t joined_at{};
  std::optional<timestamp_milliseconds_t> left_at;
  bool is_active{};
  // Accumulated over every join/leave session.
  uint64_t duration_seconds{};
};

using event_attendance_t = event_attendance<1>;

}  // namespace turnstile::schema
