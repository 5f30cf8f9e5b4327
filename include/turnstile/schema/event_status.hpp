#pragma once

#include <turnstile/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: event status.
// Event workflow: lifecycle states; ended and cancelled are terminal.
namespace turnstile::schema {

enum class event_status_t : uint8_t {
  scheduled = 0,
  live = 1,
  ended = 2,
  cancelled = 3
};

inline constexpr auto kEventStatusMappings =
    std::array{std::pair<std::string_view, event_status_t>{
                   "scheduled", event_status_t::scheduled},
               std::pair<std::string_view, event_status_t>{
                   "live", event_status_t::live},
               std::pair<std::string_view, event_status_t>{
                   "ended", event_status_t::ended},
               std::pair<std::string_view, event_status_t>{
                   "cancelled", event_status_t::cancelled}};

template <>
inline std::optional<event_status_t> try_from_string<event_status_t>(
    const std::string_view value) {
  return from_string(value, kEventStatusMappings);
}

inline constexpr std::string_view to_string(const event_status_t value) {
  return to_string(value, kEventStatusMappings).value_or("unknown");
}

inline constexpr bool is_terminal(const event_status_t value) {
  return value == event_status_t::ended || value == event_status_t::cancelled;
}

}  // namespace turnstile::schema
