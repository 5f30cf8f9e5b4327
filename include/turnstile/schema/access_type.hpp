#pragma once

#include <turnstile/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: access type.
// Event workflow: what a viewer must hold before joining a live event.
namespace turnstile::schema {

enum class access_type_t : uint8_t {
  free = 0,
  ticketed = 1,
  subscription_only = 2,
  tier_gated = 3
};

inline constexpr auto kAccessTypeMappings =
    std::array{std::pair<std::string_view, access_type_t>{
                   "free", access_type_t::free},
               std::pair<std::string_view, access_type_t>{
                   "ticketed", access_type_t::ticketed},
               std::pair<std::string_view, access_type_t>{
                   "subscription_only", access_type_t::subscription_only},
               std::pair<std::string_view, access_type_t>{
                   "tier_gated", access_type_t::tier_gated}};

template <>
inline std::optional<access_type_t> try_from_string<access_type_t>(
    const std::string_view value) {
  return from_string(value, kAccessTypeMappings);
}

inline constexpr std::string_view to_string(const access_type_t value) {
  return to_string(value, kAccessTypeMappings).value_or("unknown");
}

}  // namespace turnstile::schema
