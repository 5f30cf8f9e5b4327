#pragma once

#include <turnstile/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: reference type.
// Ledger workflow: the business object a ledger movement points back to.
namespace turnstile::schema {

enum class reference_type_t : uint8_t {
  event_ticket = 0,
  event_tip = 1,
  event_refund = 2,
  deposit = 3
};

inline constexpr auto kReferenceTypeMappings =
    std::array{std::pair<std::string_view, reference_type_t>{
                   "event_ticket", reference_type_t::event_ticket},
               std::pair<std::string_view, reference_type_t>{
                   "event_tip", reference_type_t::event_tip},
               std::pair<std::string_view, reference_type_t>{
                   "event_refund", reference_type_t::event_refund},
               std::pair<std::string_view, reference_type_t>{
                   "deposit", reference_type_t::deposit}};

template <>
inline std::optional<reference_type_t> try_from_string<reference_type_t>(
    const std::string_view value) {
  return from_string(value, kReferenceTypeMappings);
}

inline constexpr std::string_view to_string(const reference_type_t value) {
  return to_string(value, kReferenceTypeMappings).value_or("unknown");
}

}  // namespace turnstile::schema
