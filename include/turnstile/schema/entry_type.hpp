#pragma once

#include <turnstile/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: entry type.
// Ledger workflow: which side of a double-entry pair a ledger row records.
namespace turnstile::schema {

enum class entry_type_t : uint8_t { debit = 0, credit = 1 };

inline constexpr auto kEntryTypeMappings = std::array{
    std::pair<std::string_view, entry_type_t>{"debit", entry_type_t::debit},
    std::pair<std::string_view, entry_type_t>{"credit", entry_type_t::credit}};

template <>
inline std::optional<entry_type_t> try_from_string<entry_type_t>(
    const std::string_view value) {
  return from_string(value, kEntryTypeMappings);
}

inline constexpr std::string_view to_string(const entry_type_t value) {
  return to_string(value, kEntryTypeMappings).value_or("unknown");
}

}  // namespace turnstile::schema
