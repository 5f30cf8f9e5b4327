#pragma once

#include <turnstile/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: transaction type.
// Ledger workflow: business classification shared by both halves of a
// transfer.
namespace turnstile::schema {

enum class transaction_type_t : uint8_t {
  payment = 0,
  tip = 1,
  refund = 2,
  deposit = 3
};

inline constexpr auto kTransactionTypeMappings =
    std::array{std::pair<std::string_view, transaction_type_t>{
                   "payment", transaction_type_t::payment},
               std::pair<std::string_view, transaction_type_t>{
                   "tip", transaction_type_t::tip},
               std::pair<std::string_view, transaction_type_t>{
                   "refund", transaction_type_t::refund},
               std::pair<std::string_view, transaction_type_t>{
                   "deposit", transaction_type_t::deposit}};

template <>
inline std::optional<transaction_type_t> try_from_string<transaction_type_t>(
    const std::string_view value) {
  return from_string(value, kTransactionTypeMappings);
}

inline constexpr std::string_view to_string(const transaction_type_t value) {
  return to_string(value, kTransactionTypeMappings).value_or("unknown");
}

}  // namespace turnstile::schema
