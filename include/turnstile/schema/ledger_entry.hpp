#pragma once
#include <turnstile/schema/entry_type.hpp>
#include <turnstile/schema/ledger_metadata.hpp>
#include <turnstile/schema/primitives.hpp>
#include <turnstile/schema/reference_type.hpp>
#include <turnstile/schema/transaction_type.hpp>

#include <cstdint>
#include <string>

namespace turnstile::schema {

template <uint16_t Version>
struct ledger_entry;

/// Immutable half of a double-entry pair. Both halves share transaction_id
/// and amount; balance_after is the wallet's available balance right after
/// this movement.
template <>
struct ledger_entry<1> final {
  uint16_t version{1};
  transaction_id_t transaction_id{};
  wallet_id_t wallet_id{};
  user_id_t user_id{};
  entry_type_t entry_type{};
  transaction_type_t transaction_type{};
  cents_t amount{};
  cents_t balance_after{};
  std::string currency{kDefaultCurrency};
  reference_type_t reference_type{};
  hash32_t reference_id{};
  std::string description;
  ledger_metadata_t metadata;
  timestamp_milliseconds_t created_at{};
};

using ledger_entry_t = ledger_entry<1>;

}  // namespace turnstile::schema
