#pragma once
#include <turnstile/schema/primitives.hpp>

#include <cstdint>
#include <string>

namespace turnstile::schema {

template <uint16_t Version>
struct deposit_record;

/// One row per external payment reference that funded a wallet. Written in
/// the same transaction as the deposit's ledger pair.
template <>
struct deposit_record<1> final {
  uint16_t version{1};
  hash32_t reference_id{};
  transaction_id_t transaction_id{};
  user_id_t user_id{};
  cents_t amount{};
  std::string currency;
  timestamp_milliseconds_t created_at{};
};

using deposit_record_t = deposit_record<1>;

}  // namespace turnstile::schema
