#pragma once
#include <turnstile/schema/primitives.hpp>

#include <cstdint>
#include <string>

namespace turnstile::schema {

template <uint16_t Version>
struct wallet_state;

/// One balance record per user. Invariant:
/// total_balance >= available_balance >= 0.
template <>
struct wallet_state<1> final {
  uint16_t version{1};
  wallet_id_t wallet_id{};
  user_id_t user_id{};
  cents_t available_balance{};
  cents_t total_balance{};
  std::string currency{kDefaultCurrency};
  timestamp_milliseconds_t created_at{};
  timestamp_milliseconds_t updated_at{};
};

using wallet_state_t = wallet_state<1>;

}  // namespace turnstile::schema
