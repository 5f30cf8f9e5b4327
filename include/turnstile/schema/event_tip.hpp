#pragma once
#include <turnstile/schema/primitives.hpp>

#include <cstdint>
#include <optional>
#include <string>

namespace turnstile::schema {

template <uint16_t Version>
struct event_tip;

template <>
struct event_tip<1> final {
  uint16_t version{1};
  tip_id_t tip_id{};
  event_id_t event_id{};
  user_id_t from_user_id{};
  user_id_t to_user_id{};
  cents_t amount_cents{};
  std::optional<std::string> message;
  bool is_anonymous{};
  transaction_id_t transaction_id{};
  timestamp_milliseconds_t tipped_at{};
};

using event_tip_t = event_tip<1>;

}  // namespace turnstile::schema
