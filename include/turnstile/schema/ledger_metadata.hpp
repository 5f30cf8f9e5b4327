#pragma once
#include <turnstile/schema/primitives.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <variant>

// Schema type: ledger metadata.
// Ledger workflow: structured side data attached to both halves of a
// transfer. Each alternative carries its own version so it can evolve
// independently of the entry layout.
namespace turnstile::schema {

template <uint16_t Version>
struct ticket_sale_metadata;

template <>
struct ticket_sale_metadata<1> final {
  uint16_t version{1};
  event_id_t event_id{};
  ticket_id_t ticket_id{};
  user_id_t fan_id{};
  user_id_t creator_id{};
};

template <uint16_t Version>
struct tip_metadata;

template <>
struct tip_metadata<1> final {
  uint16_t version{1};
  event_id_t event_id{};
  user_id_t from_user_id{};
  user_id_t to_user_id{};
  std::optional<std::string> message;
  bool is_anonymous{};
};

template <uint16_t Version>
struct refund_metadata;

template <>
struct refund_metadata<1> final {
  uint16_t version{1};
  event_id_t event_id{};
  ticket_id_t ticket_id{};
  user_id_t fan_id{};
  transaction_id_t original_transaction_id{};
};

template <uint16_t Version>
struct deposit_metadata;

template <>
struct deposit_metadata<1> final {
  uint16_t version{1};
  std::string processor;
  std::string external_reference;
};

using ticket_sale_metadata_t = ticket_sale_metadata<1>;
using tip_metadata_t = tip_metadata<1>;
using refund_metadata_t = refund_metadata<1>;
using deposit_metadata_t = deposit_metadata<1>;

using ledger_metadata_t = std::variant<ticket_sale_metadata_t,
                                       tip_metadata_t,
                                       refund_metadata_t,
                                       deposit_metadata_t>;

}  // namespace turnstile::schema
