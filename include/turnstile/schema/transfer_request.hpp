#pragma once
#include <turnstile/schema/ledger_metadata.hpp>
#include <turnstile/schema/primitives.hpp>
#include <turnstile/schema/reference_type.hpp>
#include <turnstile/schema/transaction_type.hpp>

#include <string>

// Schema type: transfer request.
// Ledger workflow: one fixed-amount movement between exactly two wallets.
namespace turnstile::schema {

struct transfer_request_t final {
  user_id_t from_user_id{};
  user_id_t to_user_id{};
  cents_t amount{};
  transaction_type_t transaction_type{transaction_type_t::payment};
  reference_type_t reference_type{reference_type_t::event_ticket};
  hash32_t reference_id{};
  std::string debit_description;
  std::string credit_description;
  ledger_metadata_t metadata;
};

}  // namespace turnstile::schema
