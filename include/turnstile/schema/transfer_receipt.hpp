#pragma once
#include <turnstile/schema/ledger_entry.hpp>
#include <turnstile/schema/wallet_state.hpp>

namespace turnstile::schema {

/// Everything a committed (or staged) transfer wrote: both wallet rows after
/// the movement and both ledger halves.
struct transfer_receipt_t final {
  transaction_id_t transaction_id{};
  wallet_state_t from_wallet;
  wallet_state_t to_wallet;
  ledger_entry_t debit;
  ledger_entry_t credit;
};

}  // namespace turnstile::schema
