#pragma once
#include <turnstile/ledger/backend.hpp>
#include <turnstile/schema/primitives.hpp>
#include <turnstile/schema/wallet_state.hpp>
#include <turnstile/storage/storage.hpp>

#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>

namespace turnstile::ledger {

/// Deterministic wallet id for a user.
turnstile::schema::wallet_id_t make_wallet_id(
    const turnstile::schema::user_id_t& user_id);

/// Signed change applied to both balances of a locked wallet.
struct balance_delta final {
  int64_t available{};
  int64_t total{};
};

/// Outcome of apply_delta. rows_affected is 0 when the row is gone or the
/// delta would break total_balance >= available_balance >= 0.
struct delta_result final {
  turnstile::storage::write_result write;
  turnstile::schema::wallet_state_t wallet;
};

/// Persistent balance records, one per user.
///
/// Every mutating call runs inside a caller-owned transaction; the wallet key
/// is the unit of locking.
class wallet_store final {
 public:
  wallet_store(encoder_t& encoder, storage_t& storage);

  /// Committed read without taking a lock.
  std::optional<turnstile::schema::wallet_state_t> get_wallet(
      const turnstile::schema::user_id_t& user_id) const;

  /// Take the wallet's exclusive lock for the rest of txn and return the row
  /// as seen under that lock.
  turnstile::storage::read_result<turnstile::schema::wallet_state_t>
  lock_wallet(transaction_t& txn,
              const turnstile::schema::user_id_t& user_id) const;

  /// Must only be called while txn holds the wallet lock.
  delta_result apply_delta(transaction_t& txn,
                           const turnstile::schema::wallet_state_t& locked,
                           const balance_delta& delta,
                           turnstile::schema::timestamp_milliseconds_t now) const;

  /// Return the user's wallet, creating an empty one when absent.
  turnstile::storage::read_result<turnstile::schema::wallet_state_t>
  open_wallet(transaction_t& txn,
              const turnstile::schema::user_id_t& user_id,
              std::string_view currency,
              turnstile::schema::timestamp_milliseconds_t now) const;

  std::vector<turnstile::schema::wallet_state_t> list_wallets() const;

 private:
  encoder_t& encoder_;
  storage_t& storage_;
};

}  // namespace turnstile::ledger
