#pragma once
#include <turnstile/common/clock.hpp>
#include <turnstile/ledger/backend.hpp>
#include <turnstile/ledger/id_source.hpp>
#include <turnstile/ledger/journal.hpp>
#include <turnstile/ledger/wallet_store.hpp>
#include <turnstile/schema/deposit_record.hpp>
#include <turnstile/schema/operation_result.hpp>
#include <turnstile/schema/primitives.hpp>
#include <turnstile/schema/transfer_receipt.hpp>
#include <turnstile/schema/transfer_request.hpp>
#include <turnstile/schema/wallet_state.hpp>

#include <functional>
#include <string>
#include <string_view>

namespace turnstile::ledger {

/// Called once per committed transfer, never for a staged-only one.
using commit_observer_t =
    std::function<void(const turnstile::schema::transfer_receipt_t&)>;

/// Counterparty for money entering from outside (payment processors). It owns
/// no wallet row; its ledger halves carry balance_after = 0.
turnstile::schema::user_id_t make_clearing_account_id();

/// Moves a fixed amount between exactly two wallets and journals the pair.
///
/// Wallet locks are always taken in ascending user id byte order, so two
/// transfers in opposite directions cannot deadlock each other. Any failed
/// precondition leaves the enclosing transaction to be rolled back: no
/// balance changes and no journal entry survives a rejected transfer.
class transfer_engine final {
 public:
  transfer_engine(encoder_t& encoder,
                  storage_t& storage,
                  wallet_store& wallets,
                  journal& journal,
                  std::string currency = std::string{
                      turnstile::schema::kDefaultCurrency},
                  turnstile::common::clock_function_t clock =
                      turnstile::common::system_now);

  /// Run one transfer in its own transaction and commit it.
  turnstile::schema::operation_result<turnstile::schema::transfer_receipt_t>
  transfer(const turnstile::schema::transfer_request_t& request);

  /// Lock, check, debit, credit and journal inside a caller-owned txn.
  /// The caller commits (or drops) txn and notifies observers itself.
  turnstile::schema::operation_result<turnstile::schema::transfer_receipt_t>
  stage(transaction_t& txn,
        const turnstile::schema::transfer_request_t& request);

  /// Fund a user's wallet from the clearing account, opening it if needed.
  /// The (processor, external_reference) pair is booked at most once: a
  /// repeated call returns the original receipt and credits nothing.
  turnstile::schema::operation_result<turnstile::schema::transfer_receipt_t>
  deposit(const turnstile::schema::user_id_t& user_id,
          turnstile::schema::cents_t amount,
          std::string_view currency,
          std::string_view processor,
          std::string_view external_reference);

  /// Create the user's empty wallet, or return the existing one.
  turnstile::schema::operation_result<turnstile::schema::wallet_state_t>
  open_wallet(const turnstile::schema::user_id_t& user_id);

  /// Notify the observer of a receipt whose transaction has committed.
  /// Observer exceptions are logged and swallowed by type.
  void notify_committed(
      const turnstile::schema::transfer_receipt_t& receipt) const;

  void set_commit_observer(commit_observer_t observer);

  const std::string& currency() const;
  turnstile::schema::timestamp_milliseconds_t now() const;
  id_source& ids();
  wallet_store& wallets();

 private:
  turnstile::schema::operation_result<turnstile::schema::transfer_receipt_t>
  replay_deposit(const turnstile::schema::deposit_record_t& record) const;

  encoder_t& encoder_;
  storage_t& storage_;
  wallet_store& wallets_;
  journal& journal_;
  std::string currency_;
  turnstile::common::clock_function_t clock_;
  id_source ids_;
  commit_observer_t observer_;
};

}  // namespace turnstile::ledger
