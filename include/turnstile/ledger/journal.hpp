#pragma once
#include <turnstile/ledger/backend.hpp>
#include <turnstile/ledger/wallet_store.hpp>
#include <turnstile/schema/ledger_entry.hpp>
#include <turnstile/schema/primitives.hpp>
#include <turnstile/schema/reconciliation_report.hpp>
#include <turnstile/storage/storage.hpp>

#include <cstddef>
#include <cstdint>
#include <vector>

namespace turnstile::ledger {

/// Append-only double-entry journal.
///
/// Each entry is written twice inside the caller's transaction: under its
/// transaction id (audit view) and under its wallet's time-ordered history
/// index. Nothing here updates or deletes an entry.
class journal final {
 public:
  journal(encoder_t& encoder, storage_t& storage, wallet_store& wallets);

  turnstile::storage::storage_status append(
      transaction_t& txn,
      const turnstile::schema::ledger_entry_t& entry) const;

  std::vector<turnstile::schema::ledger_entry_t> entries_for_transaction(
      const turnstile::schema::transaction_id_t& transaction_id) const;

  /// Credits minus debits for one transaction. Zero for every committed one.
  int64_t sum_by_transaction(
      const turnstile::schema::transaction_id_t& transaction_id) const;

  /// Newest first. A limit of zero returns the whole history.
  std::vector<turnstile::schema::ledger_entry_t> entries_for_wallet(
      const turnstile::schema::user_id_t& user_id,
      std::size_t limit) const;

  /// Full read-only audit of the journal against the wallet rows.
  turnstile::schema::reconciliation_report_t reconcile() const;

 private:
  encoder_t& encoder_;
  storage_t& storage_;
  wallet_store& wallets_;
};

}  // namespace turnstile::ledger
