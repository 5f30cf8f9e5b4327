#pragma once
#include <turnstile/schema/primitives.hpp>

#include <cstdint>
#include <vector>

// Schema type: reconciliation report.
// Ledger workflow: result of a full ledger scan. A clean report has no
// unbalanced transactions and no wallet whose balance disagrees with the net
// of its ledger entries.
namespace turnstile::schema {

struct reconciliation_report_t final {
  uint64_t transaction_count{};
  uint64_t entry_count{};
  uint64_t wallets_checked{};
  cents_t total_debits{};
  cents_t total_credits{};
  std::vector<transaction_id_t> unbalanced_transactions;
  std::vector<wallet_id_t> mismatched_wallets;

  bool clean() const {
    return unbalanced_transactions.empty() && mismatched_wallets.empty() &&
           total_debits == total_credits;
  }
};

}  // namespace turnstile::schema
