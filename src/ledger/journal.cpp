#include <turnstile/ledger/journal.hpp>
#include <turnstile/schema/key/engine_keys.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <map>
#include <optional>

namespace turnstile::ledger {

namespace {

int64_t signed_amount(const turnstile::schema::ledger_entry_t& entry) {
  auto amount = static_cast<int64_t>(entry.amount);
  return entry.entry_type == turnstile::schema::entry_type_t::credit ? amount
                                                                     : -amount;
}

}  // namespace

journal::journal(encoder_t& encoder, storage_t& storage, wallet_store& wallets)
    : encoder_{encoder}, storage_{storage}, wallets_{wallets} {}

turnstile::storage::storage_status journal::append(
    transaction_t& txn,
    const turnstile::schema::ledger_entry_t& entry) const {
  auto entry_key = turnstile::schema::key::make_ledger_entry_key(
      entry.transaction_id, entry.entry_type);
  auto status = txn.put(encoder_, entry_key, entry);
  if (status != turnstile::storage::storage_status::ok) {
    return status;
  }
  auto history_key = turnstile::schema::key::make_wallet_history_key(
      entry.wallet_id, entry.created_at, entry.transaction_id);
  return txn.put(encoder_, history_key, entry);
}

std::vector<turnstile::schema::ledger_entry_t> journal::entries_for_transaction(
    const turnstile::schema::transaction_id_t& transaction_id) const {
  auto entries = std::vector<turnstile::schema::ledger_entry_t>{};
  auto prefix =
      turnstile::schema::key::make_ledger_transaction_prefix(transaction_id);
  for (const auto& [key, value] : storage_.list_by_prefix(prefix)) {
    entries.push_back(encoder_.decode<turnstile::schema::ledger_entry_t>(value));
  }
  return entries;
}

int64_t journal::sum_by_transaction(
    const turnstile::schema::transaction_id_t& transaction_id) const {
  auto sum = int64_t{};
  for (const auto& entry : entries_for_transaction(transaction_id)) {
    sum += signed_amount(entry);
  }
  return sum;
}

std::vector<turnstile::schema::ledger_entry_t> journal::entries_for_wallet(
    const turnstile::schema::user_id_t& user_id,
    const std::size_t limit) const {
  auto entries = std::vector<turnstile::schema::ledger_entry_t>{};
  auto prefix =
      turnstile::schema::key::make_wallet_history_prefix(make_wallet_id(user_id));
  auto rows = storage_.list_by_prefix(prefix);
  for (auto it = rows.rbegin(); it != rows.rend(); ++it) {
    if (limit != 0 && entries.size() >= limit) {
      break;
    }
    entries.push_back(
        encoder_.decode<turnstile::schema::ledger_entry_t>(it->second));
  }
  return entries;
}

turnstile::schema::reconciliation_report_t journal::reconcile() const {
  auto report = turnstile::schema::reconciliation_report_t{};

  // Rows under the journal prefix are grouped by transaction id already.
  auto prefix = turnstile::schema::key::make_prefix(
      turnstile::schema::key::kLedgerEntryKeyPrefix);
  auto net_by_wallet = std::map<turnstile::schema::wallet_id_t, int64_t>{};
  auto current = std::optional<turnstile::schema::transaction_id_t>{};
  auto current_sum = int64_t{};
  auto close_transaction = [&]() {
    if (current.has_value() && current_sum != 0) {
      report.unbalanced_transactions.push_back(current.value());
    }
  };
  for (const auto& [key, value] : storage_.list_by_prefix(prefix)) {
    auto entry = encoder_.decode<turnstile::schema::ledger_entry_t>(value);
    if (!current.has_value() || current.value() != entry.transaction_id) {
      close_transaction();
      current = entry.transaction_id;
      current_sum = 0;
      ++report.transaction_count;
    }
    ++report.entry_count;
    current_sum += signed_amount(entry);
    net_by_wallet[entry.wallet_id] += signed_amount(entry);
    if (entry.entry_type == turnstile::schema::entry_type_t::debit) {
      report.total_debits += entry.amount;
    } else {
      report.total_credits += entry.amount;
    }
  }
  close_transaction();

  // Every wallet starts empty, so its balance must equal the net of its
  // journal entries.
  for (const auto& wallet : wallets_.list_wallets()) {
    ++report.wallets_checked;
    auto net = int64_t{};
    if (auto it = net_by_wallet.find(wallet.wallet_id);
        it != std::end(net_by_wallet)) {
      net = it->second;
    }
    if (net < 0 || static_cast<uint64_t>(net) != wallet.available_balance ||
        wallet.total_balance < wallet.available_balance) {
      report.mismatched_wallets.push_back(wallet.wallet_id);
    }
  }

  if (!report.clean()) {
    spdlog::critical(
        "Reconciliation found {} unbalanced transaction(s) and {} mismatched "
        "wallet(s)",
        report.unbalanced_transactions.size(), report.mismatched_wallets.size());
  } else {
    spdlog::info("Reconciled {} transaction(s) across {} wallet(s)",
                 report.transaction_count, report.wallets_checked);
  }
  return report;
}

}  // namespace turnstile::ledger
