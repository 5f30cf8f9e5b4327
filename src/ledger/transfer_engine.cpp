#include <turnstile/blake3/hash.hpp>
#include <turnstile/ledger/transfer_engine.hpp>
#include <turnstile/schema/key/engine_keys.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <exception>
#include <limits>
#include <utility>

namespace turnstile::ledger {

namespace {

using turnstile::schema::ledger_error_code;
using receipt_result_t =
    turnstile::schema::operation_result<turnstile::schema::transfer_receipt_t>;

constexpr auto kTransactionIdDomain =
    std::string_view{"turnstile.transaction.v1"};
constexpr auto kDepositReferenceDomain =
    std::string_view{"turnstile.deposit.v1"};

// Balance deltas are signed 64-bit, so that is the largest movable amount.
constexpr auto kMaxTransferAmount = static_cast<turnstile::schema::cents_t>(
    std::numeric_limits<int64_t>::max());

template <typename T>
turnstile::schema::operation_result<T> rejected(const ledger_error_code code,
                                                std::string log,
                                                const std::string_view codespace) {
  spdlog::debug("Transfer rejected ({}): {}",
                turnstile::schema::to_string(code), log);
  return turnstile::schema::make_failure<T>(code, std::move(log), codespace);
}

template <typename T>
turnstile::schema::operation_result<T> contended(const std::string_view what) {
  spdlog::warn("Storage contention while {}", what);
  return turnstile::schema::make_failure<T>(
      ledger_error_code::storage_contention,
      fmt::format("storage contention while {}", what),
      turnstile::schema::kTransferCodespace);
}

template <typename T>
turnstile::schema::operation_result<T> integrity_failure(std::string log) {
  spdlog::critical("Ledger integrity error: {}", log);
  return turnstile::schema::make_failure<T>(
      ledger_error_code::integrity_error, std::move(log),
      turnstile::schema::kTransferCodespace);
}

turnstile::schema::ledger_entry_t make_entry(
    const turnstile::schema::transaction_id_t& transaction_id,
    const turnstile::schema::wallet_state_t& wallet,
    const turnstile::schema::entry_type_t entry_type,
    const turnstile::schema::transfer_request_t& request,
    const std::string& description,
    const turnstile::schema::timestamp_milliseconds_t now) {
  auto entry = turnstile::schema::ledger_entry_t{};
  entry.transaction_id = transaction_id;
  entry.wallet_id = wallet.wallet_id;
  entry.user_id = wallet.user_id;
  entry.entry_type = entry_type;
  entry.transaction_type = request.transaction_type;
  entry.amount = request.amount;
  entry.balance_after = wallet.available_balance;
  entry.currency = wallet.currency;
  entry.reference_type = request.reference_type;
  entry.reference_id = request.reference_id;
  entry.description = description;
  entry.metadata = request.metadata;
  entry.created_at = now;
  return entry;
}

}  // namespace

turnstile::schema::user_id_t make_clearing_account_id() {
  return turnstile::blake3::hash(std::string_view{"turnstile.clearing.v1"});
}

transfer_engine::transfer_engine(encoder_t& encoder,
                                 storage_t& storage,
                                 wallet_store& wallets,
                                 journal& journal,
                                 std::string currency,
                                 turnstile::common::clock_function_t clock)
    : encoder_{encoder},
      storage_{storage},
      wallets_{wallets},
      journal_{journal},
      currency_{std::move(currency)},
      clock_{std::move(clock)} {}

receipt_result_t transfer_engine::transfer(
    const turnstile::schema::transfer_request_t& request) {
  auto txn = storage_.begin();
  auto staged = stage(txn, request);
  if (!staged.ok()) {
    return staged;
  }
  if (txn.commit() != turnstile::storage::storage_status::ok) {
    return contended<turnstile::schema::transfer_receipt_t>(
        "committing transfer");
  }
  notify_committed(staged.value.value());
  return staged;
}

receipt_result_t transfer_engine::stage(
    transaction_t& txn,
    const turnstile::schema::transfer_request_t& request) {
  using turnstile::schema::transfer_receipt_t;

  if (request.amount == 0 || request.amount > kMaxTransferAmount) {
    return rejected<transfer_receipt_t>(
        ledger_error_code::invalid_amount,
        fmt::format("transfer amount {} is out of range", request.amount),
        turnstile::schema::kTransferCodespace);
  }
  if (request.from_user_id == request.to_user_id) {
    return rejected<transfer_receipt_t>(
        ledger_error_code::invalid_transfer,
        "source and destination wallets are the same",
        turnstile::schema::kTransferCodespace);
  }

  // Lock order: ascending user id bytes, whichever side pays.
  const auto from_first = request.from_user_id < request.to_user_id;
  const auto& first_user =
      from_first ? request.from_user_id : request.to_user_id;
  const auto& second_user =
      from_first ? request.to_user_id : request.from_user_id;

  auto first = wallets_.lock_wallet(txn, first_user);
  if (first.contended()) {
    return contended<transfer_receipt_t>("locking wallet");
  }
  auto second = wallets_.lock_wallet(txn, second_user);
  if (second.contended()) {
    return contended<transfer_receipt_t>("locking wallet");
  }

  auto& from = from_first ? first.value : second.value;
  auto& to = from_first ? second.value : first.value;
  if (!from.has_value()) {
    return rejected<transfer_receipt_t>(
        ledger_error_code::wallet_not_found,
        fmt::format("no wallet for user {}",
                    turnstile::schema::to_hex(request.from_user_id)),
        turnstile::schema::kWalletCodespace);
  }
  if (!to.has_value()) {
    return rejected<transfer_receipt_t>(
        ledger_error_code::wallet_not_found,
        fmt::format("no wallet for user {}",
                    turnstile::schema::to_hex(request.to_user_id)),
        turnstile::schema::kWalletCodespace);
  }
  if (from->currency != to->currency) {
    return rejected<transfer_receipt_t>(
        ledger_error_code::currency_mismatch,
        fmt::format("cannot move {} into a {} wallet", from->currency,
                    to->currency),
        turnstile::schema::kTransferCodespace);
  }
  if (from->available_balance < request.amount) {
    return rejected<transfer_receipt_t>(
        ledger_error_code::insufficient_funds,
        fmt::format("available balance {} is below {}",
                    from->available_balance, request.amount),
        turnstile::schema::kTransferCodespace);
  }
  if (to->available_balance >
      std::numeric_limits<turnstile::schema::cents_t>::max() - request.amount) {
    return rejected<transfer_receipt_t>(
        ledger_error_code::invalid_amount, "destination balance would overflow",
        turnstile::schema::kTransferCodespace);
  }

  const auto expected_from = from->available_balance - request.amount;
  const auto expected_to = to->available_balance + request.amount;
  const auto delta = static_cast<int64_t>(request.amount);
  const auto now = clock_();

  auto debited = wallets_.apply_delta(txn, *from, {-delta, -delta}, now);
  if (debited.write.contended()) {
    return contended<transfer_receipt_t>("debiting wallet");
  }
  if (debited.write.rows_affected != 1 ||
      debited.wallet.available_balance != expected_from) {
    return integrity_failure<transfer_receipt_t>(
        fmt::format("debit of wallet {} affected {} rows",
                    turnstile::schema::to_hex(from->wallet_id),
                    debited.write.rows_affected));
  }

  auto credited = wallets_.apply_delta(txn, *to, {delta, delta}, now);
  if (credited.write.contended()) {
    return contended<transfer_receipt_t>("crediting wallet");
  }
  if (credited.write.rows_affected != 1 ||
      credited.wallet.available_balance != expected_to) {
    return integrity_failure<transfer_receipt_t>(
        fmt::format("credit of wallet {} affected {} rows",
                    turnstile::schema::to_hex(to->wallet_id),
                    credited.write.rows_affected));
  }

  auto receipt = transfer_receipt_t{};
  receipt.transaction_id =
      ids_.next(kTransactionIdDomain, request.from_user_id, request.to_user_id,
                request.amount);
  receipt.from_wallet = debited.wallet;
  receipt.to_wallet = credited.wallet;
  receipt.debit = make_entry(receipt.transaction_id, debited.wallet,
                             turnstile::schema::entry_type_t::debit, request,
                             request.debit_description, now);
  receipt.credit = make_entry(receipt.transaction_id, credited.wallet,
                              turnstile::schema::entry_type_t::credit, request,
                              request.credit_description, now);

  if (journal_.append(txn, receipt.debit) !=
          turnstile::storage::storage_status::ok ||
      journal_.append(txn, receipt.credit) !=
          turnstile::storage::storage_status::ok) {
    return contended<transfer_receipt_t>("journaling transfer");
  }

  spdlog::debug("Staged {} {} from {} to {} as {}", request.amount,
                from->currency, turnstile::schema::to_hex(request.from_user_id),
                turnstile::schema::to_hex(request.to_user_id),
                turnstile::schema::to_hex(receipt.transaction_id));
  return turnstile::schema::make_success(std::move(receipt));
}

receipt_result_t transfer_engine::deposit(
    const turnstile::schema::user_id_t& user_id,
    const turnstile::schema::cents_t amount,
    const std::string_view currency,
    const std::string_view processor,
    const std::string_view external_reference) {
  using turnstile::schema::transfer_receipt_t;

  if (amount == 0 || amount > kMaxTransferAmount) {
    return rejected<transfer_receipt_t>(
        ledger_error_code::invalid_amount,
        fmt::format("deposit amount {} is out of range", amount),
        turnstile::schema::kTransferCodespace);
  }
  const auto clearing_id = make_clearing_account_id();
  if (user_id == clearing_id) {
    return rejected<transfer_receipt_t>(
        ledger_error_code::invalid_transfer,
        "the clearing account cannot receive deposits",
        turnstile::schema::kTransferCodespace);
  }

  const auto reference_id = turnstile::blake3::hasher{}
                                .update(kDepositReferenceDomain)
                                .update(static_cast<uint64_t>(processor.size()))
                                .update(processor)
                                .update(static_cast<uint64_t>(
                                    external_reference.size()))
                                .update(external_reference)
                                .finalize();

  // The deposit row stays locked until commit, so a concurrent retry of the
  // same payment waits here and then sees the committed record.
  auto txn = storage_.begin();
  auto deposit_key = turnstile::schema::key::make_deposit_key(reference_id);
  auto existing = txn.get_for_update<turnstile::schema::deposit_record_t>(
      encoder_, deposit_key);
  if (existing.contended()) {
    return contended<transfer_receipt_t>("locking deposit reference");
  }
  if (existing.value.has_value()) {
    const auto& record = existing.value.value();
    if (record.user_id != user_id || record.amount != amount ||
        record.currency != currency) {
      return rejected<transfer_receipt_t>(
          ledger_error_code::invalid_transfer,
          fmt::format("{} reference {} already funded a different deposit",
                      processor, external_reference),
          turnstile::schema::kTransferCodespace);
    }
    return replay_deposit(record);
  }

  const auto now = clock_();
  auto opened = wallets_.open_wallet(txn, user_id, currency, now);
  if (opened.contended()) {
    return contended<transfer_receipt_t>("opening wallet");
  }
  auto& wallet = opened.value.value();
  if (wallet.currency != currency) {
    return rejected<transfer_receipt_t>(
        ledger_error_code::currency_mismatch,
        fmt::format("cannot deposit {} into a {} wallet", currency,
                    wallet.currency),
        turnstile::schema::kTransferCodespace);
  }

  const auto delta = static_cast<int64_t>(amount);
  auto credited = wallets_.apply_delta(txn, wallet, {delta, delta}, now);
  if (credited.write.contended()) {
    return contended<transfer_receipt_t>("crediting wallet");
  }
  if (credited.write.rows_affected != 1) {
    return integrity_failure<transfer_receipt_t>(
        fmt::format("deposit into wallet {} affected {} rows",
                    turnstile::schema::to_hex(wallet.wallet_id),
                    credited.write.rows_affected));
  }

  auto request = turnstile::schema::transfer_request_t{};
  request.from_user_id = clearing_id;
  request.to_user_id = user_id;
  request.amount = amount;
  request.transaction_type = turnstile::schema::transaction_type_t::deposit;
  request.reference_type = turnstile::schema::reference_type_t::deposit;
  request.reference_id = reference_id;
  request.metadata = turnstile::schema::deposit_metadata_t{
      .processor = std::string{processor},
      .external_reference = std::string{external_reference}};

  auto clearing = turnstile::schema::wallet_state_t{};
  clearing.wallet_id = make_wallet_id(clearing_id);
  clearing.user_id = clearing_id;
  clearing.currency = wallet.currency;

  auto receipt = transfer_receipt_t{};
  receipt.transaction_id =
      ids_.next(kTransactionIdDomain, clearing_id, user_id, amount);
  receipt.from_wallet = clearing;
  receipt.to_wallet = credited.wallet;
  receipt.debit = make_entry(receipt.transaction_id, clearing,
                             turnstile::schema::entry_type_t::debit, request,
                             fmt::format("Deposit via {}", processor), now);
  receipt.credit = make_entry(receipt.transaction_id, credited.wallet,
                              turnstile::schema::entry_type_t::credit, request,
                              fmt::format("Deposit via {}", processor), now);

  if (journal_.append(txn, receipt.debit) !=
          turnstile::storage::storage_status::ok ||
      journal_.append(txn, receipt.credit) !=
          turnstile::storage::storage_status::ok) {
    return contended<transfer_receipt_t>("journaling deposit");
  }
  auto record = turnstile::schema::deposit_record_t{};
  record.reference_id = reference_id;
  record.transaction_id = receipt.transaction_id;
  record.user_id = user_id;
  record.amount = amount;
  record.currency = wallet.currency;
  record.created_at = now;
  if (txn.put(encoder_, deposit_key, record) !=
      turnstile::storage::storage_status::ok) {
    return contended<transfer_receipt_t>("recording deposit reference");
  }
  if (txn.commit() != turnstile::storage::storage_status::ok) {
    return contended<transfer_receipt_t>("committing deposit");
  }

  spdlog::info("Deposited {} {} into wallet {} ({} {})", amount,
               wallet.currency, turnstile::schema::to_hex(wallet.wallet_id),
               processor, external_reference);
  notify_committed(receipt);
  return turnstile::schema::make_success(std::move(receipt));
}

receipt_result_t transfer_engine::replay_deposit(
    const turnstile::schema::deposit_record_t& record) const {
  using turnstile::schema::transfer_receipt_t;

  auto receipt = transfer_receipt_t{};
  receipt.transaction_id = record.transaction_id;
  auto halves = 0;
  for (auto& entry : journal_.entries_for_transaction(record.transaction_id)) {
    if (entry.entry_type == turnstile::schema::entry_type_t::debit) {
      receipt.debit = std::move(entry);
    } else {
      receipt.credit = std::move(entry);
    }
    ++halves;
  }
  auto wallet = wallets_.get_wallet(record.user_id);
  if (halves != 2 || !wallet.has_value()) {
    return integrity_failure<transfer_receipt_t>(fmt::format(
        "deposit {} has {} journal entries",
        turnstile::schema::to_hex(record.transaction_id), halves));
  }
  receipt.from_wallet.wallet_id = receipt.debit.wallet_id;
  receipt.from_wallet.user_id = receipt.debit.user_id;
  receipt.from_wallet.currency = record.currency;
  receipt.to_wallet = std::move(wallet.value());

  spdlog::info("Deposit reference {} already booked as {}",
               turnstile::schema::to_hex(record.reference_id),
               turnstile::schema::to_hex(record.transaction_id));
  return turnstile::schema::make_success(std::move(receipt));
}

turnstile::schema::operation_result<turnstile::schema::wallet_state_t>
transfer_engine::open_wallet(const turnstile::schema::user_id_t& user_id) {
  using turnstile::schema::wallet_state_t;

  auto txn = storage_.begin();
  auto opened = wallets_.open_wallet(txn, user_id, currency_, clock_());
  if (opened.contended()) {
    return contended<wallet_state_t>("opening wallet");
  }
  if (txn.commit() != turnstile::storage::storage_status::ok) {
    return contended<wallet_state_t>("committing wallet");
  }
  return turnstile::schema::make_success(std::move(opened.value.value()));
}

void transfer_engine::notify_committed(
    const turnstile::schema::transfer_receipt_t& receipt) const {
  if (!observer_) {
    return;
  }
  try {
    observer_(receipt);
  } catch (const std::exception& e) {
    spdlog::error("Commit observer failed for {}: {}",
                  turnstile::schema::to_hex(receipt.transaction_id), e.what());
  }
}

void transfer_engine::set_commit_observer(commit_observer_t observer) {
  observer_ = std::move(observer);
}

const std::string& transfer_engine::currency() const {
  return currency_;
}

turnstile::schema::timestamp_milliseconds_t transfer_engine::now() const {
  return clock_();
}

id_source& transfer_engine::ids() {
  return ids_;
}

wallet_store& transfer_engine::wallets() {
  return wallets_;
}

}  // namespace turnstile::ledger
