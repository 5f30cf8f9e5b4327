#include <turnstile/blake3/hash.hpp>
#include <turnstile/ledger/wallet_store.hpp>
#include <turnstile/schema/key/engine_keys.hpp>

#include <spdlog/spdlog.h>

#include <limits>

namespace turnstile::ledger {

namespace {

constexpr auto kWalletIdDomain = std::string_view{"turnstile.wallet.v1"};

// Applies a signed delta to an unsigned balance. False on underflow/overflow.
bool shift_balance(turnstile::schema::cents_t& balance, const int64_t delta) {
  if (delta < 0) {
    auto magnitude = static_cast<uint64_t>(-(delta + 1)) + 1;
    if (balance < magnitude) {
      return false;
    }
    balance -= magnitude;
    return true;
  }
  auto magnitude = static_cast<uint64_t>(delta);
  if (balance > std::numeric_limits<uint64_t>::max() - magnitude) {
    return false;
  }
  balance += magnitude;
  return true;
}

}  // namespace

turnstile::schema::wallet_id_t make_wallet_id(
    const turnstile::schema::user_id_t& user_id) {
  return turnstile::blake3::hasher{}
      .update(kWalletIdDomain)
      .update(user_id)
      .finalize();
}

wallet_store::wallet_store(encoder_t& encoder, storage_t& storage)
    : encoder_{encoder}, storage_{storage} {}

std::optional<turnstile::schema::wallet_state_t> wallet_store::get_wallet(
    const turnstile::schema::user_id_t& user_id) const {
  auto key = turnstile::schema::key::make_wallet_key(user_id);
  return storage_.get<turnstile::schema::wallet_state_t>(encoder_, key);
}

turnstile::storage::read_result<turnstile::schema::wallet_state_t>
wallet_store::lock_wallet(transaction_t& txn,
                          const turnstile::schema::user_id_t& user_id) const {
  auto key = turnstile::schema::key::make_wallet_key(user_id);
  return txn.get_for_update<turnstile::schema::wallet_state_t>(encoder_, key);
}

delta_result wallet_store::apply_delta(
    transaction_t& txn,
    const turnstile::schema::wallet_state_t& locked,
    const balance_delta& delta,
    const turnstile::schema::timestamp_milliseconds_t now) const {
  auto result = delta_result{};
  auto key = turnstile::schema::key::make_wallet_key(locked.user_id);
  result.write = txn.update<turnstile::schema::wallet_state_t>(
      encoder_, key, [&](turnstile::schema::wallet_state_t& wallet) {
        auto available = wallet.available_balance;
        auto total = wallet.total_balance;
        if (!shift_balance(available, delta.available) ||
            !shift_balance(total, delta.total) || total < available) {
          spdlog::debug("Refusing balance delta ({}, {}) on wallet {}",
                        delta.available, delta.total,
                        turnstile::schema::to_hex(wallet.wallet_id));
          return false;
        }
        wallet.available_balance = available;
        wallet.total_balance = total;
        wallet.updated_at = now;
        result.wallet = wallet;
        return true;
      });
  return result;
}

turnstile::storage::read_result<turnstile::schema::wallet_state_t>
wallet_store::open_wallet(
    transaction_t& txn,
    const turnstile::schema::user_id_t& user_id,
    const std::string_view currency,
    const turnstile::schema::timestamp_milliseconds_t now) const {
  auto existing = lock_wallet(txn, user_id);
  if (existing.contended() || existing.value.has_value()) {
    return existing;
  }

  auto wallet = turnstile::schema::wallet_state_t{};
  wallet.wallet_id = make_wallet_id(user_id);
  wallet.user_id = user_id;
  wallet.currency = std::string{currency};
  wallet.created_at = now;
  wallet.updated_at = now;

  auto key = turnstile::schema::key::make_wallet_key(user_id);
  auto status = txn.put(encoder_, key, wallet);
  if (status != turnstile::storage::storage_status::ok) {
    return {status, std::nullopt};
  }
  spdlog::info("Opened wallet {} for user {}",
               turnstile::schema::to_hex(wallet.wallet_id),
               turnstile::schema::to_hex(user_id));
  return {turnstile::storage::storage_status::ok, wallet};
}

std::vector<turnstile::schema::wallet_state_t> wallet_store::list_wallets()
    const {
  auto wallets = std::vector<turnstile::schema::wallet_state_t>{};
  auto prefix =
      turnstile::schema::key::make_prefix(turnstile::schema::key::kWalletKeyPrefix);
  for (const auto& [key, value] : storage_.list_by_prefix(prefix)) {
    wallets.push_back(
        encoder_.decode<turnstile::schema::wallet_state_t>(value));
  }
  return wallets;
}

}  // namespace turnstile::ledger
