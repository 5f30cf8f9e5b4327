#include <gtest/gtest.h>
#include <turnstile/schema/encoding/scale/encoder.hpp>
#include <turnstile/schema/key/engine_keys.hpp>
#include <turnstile/storage/rocksdb/storage.hpp>
#include <turnstile/storage/storage.hpp>
#include <turnstile/testing/common.hpp>

#include <string>

namespace {

using storage_t =
    turnstile::storage::storage<turnstile::storage::rocksdb_storage_tag>;
using encoder_t = turnstile::schema::encoding::encoder<
    turnstile::schema::encoding::scale_encoder_tag>;

turnstile::schema::wallet_state_t make_wallet(const uint8_t seed,
                                              const uint64_t balance) {
  auto wallet = turnstile::schema::wallet_state_t{};
  wallet.wallet_id = turnstile::testing::make_hash(seed);
  wallet.user_id = turnstile::testing::make_hash(seed + 1);
  wallet.available_balance = balance;
  wallet.total_balance = balance;
  return wallet;
}

class scratch_db final {
 public:
  explicit scratch_db(const std::string& prefix,
                      const int64_t lock_timeout_ms = 1000)
      : path_{turnstile::testing::make_db_path(prefix)},
        storage_{turnstile::storage::make_storage<
            turnstile::storage::rocksdb_storage_tag>(
            turnstile::storage::storage_options{path_, lock_timeout_ms})} {}

  scratch_db(const scratch_db&) = delete;
  scratch_db& operator=(const scratch_db&) = delete;
  scratch_db(scratch_db&&) = delete;
  scratch_db& operator=(scratch_db&&) = delete;

  ~scratch_db() {
    storage_.database.reset();
    turnstile::testing::remove_path(path_);
  }

  storage_t& storage() { return storage_; }

 private:
  std::string path_;
  storage_t storage_;
};

}  // namespace

TEST(storage_types, result_defaults_are_ok_and_empty) {
  auto read = turnstile::storage::read_result<int>{};
  EXPECT_FALSE(read.contended());
  EXPECT_FALSE(read.value.has_value());

  auto write = turnstile::storage::write_result{};
  EXPECT_FALSE(write.contended());
  EXPECT_EQ(write.rows_affected, 0u);

  auto entry = turnstile::storage::key_value_entry_t{};
  EXPECT_TRUE(entry.first.empty());
  EXPECT_TRUE(entry.second.empty());
}

TEST(storage_types, committed_writes_are_visible_outside_the_transaction) {
  auto db = scratch_db{"turnstile_storage_commit"};
  auto encoder = encoder_t{};
  auto wallet = make_wallet(1, 700);
  auto key = turnstile::schema::key::make_wallet_key(wallet.user_id);
  {
    auto txn = db.storage().begin();
    ASSERT_EQ(txn.put(encoder, key, wallet), turnstile::storage::storage_status::ok);
    auto staged = txn.get<turnstile::schema::wallet_state_t>(encoder, key);
    ASSERT_TRUE(staged.value.has_value());
    EXPECT_EQ(staged.value->available_balance, 700u);
    EXPECT_FALSE(
        db.storage().get<turnstile::schema::wallet_state_t>(encoder, key).has_value());
    ASSERT_EQ(txn.commit(), turnstile::storage::storage_status::ok);
  }
  auto loaded = db.storage().get<turnstile::schema::wallet_state_t>(encoder, key);
  ASSERT_TRUE(loaded.has_value());
  EXPECT_EQ(loaded->wallet_id, wallet.wallet_id);
}

TEST(storage_types, dropped_transaction_rolls_back) {
  auto db = scratch_db{"turnstile_storage_rollback"};
  auto encoder = encoder_t{};
  auto wallet = make_wallet(2, 50);
  auto key = turnstile::schema::key::make_wallet_key(wallet.user_id);
  {
    auto txn = db.storage().begin();
    ASSERT_EQ(txn.put(encoder, key, wallet), turnstile::storage::storage_status::ok);
  }
  EXPECT_FALSE(
      db.storage().get<turnstile::schema::wallet_state_t>(encoder, key).has_value());
}

TEST(storage_types, update_reports_rows_affected) {
  auto db = scratch_db{"turnstile_storage_update"};
  auto encoder = encoder_t{};
  auto wallet = make_wallet(3, 100);
  auto key = turnstile::schema::key::make_wallet_key(wallet.user_id);
  auto missing = turnstile::schema::key::make_wallet_key(
      turnstile::testing::make_hash(99));

  auto txn = db.storage().begin();
  ASSERT_EQ(txn.put(encoder, key, wallet), turnstile::storage::storage_status::ok);

  auto absent = txn.update<turnstile::schema::wallet_state_t>(
      encoder, missing, [](turnstile::schema::wallet_state_t&) { return true; });
  EXPECT_EQ(absent.rows_affected, 0u);

  auto refused = txn.update<turnstile::schema::wallet_state_t>(
      encoder, key, [](turnstile::schema::wallet_state_t& state) {
        return state.available_balance >= 500;
      });
  EXPECT_EQ(refused.rows_affected, 0u);

  auto applied = txn.update<turnstile::schema::wallet_state_t>(
      encoder, key, [](turnstile::schema::wallet_state_t& state) {
        state.available_balance -= 40;
        state.total_balance -= 40;
        return true;
      });
  EXPECT_EQ(applied.rows_affected, 1u);
  ASSERT_EQ(txn.commit(), turnstile::storage::storage_status::ok);

  auto loaded = db.storage().get<turnstile::schema::wallet_state_t>(encoder, key);
  ASSERT_TRUE(loaded.has_value());
  EXPECT_EQ(loaded->available_balance, 60u);
}

TEST(storage_types, list_by_prefix_stops_at_prefix_boundary) {
  auto db = scratch_db{"turnstile_storage_prefix"};
  auto encoder = encoder_t{};
  auto event_id = turnstile::testing::make_hash(10);
  auto other_event = turnstile::testing::make_hash(11);

  auto txn = db.storage().begin();
  auto ticket = turnstile::schema::event_ticket_t{};
  ticket.event_id = event_id;
  for (uint8_t fan = 20; fan < 23; ++fan) {
    ticket.fan_id = turnstile::testing::make_hash(fan);
    ASSERT_EQ(txn.put(encoder,
                      turnstile::schema::key::make_ticket_key(event_id, ticket.fan_id),
                      ticket),
              turnstile::storage::storage_status::ok);
  }
  ticket.event_id = other_event;
  ASSERT_EQ(txn.put(encoder,
                    turnstile::schema::key::make_ticket_key(other_event, ticket.fan_id),
                    ticket),
            turnstile::storage::storage_status::ok);

  EXPECT_EQ(txn.list_by_prefix(turnstile::schema::key::make_ticket_prefix(event_id))
                .size(),
            3u);
  ASSERT_EQ(txn.commit(), turnstile::storage::storage_status::ok);
  EXPECT_EQ(db.storage()
                .list_by_prefix(turnstile::schema::key::make_ticket_prefix(event_id))
                .size(),
            3u);
  EXPECT_EQ(db.storage()
                .list_by_prefix(turnstile::schema::key::make_ticket_prefix(other_event))
                .size(),
            1u);
}

TEST(storage_types, locked_row_reports_contention_to_second_writer) {
  auto db = scratch_db{"turnstile_storage_contention", 50};
  auto encoder = encoder_t{};
  auto wallet = make_wallet(4, 10);
  auto key = turnstile::schema::key::make_wallet_key(wallet.user_id);
  {
    auto seed = db.storage().begin();
    ASSERT_EQ(seed.put(encoder, key, wallet), turnstile::storage::storage_status::ok);
    ASSERT_EQ(seed.commit(), turnstile::storage::storage_status::ok);
  }

  auto holder = db.storage().begin();
  auto held = holder.get_for_update<turnstile::schema::wallet_state_t>(encoder, key);
  ASSERT_FALSE(held.contended());
  ASSERT_TRUE(held.value.has_value());

  auto waiter = db.storage().begin();
  auto blocked =
      waiter.get_for_update<turnstile::schema::wallet_state_t>(encoder, key);
  EXPECT_TRUE(blocked.contended());
  EXPECT_FALSE(blocked.value.has_value());

  holder.rollback();
  auto retried =
      waiter.get_for_update<turnstile::schema::wallet_state_t>(encoder, key);
  EXPECT_FALSE(retried.contended());
  EXPECT_TRUE(retried.value.has_value());
}
