#include <gtest/gtest.h>
#include <turnstile/schema/key/builder.hpp>
#include <turnstile/schema/key/engine_keys.hpp>
#include <turnstile/testing/common.hpp>

#include <algorithm>
#include <string_view>

namespace {

bool starts_with(const turnstile::schema::bytes_t& key,
                 const turnstile::schema::bytes_t& prefix) {
  return key.size() >= prefix.size() &&
         std::equal(std::begin(prefix), std::end(prefix), std::begin(key));
}

}  // namespace

TEST(engine_keys, keyspaces_do_not_shadow_each_other) {
  using namespace turnstile::schema::key;
  EXPECT_FALSE(std::string_view{kWalletKeyPrefix}.starts_with(kEventKeyPrefix));
  EXPECT_FALSE(std::string_view{kLedgerEntryKeyPrefix}.starts_with(
      kWalletHistoryKeyPrefix));
  for (const auto prefix : kEngineKeyspaces) {
    EXPECT_TRUE(prefix.starts_with("SYS|"));
  }
}

TEST(engine_keys, ticket_keys_share_the_event_prefix) {
  auto event_id = turnstile::testing::make_hash(1);
  auto other_event = turnstile::testing::make_hash(2);
  auto fan = turnstile::testing::make_hash(3);

  auto prefix = turnstile::schema::key::make_ticket_prefix(event_id);
  EXPECT_TRUE(starts_with(turnstile::schema::key::make_ticket_key(event_id, fan),
                          prefix));
  EXPECT_FALSE(starts_with(
      turnstile::schema::key::make_ticket_key(other_event, fan), prefix));
}

TEST(engine_keys, tip_keys_sort_by_time) {
  auto event_id = turnstile::testing::make_hash(1);
  // The later tip has the smaller id, so only the timestamp can order them.
  auto early = turnstile::schema::key::make_tip_key(
      event_id, 1'000, turnstile::testing::make_hash(200));
  auto late = turnstile::schema::key::make_tip_key(
      event_id, 256'000, turnstile::testing::make_hash(10));
  EXPECT_LT(early, late);
}

TEST(engine_keys, ledger_entry_keys_group_a_transaction) {
  auto transaction_id = turnstile::testing::make_hash(9);
  auto prefix =
      turnstile::schema::key::make_ledger_transaction_prefix(transaction_id);
  auto debit = turnstile::schema::key::make_ledger_entry_key(
      transaction_id, turnstile::schema::entry_type_t::debit);
  auto credit = turnstile::schema::key::make_ledger_entry_key(
      transaction_id, turnstile::schema::entry_type_t::credit);
  EXPECT_TRUE(starts_with(debit, prefix));
  EXPECT_TRUE(starts_with(credit, prefix));
  EXPECT_NE(debit, credit);
  EXPECT_EQ(debit.size(), prefix.size() + 1);
}

TEST(key_builder, write_ordered_is_big_endian) {
  auto b = turnstile::schema::key::builder{};
  b.write_ordered(0x0102030405060708ull);
  ASSERT_EQ(b.data.size(), 8u);
  EXPECT_EQ(b.data.front(), 0x01);
  EXPECT_EQ(b.data.back(), 0x08);
}
