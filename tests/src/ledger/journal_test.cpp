#include <gtest/gtest.h>
#include <turnstile/testing/ledger_fixture.hpp>

namespace {

turnstile::schema::transfer_request_t make_payment(
    const turnstile::schema::user_id_t& from,
    const turnstile::schema::user_id_t& to,
    const turnstile::schema::cents_t amount) {
  auto request = turnstile::schema::transfer_request_t{};
  request.from_user_id = from;
  request.to_user_id = to;
  request.amount = amount;
  request.debit_description = "sent";
  request.credit_description = "received";
  return request;
}

}  // namespace

TEST(journal, transfer_writes_a_balanced_pair) {
  auto fixture = turnstile::testing::ledger_fixture{"turnstile_journal_pair"};
  auto alice = turnstile::testing::make_hash(1);
  auto bob = turnstile::testing::make_hash(2);
  fixture.fund(alice, 5'000);
  fixture.fund(bob, 1);

  auto receipt = fixture.transfers().transfer(make_payment(alice, bob, 1'250));
  ASSERT_TRUE(receipt.ok());

  auto entries =
      fixture.journal().entries_for_transaction(receipt.value->transaction_id);
  ASSERT_EQ(entries.size(), 2u);
  EXPECT_EQ(entries[0].entry_type, turnstile::schema::entry_type_t::debit);
  EXPECT_EQ(entries[1].entry_type, turnstile::schema::entry_type_t::credit);
  for (const auto& entry : entries) {
    EXPECT_EQ(entry.amount, 1'250u);
    EXPECT_EQ(entry.transaction_type,
              turnstile::schema::transaction_type_t::payment);
  }
  EXPECT_EQ(entries[0].user_id, alice);
  EXPECT_EQ(entries[0].balance_after, 3'750u);
  EXPECT_EQ(entries[1].user_id, bob);
  EXPECT_EQ(entries[1].balance_after, 1'251u);
  EXPECT_EQ(fixture.journal().sum_by_transaction(receipt.value->transaction_id),
            0);
}

TEST(journal, unknown_transaction_has_no_entries) {
  auto fixture = turnstile::testing::ledger_fixture{"turnstile_journal_unknown"};
  auto missing = turnstile::testing::make_hash(77);
  EXPECT_TRUE(fixture.journal().entries_for_transaction(missing).empty());
  EXPECT_EQ(fixture.journal().sum_by_transaction(missing), 0);
}

TEST(journal, wallet_history_is_newest_first) {
  auto fixture = turnstile::testing::ledger_fixture{"turnstile_journal_history"};
  auto alice = turnstile::testing::make_hash(1);
  auto bob = turnstile::testing::make_hash(2);
  fixture.fund(alice, 1'000);
  ASSERT_TRUE(fixture.transfers().open_wallet(bob).ok());

  for (auto amount : {100u, 200u, 300u}) {
    fixture.advance(1'000);
    ASSERT_TRUE(fixture.transfers().transfer(make_payment(alice, bob, amount)).ok());
  }

  auto history = fixture.journal().entries_for_wallet(alice, 0);
  ASSERT_EQ(history.size(), 4u);
  EXPECT_EQ(history[0].amount, 300u);
  EXPECT_EQ(history[0].balance_after, 400u);
  EXPECT_EQ(history[1].amount, 200u);
  EXPECT_EQ(history[2].amount, 100u);
  EXPECT_EQ(history[3].transaction_type,
            turnstile::schema::transaction_type_t::deposit);

  auto latest = fixture.journal().entries_for_wallet(alice, 2);
  ASSERT_EQ(latest.size(), 2u);
  EXPECT_EQ(latest[1].amount, 200u);

  auto bob_history = fixture.journal().entries_for_wallet(bob, 0);
  ASSERT_EQ(bob_history.size(), 3u);
  EXPECT_EQ(bob_history[0].entry_type, turnstile::schema::entry_type_t::credit);
}

TEST(journal, reconcile_is_clean_after_normal_traffic) {
  auto fixture = turnstile::testing::ledger_fixture{"turnstile_journal_clean"};
  auto alice = turnstile::testing::make_hash(1);
  auto bob = turnstile::testing::make_hash(2);
  fixture.fund(alice, 10'000);
  fixture.fund(bob, 2'000);
  ASSERT_TRUE(fixture.transfers().transfer(make_payment(alice, bob, 4'000)).ok());
  ASSERT_TRUE(fixture.transfers().transfer(make_payment(bob, alice, 500)).ok());

  auto report = fixture.journal().reconcile();
  EXPECT_TRUE(report.clean());
  EXPECT_EQ(report.transaction_count, 4u);
  EXPECT_EQ(report.entry_count, 8u);
  EXPECT_EQ(report.wallets_checked, 2u);
  EXPECT_EQ(report.total_debits, report.total_credits);
}

TEST(journal, reconcile_flags_wallet_changed_outside_the_journal) {
  auto fixture = turnstile::testing::ledger_fixture{"turnstile_journal_drift"};
  auto alice = turnstile::testing::make_hash(1);
  fixture.fund(alice, 1'000);

  auto txn = fixture.storage().begin();
  auto locked = fixture.wallets().lock_wallet(txn, alice);
  ASSERT_TRUE(locked.value.has_value());
  ASSERT_EQ(fixture.wallets()
                .apply_delta(txn, locked.value.value(), {25, 25}, fixture.now())
                .write.rows_affected,
            1u);
  ASSERT_EQ(txn.commit(), turnstile::storage::storage_status::ok);

  auto report = fixture.journal().reconcile();
  EXPECT_FALSE(report.clean());
  ASSERT_EQ(report.mismatched_wallets.size(), 1u);
  EXPECT_EQ(report.mismatched_wallets[0], turnstile::ledger::make_wallet_id(alice));
  EXPECT_TRUE(report.unbalanced_transactions.empty());
}
