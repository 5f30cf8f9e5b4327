#include <gtest/gtest.h>
#include <turnstile/testing/ledger_fixture.hpp>

#include <atomic>
#include <thread>
#include <vector>

namespace {

turnstile::schema::transfer_request_t make_payment(
    const turnstile::schema::user_id_t& from,
    const turnstile::schema::user_id_t& to,
    const turnstile::schema::cents_t amount) {
  auto request = turnstile::schema::transfer_request_t{};
  request.from_user_id = from;
  request.to_user_id = to;
  request.amount = amount;
  return request;
}

}  // namespace

TEST(concurrency, opposite_transfers_conserve_money) {
  auto fixture = turnstile::testing::ledger_fixture{"turnstile_concurrency_swap"};
  auto a = turnstile::testing::make_hash(1);
  auto b = turnstile::testing::make_hash(100);
  fixture.fund(a, 5'000);
  fixture.fund(b, 5'000);

  constexpr auto kRounds = 200;
  auto committed = std::atomic<uint64_t>{0};
  auto worker = [&](const turnstile::schema::user_id_t& from,
                    const turnstile::schema::user_id_t& to) {
    for (auto i = 0; i < kRounds; ++i) {
      auto result = fixture.transfers().transfer(make_payment(from, to, 7));
      if (result.ok()) {
        ++committed;
        continue;
      }
      // Losing a lock race is the only acceptable failure besides running dry.
      EXPECT_TRUE(
          result.failed_with(
              turnstile::schema::ledger_error_code::storage_contention) ||
          result.failed_with(
              turnstile::schema::ledger_error_code::insufficient_funds))
          << result.log;
    }
  };

  auto threads = std::vector<std::thread>{};
  threads.emplace_back(worker, a, b);
  threads.emplace_back(worker, b, a);
  threads.emplace_back(worker, a, b);
  threads.emplace_back(worker, b, a);
  for (auto& thread : threads) {
    thread.join();
  }

  EXPECT_GT(committed.load(), 0u);
  EXPECT_EQ(fixture.balance(a) + fixture.balance(b), 10'000u);
  auto report = fixture.journal().reconcile();
  EXPECT_TRUE(report.clean());
  EXPECT_EQ(report.transaction_count, committed.load() + 2);
}

TEST(concurrency, parallel_spenders_never_overdraw) {
  auto fixture = turnstile::testing::ledger_fixture{"turnstile_concurrency_drain"};
  auto payer = turnstile::testing::make_hash(1);
  fixture.fund(payer, 1'000);
  auto payees = std::vector<turnstile::schema::user_id_t>{};
  for (uint8_t seed = 50; seed < 58; ++seed) {
    payees.push_back(turnstile::testing::make_hash(seed));
    ASSERT_TRUE(fixture.transfers().open_wallet(payees.back()).ok());
  }

  auto committed = std::atomic<uint64_t>{0};
  auto threads = std::vector<std::thread>{};
  for (const auto& payee : payees) {
    threads.emplace_back([&fixture, &committed, &payer, payee] {
      for (auto i = 0; i < 10; ++i) {
        if (fixture.transfers().transfer(make_payment(payer, payee, 30)).ok()) {
          ++committed;
        }
      }
    });
  }
  for (auto& thread : threads) {
    thread.join();
  }

  EXPECT_LE(committed.load() * 30, 1'000u);
  EXPECT_EQ(fixture.balance(payer), 1'000u - committed.load() * 30);
  auto paid_out = turnstile::schema::cents_t{};
  for (const auto& payee : payees) {
    paid_out += fixture.balance(payee);
  }
  EXPECT_EQ(paid_out, committed.load() * 30);
  EXPECT_TRUE(fixture.journal().reconcile().clean());
}
