#include <gtest/gtest.h>
#include <turnstile/testing/ledger_fixture.hpp>

#include <variant>

namespace {

using turnstile::schema::access_type_t;
using turnstile::schema::event_status_t;
using turnstile::schema::ledger_error_code;

}  // namespace

TEST(refund_cascade, cancel_refunds_ticket_and_resets_revenue) {
  auto fixture = turnstile::testing::ledger_fixture{"turnstile_refund_single"};
  auto creator = turnstile::testing::make_hash(1);
  auto fan = turnstile::testing::make_hash(2);
  fixture.fund(fan, 5'000);
  auto event = fixture.make_event(creator, access_type_t::ticketed, 5'000);
  ASSERT_TRUE(fixture.events().purchase_ticket(event.event_id, fan, 5'000).ok());
  ASSERT_EQ(fixture.balance(creator), 5'000u);

  fixture.advance(2'000);
  auto cancelled = fixture.events().cancel_event(event.event_id, creator);
  ASSERT_TRUE(cancelled.ok()) << cancelled.log;
  EXPECT_EQ(cancelled.value->status, event_status_t::cancelled);
  EXPECT_EQ(cancelled.value->total_revenue_cents, 0u);

  EXPECT_EQ(fixture.balance(fan), 5'000u);
  EXPECT_EQ(fixture.balance(creator), 0u);

  auto ticket = fixture.events().get_ticket(event.event_id, fan);
  ASSERT_TRUE(ticket.has_value());
  ASSERT_TRUE(ticket->refunded_at.has_value());
  EXPECT_EQ(ticket->refunded_at.value(), fixture.now());
  ASSERT_TRUE(ticket->refund_transaction_id.has_value());

  auto refund = fixture.journal().entries_for_transaction(
      ticket->refund_transaction_id.value());
  ASSERT_EQ(refund.size(), 2u);
  EXPECT_EQ(refund[0].user_id, creator);
  EXPECT_EQ(refund[0].amount, 5'000u);
  EXPECT_EQ(refund[1].user_id, fan);
  EXPECT_EQ(refund[1].transaction_type, turnstile::schema::transaction_type_t::refund);
  ASSERT_TRUE(
      std::holds_alternative<turnstile::schema::refund_metadata_t>(refund[1].metadata));
  EXPECT_EQ(std::get<turnstile::schema::refund_metadata_t>(refund[1].metadata)
                .original_transaction_id,
            ticket->transaction_id);

  EXPECT_EQ(fixture.events().get_event(event.event_id)->total_revenue_cents, 0u);
  EXPECT_TRUE(fixture.journal().reconcile().clean());
}

TEST(refund_cascade, cancelling_twice_never_refunds_twice) {
  auto fixture = turnstile::testing::ledger_fixture{"turnstile_refund_twice"};
  auto creator = turnstile::testing::make_hash(1);
  auto fan_a = turnstile::testing::make_hash(2);
  auto fan_b = turnstile::testing::make_hash(3);
  fixture.fund(fan_a, 3'000);
  fixture.fund(fan_b, 3'000);
  auto event = fixture.make_event(creator, access_type_t::ticketed, 3'000);
  ASSERT_TRUE(fixture.events().purchase_ticket(event.event_id, fan_a, 3'000).ok());
  ASSERT_TRUE(fixture.events().purchase_ticket(event.event_id, fan_b, 3'000).ok());

  ASSERT_TRUE(fixture.events().cancel_event(event.event_id, creator).ok());
  auto again = fixture.events().cancel_event(event.event_id, creator);
  ASSERT_TRUE(again.ok());
  EXPECT_EQ(again.value->status, event_status_t::cancelled);

  EXPECT_EQ(fixture.balance(fan_a), 3'000u);
  EXPECT_EQ(fixture.balance(fan_b), 3'000u);
  EXPECT_EQ(fixture.balance(creator), 0u);
  // Two deposits, two purchases, two refunds.
  EXPECT_EQ(fixture.journal().reconcile().transaction_count, 6u);
}

TEST(refund_cascade, cancelled_event_sells_nothing) {
  auto fixture = turnstile::testing::ledger_fixture{"turnstile_refund_closed"};
  auto creator = turnstile::testing::make_hash(1);
  auto fan = turnstile::testing::make_hash(2);
  fixture.fund(fan, 3'000);
  auto event = fixture.make_event(creator, access_type_t::ticketed, 1'000);
  ASSERT_TRUE(fixture.events().cancel_event(event.event_id, creator).ok());

  auto purchase = fixture.events().purchase_ticket(event.event_id, fan, 1'000);
  EXPECT_TRUE(purchase.failed_with(ledger_error_code::event_not_purchasable));
  EXPECT_EQ(fixture.balance(fan), 3'000u);
}

TEST(refund_cascade, only_creator_may_cancel) {
  auto fixture = turnstile::testing::ledger_fixture{"turnstile_refund_owner"};
  auto creator = turnstile::testing::make_hash(1);
  auto stranger = turnstile::testing::make_hash(9);
  auto event = fixture.make_event(creator, access_type_t::free, 0);

  auto result = fixture.events().cancel_event(event.event_id, stranger);
  EXPECT_TRUE(result.failed_with(ledger_error_code::unauthorized));
  EXPECT_EQ(fixture.events().get_event(event.event_id)->status,
            event_status_t::scheduled);
}

TEST(refund_cascade, stalled_cascade_resumes_after_creator_is_funded) {
  auto fixture = turnstile::testing::ledger_fixture{"turnstile_refund_resume"};
  auto creator = turnstile::testing::make_hash(1);
  auto spender = turnstile::testing::make_hash(200);
  auto fan_a = turnstile::testing::make_hash(2);
  auto fan_b = turnstile::testing::make_hash(3);
  fixture.fund(fan_a, 4'000);
  fixture.fund(fan_b, 4'000);
  ASSERT_TRUE(fixture.transfers().open_wallet(spender).ok());
  auto event = fixture.make_event(creator, access_type_t::ticketed, 4'000);
  ASSERT_TRUE(fixture.events().purchase_ticket(event.event_id, fan_a, 4'000).ok());
  ASSERT_TRUE(fixture.events().purchase_ticket(event.event_id, fan_b, 4'000).ok());

  // The creator spends part of the proceeds, so only one refund can clear.
  auto spend = turnstile::schema::transfer_request_t{};
  spend.from_user_id = creator;
  spend.to_user_id = spender;
  spend.amount = 3'000;
  ASSERT_TRUE(fixture.transfers().transfer(spend).ok());

  auto stalled = fixture.events().cancel_event(event.event_id, creator);
  EXPECT_TRUE(stalled.failed_with(ledger_error_code::refund_cascade_incomplete));
  EXPECT_EQ(fixture.events().get_event(event.event_id)->status,
            event_status_t::cancelled);
  EXPECT_EQ(fixture.events().get_event(event.event_id)->total_revenue_cents,
            8'000u);
  EXPECT_EQ(fixture.balance(fan_a) + fixture.balance(fan_b), 4'000u);
  EXPECT_EQ(fixture.balance(creator), 1'000u);

  fixture.fund(creator, 3'000);
  auto resumed = fixture.events().cancel_event(event.event_id, creator);
  ASSERT_TRUE(resumed.ok()) << resumed.log;
  EXPECT_EQ(resumed.value->total_revenue_cents, 0u);
  EXPECT_EQ(fixture.balance(fan_a), 4'000u);
  EXPECT_EQ(fixture.balance(fan_b), 4'000u);
  EXPECT_EQ(fixture.balance(creator), 0u);
  for (const auto& ticket : fixture.events().list_tickets(event.event_id)) {
    EXPECT_FALSE(turnstile::schema::is_active(ticket));
  }
  EXPECT_TRUE(fixture.journal().reconcile().clean());
}
