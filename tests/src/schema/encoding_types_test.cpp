#include <gtest/gtest.h>
#include <turnstile/schema/encoding/scale/encoder.hpp>
#include <turnstile/testing/common.hpp>

#include <string>
#include <variant>

namespace {

turnstile::schema::ledger_entry_t make_tip_entry() {
  auto entry = turnstile::schema::ledger_entry_t{};
  entry.transaction_id = turnstile::testing::make_hash(1);
  entry.wallet_id = turnstile::testing::make_hash(2);
  entry.user_id = turnstile::testing::make_hash(3);
  entry.entry_type = turnstile::schema::entry_type_t::credit;
  entry.transaction_type = turnstile::schema::transaction_type_t::tip;
  entry.amount = 500;
  entry.balance_after = 10'500;
  entry.reference_type = turnstile::schema::reference_type_t::event_tip;
  entry.reference_id = turnstile::testing::make_hash(4);
  entry.description = "Tip received";
  entry.metadata = turnstile::schema::tip_metadata_t{
      .event_id = turnstile::testing::make_hash(5),
      .from_user_id = turnstile::testing::make_hash(6),
      .to_user_id = turnstile::testing::make_hash(3),
      .message = std::string{"great set"},
      .is_anonymous = true};
  entry.created_at = 1'700'000'000'123;
  return entry;
}

}  // namespace

TEST(encoding_types, ledger_entry_keeps_metadata_alternative) {
  auto encoder = turnstile::schema::encoding::encoder<
      turnstile::schema::encoding::scale_encoder_tag>{};
  auto entry = make_tip_entry();
  auto encoded = encoder.encode(entry);
  auto decoded = encoder.decode<turnstile::schema::ledger_entry_t>(
      turnstile::schema::make_bytes_view(encoded));

  EXPECT_EQ(decoded.transaction_id, entry.transaction_id);
  EXPECT_EQ(decoded.entry_type, turnstile::schema::entry_type_t::credit);
  EXPECT_EQ(decoded.transaction_type, turnstile::schema::transaction_type_t::tip);
  EXPECT_EQ(decoded.amount, 500u);
  EXPECT_EQ(decoded.balance_after, 10'500u);
  EXPECT_EQ(decoded.currency, "USD");
  EXPECT_EQ(decoded.created_at, entry.created_at);
  ASSERT_TRUE(
      std::holds_alternative<turnstile::schema::tip_metadata_t>(decoded.metadata));
  const auto& tip = std::get<turnstile::schema::tip_metadata_t>(decoded.metadata);
  EXPECT_TRUE(tip.is_anonymous);
  ASSERT_TRUE(tip.message.has_value());
  EXPECT_EQ(tip.message.value(), "great set");
}

TEST(encoding_types, event_state_keeps_optional_fields_empty) {
  auto encoder = turnstile::schema::encoding::encoder<
      turnstile::schema::encoding::scale_encoder_tag>{};
  auto event = turnstile::schema::event_state_t{};
  event.event_id = turnstile::testing::make_hash(7);
  event.creator_id = turnstile::testing::make_hash(8);
  event.title = "Late show";
  event.status = turnstile::schema::event_status_t::live;
  event.access_type = turnstile::schema::access_type_t::ticketed;
  event.ticket_price_cents = 2'500;
  event.actual_start_at = 42;

  auto decoded = encoder.decode<turnstile::schema::event_state_t>(
      turnstile::schema::make_bytes_view(encoder.encode(event)));
  EXPECT_EQ(decoded.status, turnstile::schema::event_status_t::live);
  EXPECT_EQ(decoded.access_type, turnstile::schema::access_type_t::ticketed);
  EXPECT_FALSE(decoded.max_attendees.has_value());
  ASSERT_TRUE(decoded.actual_start_at.has_value());
  EXPECT_EQ(decoded.actual_start_at.value(), 42u);
  EXPECT_FALSE(decoded.actual_end_at.has_value());
}

TEST(encoding_types, try_decode_rejects_truncated_bytes) {
  auto encoder = turnstile::schema::encoding::encoder<
      turnstile::schema::encoding::scale_encoder_tag>{};
  auto encoded = encoder.encode(make_tip_entry());
  encoded.resize(encoded.size() / 2);
  EXPECT_FALSE(encoder
                   .try_decode<turnstile::schema::ledger_entry_t>(
                       turnstile::schema::make_bytes_view(encoded))
                   .has_value());
}

TEST(encoding_types, enum_names_round_trip_through_strings) {
  using namespace turnstile::schema;
  EXPECT_EQ(to_string(event_status_t::cancelled), "cancelled");
  EXPECT_EQ(try_from_string<event_status_t>("live"), event_status_t::live);
  EXPECT_EQ(try_from_string<access_type_t>("tier_gated"),
            access_type_t::tier_gated);
  EXPECT_EQ(try_from_string<transaction_type_t>("refund"),
            transaction_type_t::refund);
  EXPECT_EQ(try_from_string<reference_type_t>("deposit"),
            reference_type_t::deposit);
  EXPECT_FALSE(try_from_string<entry_type_t>("sideways").has_value());
  EXPECT_TRUE(is_terminal(event_status_t::ended));
  EXPECT_FALSE(is_terminal(event_status_t::live));
}
