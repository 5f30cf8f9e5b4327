#include <turnstile/schema/key/builder.hpp>
#include <turnstile/schema/key/engine_keys.hpp>

namespace turnstile::schema::key {

bytes_t make_prefix(const std::string_view prefix) {
  return make_bytes(prefix);
}

bytes_t make_wallet_key(const user_id_t& user_id) {
  auto b = builder{};
  b.write(kWalletKeyPrefix).write(user_id);
  return b.data;
}

bytes_t make_event_key(const event_id_t& event_id) {
  auto b = builder{};
  b.write(kEventKeyPrefix).write(event_id);
  return b.data;
}

bytes_t make_ticket_prefix(const event_id_t& event_id) {
  auto b = builder{};
  b.write(kTicketKeyPrefix).write(event_id);
  return b.data;
}

bytes_t make_ticket_key(const event_id_t& event_id, const user_id_t& fan_id) {
  auto b = builder{};
  b.write(kTicketKeyPrefix).write(event_id).write(fan_id);
  return b.data;
}

bytes_t make_tip_prefix(const event_id_t& event_id) {
  auto b = builder{};
  b.write(kTipKeyPrefix).write(event_id);
  return b.data;
}

bytes_t make_tip_key(const event_id_t& event_id,
                     const timestamp_milliseconds_t tipped_at,
                     const tip_id_t& tip_id) {
  auto b = builder{};
  b.write(kTipKeyPrefix).write(event_id).write_ordered(tipped_at).write(tip_id);
  return b.data;
}

bytes_t make_attendance_prefix(const event_id_t& event_id) {
  auto b = builder{};
  b.write(kAttendanceKeyPrefix).write(event_id);
  return b.data;
}

bytes_t make_attendance_key(const event_id_t& event_id,
                            const user_id_t& user_id) {
  auto b = builder{};
  b.write(kAttendanceKeyPrefix).write(event_id).write(user_id);
  return b.data;
}

bytes_t make_ledger_transaction_prefix(const transaction_id_t& transaction_id) {
  auto b = builder{};
  b.write(kLedgerEntryKeyPrefix).write(transaction_id);
  return b.data;
}

bytes_t make_ledger_entry_key(const transaction_id_t& transaction_id,
                              const entry_type_t entry_type) {
  auto b = builder{};
  b.write(kLedgerEntryKeyPrefix)
      .write(transaction_id)
      .write(static_cast<uint8_t>(entry_type));
  return b.data;
}

bytes_t make_wallet_history_prefix(const wallet_id_t& wallet_id) {
  auto b = builder{};
  b.write(kWalletHistoryKeyPrefix).write(wallet_id);
  return b.data;
}

bytes_t make_wallet_history_key(const wallet_id_t& wallet_id,
                                const timestamp_milliseconds_t created_at,
                                const transaction_id_t& transaction_id) {
  auto b = builder{};
  b.write(kWalletHistoryKeyPrefix)
      .write(wallet_id)
      .write_ordered(created_at)
      .write(transaction_id);
  return b.data;
}

bytes_t make_deposit_key(const hash32_t& reference_id) {
  auto b = builder{};
  b.write(kDepositKeyPrefix).write(reference_id);
  return b.data;
}

}  // namespace turnstile::schema::key
