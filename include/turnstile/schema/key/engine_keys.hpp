#pragma once

#include <turnstile/schema/entry_type.hpp>
#include <turnstile/schema/primitives.hpp>

#include <array>
#include <string_view>

// Schema key type: engine keys.
// Ledger workflow: canonical key prefixes and key builders for wallets, the
// ledger, and event-side state.
namespace turnstile::schema::key {

inline constexpr std::string_view kStatePrefix{"SYS|STATE|"};
inline constexpr std::string_view kWalletKeyPrefix{"SYS|STATE|WALLET|"};
inline constexpr std::string_view kEventKeyPrefix{"SYS|STATE|EVENT|"};
inline constexpr std::string_view kTicketKeyPrefix{"SYS|STATE|TICKET|"};
inline constexpr std::string_view kTipKeyPrefix{"SYS|STATE|TIP|"};
inline constexpr std::string_view kAttendanceKeyPrefix{"SYS|STATE|ATTEND|"};
inline constexpr std::string_view kLedgerPrefix{"SYS|LEDGER|"};
inline constexpr std::string_view kLedgerEntryKeyPrefix{"SYS|LEDGER|TX|"};
inline constexpr std::string_view kWalletHistoryKeyPrefix{
    "SYS|LEDGER|WALLET|"};
inline constexpr std::string_view kDepositKeyPrefix{"SYS|LEDGER|DEPOSIT|"};

inline constexpr std::array<std::string_view, 10> kEngineKeyspaces{
    kStatePrefix,          kWalletKeyPrefix,        kEventKeyPrefix,
    kTicketKeyPrefix,      kTipKeyPrefix,           kAttendanceKeyPrefix,
    kLedgerPrefix,         kLedgerEntryKeyPrefix,   kWalletHistoryKeyPrefix,
    kDepositKeyPrefix};

bytes_t make_prefix(std::string_view prefix);

bytes_t make_wallet_key(const user_id_t& user_id);

bytes_t make_event_key(const event_id_t& event_id);

bytes_t make_ticket_prefix(const event_id_t& event_id);
bytes_t make_ticket_key(const event_id_t& event_id, const user_id_t& fan_id);

bytes_t make_tip_prefix(const event_id_t& event_id);
bytes_t make_tip_key(const event_id_t& event_id,
                     timestamp_milliseconds_t tipped_at,
                     const tip_id_t& tip_id);

bytes_t make_attendance_prefix(const event_id_t& event_id);
bytes_t make_attendance_key(const event_id_t& event_id,
                            const user_id_t& user_id);

bytes_t make_ledger_transaction_prefix(const transaction_id_t& transaction_id);
bytes_t make_ledger_entry_key(const transaction_id_t& transaction_id,
                              entry_type_t entry_type);

bytes_t make_wallet_history_prefix(const wallet_id_t& wallet_id);
bytes_t make_wallet_history_key(const wallet_id_t& wallet_id,
                                timestamp_milliseconds_t created_at,
                                const transaction_id_t& transaction_id);

bytes_t make_deposit_key(const hash32_t& reference_id);

}  // namespace turnstile::schema::key
