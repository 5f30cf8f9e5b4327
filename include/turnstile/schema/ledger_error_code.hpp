#pragma once

#include <turnstile/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <string_view>

namespace turnstile::schema {

enum class ledger_error_code : uint32_t {
  invalid_amount = 1,
  invalid_transfer = 2,
  currency_mismatch = 3,
  insufficient_funds = 10,
  wallet_not_found = 11,
  integrity_error = 12,
  storage_contention = 13,
  event_not_found = 20,
  event_not_purchasable = 21,
  event_not_live = 22,
  sold_out = 23,
  duplicate_ticket = 24,
  access_denied = 25,
  unauthorized = 26,
  invalid_transition = 27,
  refund_cascade_incomplete = 28,
  attendance_missing = 29,
};

inline constexpr auto kLedgerErrorCodeMappings = std::array{
    std::pair<std::string_view, ledger_error_code>{
        "invalid_amount", ledger_error_code::invalid_amount},
    std::pair<std::string_view, ledger_error_code>{
        "invalid_transfer", ledger_error_code::invalid_transfer},
    std::pair<std::string_view, ledger_error_code>{
        "currency_mismatch", ledger_error_code::currency_mismatch},
    std::pair<std::string_view, ledger_error_code>{
        "insufficient_funds", ledger_error_code::insufficient_funds},
    std::pair<std::string_view, ledger_error_code>{
        "wallet_not_found", ledger_error_code::wallet_not_found},
    std::pair<std::string_view, ledger_error_code>{
        "integrity_error", ledger_error_code::integrity_error},
    std::pair<std::string_view, ledger_error_code>{
        "storage_contention", ledger_error_code::storage_contention},
    std::pair<std::string_view, ledger_error_code>{
        "event_not_found", ledger_error_code::event_not_found},
    std::pair<std::string_view, ledger_error_code>{
        "event_not_purchasable", ledger_error_code::event_not_purchasable},
    std::pair<std::string_view, ledger_error_code>{
        "event_not_live", ledger_error_code::event_not_live},
    std::pair<std::string_view, ledger_error_code>{
        "sold_out", ledger_error_code::sold_out},
    std::pair<std::string_view, ledger_error_code>{
        "duplicate_ticket", ledger_error_code::duplicate_ticket},
    std::pair<std::string_view, ledger_error_code>{
        "access_denied", ledger_error_code::access_denied},
    std::pair<std::string_view, ledger_error_code>{
        "unauthorized", ledger_error_code::unauthorized},
    std::pair<std::string_view, ledger_error_code>{
        "invalid_transition", ledger_error_code::invalid_transition},
    std::pair<std::string_view, ledger_error_code>{
        "refund_cascade_incomplete",
        ledger_error_code::refund_cascade_incomplete},
    std::pair<std::string_view, ledger_error_code>{
        "attendance_missing", ledger_error_code::attendance_missing}};

inline constexpr std::string_view to_string(const ledger_error_code value) {
  return to_string(value, kLedgerErrorCodeMappings).value_or("unknown");
}

/// Only contention-style failures may be retried by the caller; everything
/// else is either a final business answer or an incident.
inline constexpr bool is_retryable(const ledger_error_code value) {
  return value == ledger_error_code::sold_out ||
         value == ledger_error_code::storage_contention;
}

}  // namespace turnstile::schema
