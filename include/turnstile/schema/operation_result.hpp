#pragma once

#include <turnstile/schema/ledger_error_code.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

// Schema type: operation result.
// Ledger workflow: typed outcome envelope for every wallet/event operation:
// code 0 carries a value, any other code is a ledger_error_code and carries a
// log line and codespace instead.
namespace turnstile::schema {

inline constexpr auto kTransferCodespace = std::string_view{"turnstile.transfer"};
inline constexpr auto kWalletCodespace = std::string_view{"turnstile.wallet"};
inline constexpr auto kEventCodespace = std::string_view{"turnstile.event"};

template <typename T>
struct operation_result final {
  uint32_t code{};
  std::string log;
  std::string codespace;
  std::optional<T> value;

  bool ok() const { return code == 0 && value.has_value(); }

  bool failed_with(const ledger_error_code error) const {
    return code == static_cast<uint32_t>(error);
  }

  std::optional<ledger_error_code> error() const {
    if (code == 0) {
      return std::nullopt;
    }
    return static_cast<ledger_error_code>(code);
  }
};

template <typename T>
operation_result<T> make_success(T value) {
  auto result = operation_result<T>{};
  result.value = std::move(value);
  return result;
}

template <typename T>
operation_result<T> make_failure(const ledger_error_code error,
                                 std::string log,
                                 const std::string_view codespace) {
  auto result = operation_result<T>{};
  result.code = static_cast<uint32_t>(error);
  result.log = std::move(log);
  result.codespace = std::string{codespace};
  return result;
}

/// Re-wrap a failure from one stage into the result type of the caller.
template <typename T, typename U>
operation_result<T> forward_failure(const operation_result<U>& failure) {
  auto result = operation_result<T>{};
  result.code = failure.code;
  result.log = failure.log;
  result.codespace = failure.codespace;
  return result;
}

}  // namespace turnstile::schema
