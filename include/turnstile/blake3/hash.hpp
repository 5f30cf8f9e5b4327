#pragma once
#include <turnstile/schema/primitives.hpp>

#include <blake3.h>

#include <array>
#include <cstdint>
#include <span>
#include <string_view>
#include <type_traits>

namespace turnstile::blake3 {

/// Incremental BLAKE3 over mixed byte/string/integer fields. Integers are fed
/// little-endian so derived ids are stable across platforms.
class hasher final {
 public:
  hasher();

  hasher& update(const std::string_view& str);
  hasher& update(const std::span<const uint8_t>& bytes);

  template <typename T, typename = std::enable_if_t<std::is_integral_v<T>>>
  hasher& update(T value) {
    auto buffer = std::array<uint8_t, sizeof(T)>{};
    for (size_t i = 0; i < sizeof(T); ++i) {
      buffer[i] = static_cast<uint8_t>((value >> (i * 8)) & 0xFF);
    }
    return update(std::span<const uint8_t>{buffer.data(), buffer.size()});
  }

  turnstile::schema::hash32_t finalize() const;

 private:
  blake3_hasher state_;
};

turnstile::schema::hash32_t hash(const std::string_view& str);
turnstile::schema::hash32_t hash(const std::span<const uint8_t>& bytes);

}  // namespace turnstile::blake3
