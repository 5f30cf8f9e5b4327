#pragma once
#include <turnstile/schema/primitives.hpp>

#include <cstdint>
#include <span>
#include <string_view>

namespace turnstile::schema::key {

/// Byte-key assembler. Fixed-width fields are written raw so that keys sharing
/// a prefix sort by the fields that follow it.
struct builder final {
  turnstile::schema::bytes_t data;

  builder& write(const std::string_view& str);
  builder& write(const std::span<const uint8_t>& bytes);
  builder& write(uint8_t value);

  // Big-endian so lexicographic key order equals numeric order.
  builder& write_ordered(uint64_t value);
};

}  // namespace turnstile::schema::key
