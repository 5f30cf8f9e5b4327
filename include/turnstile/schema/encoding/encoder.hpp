#pragma once
#include <turnstile/schema/primitives.hpp>
#include <optional>
#include <span>

namespace turnstile::schema::encoding {

// Value codec selected at build time by tag. Storage and key code are written
// against this template so the persisted format is a single point of change.
template <typename Library>
struct encoder {
  template <typename T>
  turnstile::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, turnstile::schema::bytes_t& out);

  template <typename T>
  T decode(const turnstile::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const turnstile::schema::bytes_view_t& bytes);
};

}  // namespace turnstile::schema::encoding
