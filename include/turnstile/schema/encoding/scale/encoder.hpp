#pragma once
#include <turnstile/common/critical.hpp>
#include <turnstile/schema/encoding/encoder.hpp>
#include <turnstile/schema/encoding/scale/access_type.hpp>
#include <turnstile/schema/encoding/scale/entry_type.hpp>
#include <turnstile/schema/encoding/scale/event_status.hpp>
#include <turnstile/schema/encoding/scale/reference_type.hpp>
#include <turnstile/schema/encoding/scale/transaction_type.hpp>
#include <turnstile/schema/deposit_record.hpp>
#include <turnstile/schema/event_attendance.hpp>
#include <turnstile/schema/event_state.hpp>
#include <turnstile/schema/event_ticket.hpp>
#include <turnstile/schema/event_tip.hpp>
#include <turnstile/schema/ledger_entry.hpp>
#include <turnstile/schema/wallet_state.hpp>
#include <iterator>
#include <scale/scale.hpp>

namespace turnstile::schema::encoding {

struct scale_encoder_tag {};

template <>
struct encoder<scale_encoder_tag> final {
  template <typename T>
  turnstile::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, turnstile::schema::bytes_t& out);

  template <typename T>
  T decode(const turnstile::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const turnstile::schema::bytes_view_t& bytes);
};

template <typename T>
turnstile::schema::bytes_t encoder<scale_encoder_tag>::encode(const T& obj) {
  auto encoded = ::scale::impl::memory::encode(obj);
  if (!encoded) {
    turnstile::common::critical("failed to encode SCALE object");
  }
  return encoded.value();
}

template <typename T>
void encoder<scale_encoder_tag>::encode(const T& obj,
                                        turnstile::schema::bytes_t& out) {
  auto encoded = encode(obj);
  out.insert(std::end(out), std::begin(encoded), std::end(encoded));
}

template <typename T>
T encoder<scale_encoder_tag>::decode(
    const turnstile::schema::bytes_view_t& bytes) {
  auto decoded = ::scale::impl::memory::decode<T>(bytes);
  if (!decoded) {
    turnstile::common::critical("failed to decode SCALE bytes");
  }
  return decoded.value();
}

template <typename T>
std::optional<T> encoder<scale_encoder_tag>::try_decode(
    const turnstile::schema::bytes_view_t& bytes) {
  auto decoded = ::scale::impl::memory::decode<T>(bytes);
  if (!decoded) {
    return std::nullopt;
  }
  return decoded.value();
}

}  // namespace turnstile::schema::encoding
