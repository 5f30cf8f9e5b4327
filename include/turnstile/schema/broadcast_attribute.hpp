#pragma once

#include <cstdint>
#include <string>

// Schema type: broadcast attribute.
// Realtime workflow: key/value pair carried by a broadcast message.
namespace turnstile::schema {

template <uint16_t Version>
struct broadcast_attribute;

template <>
struct broadcast_attribute<1> final {
  uint16_t version{1};
  std::string key;
  std::string value;
};

using broadcast_attribute_t = broadcast_attribute<1>;

}  // namespace turnstile::schema
