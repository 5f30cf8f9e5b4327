#pragma once

#include <turnstile/schema/broadcast_attribute.hpp>
#include <turnstile/schema/primitives.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

// Schema type: broadcast message.
// Realtime workflow: payload handed to the realtime bridge after a commit
// (stream_update, tip, user_joined, user_left, ticket_purchased).
namespace turnstile::schema {

template <uint16_t Version>
struct broadcast_message;

template <>
struct broadcast_message<1> final {
  uint16_t version{1};
  std::string type;
  event_id_t event_id{};
  std::vector<broadcast_attribute_t> attributes;
  timestamp_milliseconds_t timestamp{};

  std::optional<std::string> attribute(const std::string_view key) const {
    for (const auto& attribute : attributes) {
      if (attribute.key == key) {
        return attribute.value;
      }
    }
    return std::nullopt;
  }
};

using broadcast_message_t = broadcast_message<1>;

/// Room every participant of an event subscribes to.
inline std::string make_event_room(const event_id_t& event_id) {
  return "event:" + to_hex(event_id);
}

}  // namespace turnstile::schema
