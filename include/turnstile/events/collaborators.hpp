#pragma once
#include <turnstile/schema/broadcast_message.hpp>
#include <turnstile/schema/primitives.hpp>

#include <functional>
#include <string_view>

namespace turnstile::events {

/// Realtime fan-out. Invoked strictly after the owning transaction commits;
/// a throwing broadcaster is logged and never undoes the commit.
using broadcaster_t =
    std::function<void(std::string_view room,
                       const turnstile::schema::broadcast_message_t& message)>;

/// Subscription/tier entitlement lookup for gated events.
using entitlement_checker_t =
    std::function<bool(const turnstile::schema::user_id_t& user_id,
                       const turnstile::schema::event_id_t& event_id)>;

}  // namespace turnstile::events
