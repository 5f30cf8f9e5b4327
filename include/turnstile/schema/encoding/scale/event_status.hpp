#pragma once

#include <turnstile/schema/event_status.hpp>
#include <scale/scale.hpp>

SCALE_DEFINE_ENUM_VALUE_LIST(
    turnstile::schema,
    event_status_t,
    turnstile::schema::event_status_t::scheduled,
    turnstile::schema::event_status_t::live,
    turnstile::schema::event_status_t::ended,
    turnstile::schema::event_status_t::cancelled)
