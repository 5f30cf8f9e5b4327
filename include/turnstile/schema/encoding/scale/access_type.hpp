#pragma once

#include <turnstile/schema/access_type.hpp>
#include <scale/scale.hpp>

SCALE_DEFINE_ENUM_VALUE_LIST(
    turnstile::schema,
    access_type_t,
    turnstile::schema::access_type_t::free,
    turnstile::schema::access_type_t::ticketed,
    turnstile::schema::access_type_t::subscription_only,
    turnstile::schema::access_type_t::tier_gated)
