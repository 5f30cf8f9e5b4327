#pragma once

#include <turnstile/schema/reference_type.hpp>
#include <scale/scale.hpp>

SCALE_DEFINE_ENUM_VALUE_LIST(
    turnstile::schema,
    reference_type_t,
    turnstile::schema::reference_type_t::event_ticket,
    turnstile::schema::reference_type_t::event_tip,
    turnstile::schema::reference_type_t::event_refund,
    turnstile::schema::reference_type_t::deposit)
