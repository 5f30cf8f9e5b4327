#pragma once

#include <turnstile/schema/entry_type.hpp>
#include <scale/scale.hpp>

SCALE_DEFINE_ENUM_VALUE_LIST(
    turnstile::schema,
    entry_type_t,
    turnstile::schema::entry_type_t::debit,
    turnstile::schema::entry_type_t::credit)
