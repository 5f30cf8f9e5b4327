#pragma once

#include <turnstile/schema/transaction_type.hpp>
#include <scale/scale.hpp>

SCALE_DEFINE_ENUM_VALUE_LIST(
    turnstile::schema,
    transaction_type_t,
    turnstile::schema::transaction_type_t::payment,
    turnstile::schema::transaction_type_t::tip,
    turnstile::schema::transaction_type_t::refund,
    turnstile::schema::transaction_type_t::deposit)
