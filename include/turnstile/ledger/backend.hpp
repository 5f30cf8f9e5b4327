#pragma once
#include <turnstile/schema/encoding/scale/encoder.hpp>
#include <turnstile/storage/rocksdb/storage.hpp>

namespace turnstile::ledger {

using encoder_t = turnstile::schema::encoding::encoder<
    turnstile::schema::encoding::scale_encoder_tag>;
using storage_t =
    turnstile::storage::storage<turnstile::storage::rocksdb_storage_tag>;
using transaction_t =
    turnstile::storage::transaction<turnstile::storage::rocksdb_storage_tag>;

}  // namespace turnstile::ledger
