#pragma once
#include <turnstile/blake3/hash.hpp>
#include <turnstile/schema/primitives.hpp>

#include <atomic>
#include <cstdint>
#include <string_view>

namespace turnstile::ledger {

/// Source of fresh 32-byte identifiers.
///
/// Each id is BLAKE3 over a domain tag, a random per-process nonce, a
/// monotonically increasing sequence number and caller-supplied fields, so
/// ids never repeat across restarts or between concurrent callers.
class id_source final {
 public:
  id_source();

  template <typename... Fields>
  turnstile::schema::hash32_t next(const std::string_view domain,
                                   const Fields&... fields) {
    auto hasher = turnstile::blake3::hasher{};
    hasher.update(domain);
    hasher.update(turnstile::schema::bytes_view_t{nonce_});
    hasher.update(sequence_.fetch_add(1, std::memory_order_relaxed));
    (hasher.update(fields), ...);
    return hasher.finalize();
  }

 private:
  turnstile::schema::hash32_t nonce_{};
  std::atomic<uint64_t> sequence_{0};
};

}  // namespace turnstile::ledger
