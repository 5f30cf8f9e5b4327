#pragma once
#include <turnstile/schema/primitives.hpp>

#include <cstdint>
#include <optional>
#include <string_view>
#include <utility>
#include <vector>

namespace turnstile::storage {

using key_value_entry_t =
    std::pair<turnstile::schema::bytes_t, turnstile::schema::bytes_t>;

/// Outcome of a storage call that can lose a lock race. Anything worse than
/// contention is a storage fault and never comes back as a status.
enum class storage_status : uint8_t { ok = 0, contended = 1 };

/// Value read under a transaction, possibly while taking its row lock.
template <typename T>
struct read_result final {
  storage_status status{storage_status::ok};
  std::optional<T> value;

  bool contended() const { return status == storage_status::contended; }
};

/// Write outcome carrying the affected row count. A conditional update that
/// finds no row, or whose predicate rejects the row, affects zero rows.
struct write_result final {
  storage_status status{storage_status::ok};
  uint64_t rows_affected{};

  bool contended() const { return status == storage_status::contended; }
};

/// Runtime knobs for opening a storage backend.
struct storage_options final {
  std::string_view path;
  int64_t lock_timeout_milliseconds{1000};
};

/// One serializable unit of work. Uncommitted work is rolled back when the
/// transaction goes out of scope.
template <typename Library>
struct transaction {
  /// Read the value at key, observing this transaction's own writes.
  template <typename T, typename Encoder>
  read_result<T> get(Encoder& encoder,
                     const turnstile::schema::bytes_view_t& key);

  /// Read the value at key and hold its exclusive lock until commit.
  template <typename T, typename Encoder>
  read_result<T> get_for_update(Encoder& encoder,
                                const turnstile::schema::bytes_view_t& key);

  /// Encode and stage value at key.
  template <typename T, typename Encoder>
  storage_status put(Encoder& encoder,
                     const turnstile::schema::bytes_view_t& key,
                     const T& value);

  /// Lock key, apply mutate to the stored value and stage the result.
  ///
  /// `mutate` returns false to leave the row untouched.
  template <typename T, typename Encoder, typename Mutate>
  write_result update(Encoder& encoder,
                      const turnstile::schema::bytes_view_t& key,
                      Mutate&& mutate);

  /// Return all key-value pairs that share the provided key prefix.
  std::vector<key_value_entry_t> list_by_prefix(
      const turnstile::schema::bytes_view_t& prefix);

  /// Make staged writes durable and release locks.
  storage_status commit();

  /// Discard staged writes and release locks.
  void rollback();
};

template <typename Library>
struct storage {
  /// Decode and return value at key, or std::nullopt when missing.
  template <typename T, typename Encoder>
  std::optional<T> get(Encoder& encoder,
                       const turnstile::schema::bytes_view_t& key) const;

  /// Return all key-value pairs that share the provided key prefix.
  std::vector<key_value_entry_t> list_by_prefix(
      const turnstile::schema::bytes_view_t& prefix) const;

  /// Open a new pessimistic transaction.
  transaction<Library> begin() const;
};

/// Construct a concrete storage backend rooted at options.path.
template <typename Library>
storage<Library> make_storage(const storage_options& options);

}  // namespace turnstile::storage
