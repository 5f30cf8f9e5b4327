#pragma once
#include <rocksdb/db.h>
#include <rocksdb/iterator.h>
#include <rocksdb/options.h>
#include <rocksdb/slice.h>
#include <rocksdb/utilities/transaction.h>
#include <rocksdb/utilities/transaction_db.h>
#include <spdlog/spdlog.h>
#include <turnstile/common/critical.hpp>
#include <turnstile/schema/encoding/scale/encoder.hpp>
#include <turnstile/storage/storage.hpp>
#include <iterator>
#include <memory>
#include <string>
#include <string_view>
#include <utility>

namespace turnstile::storage {

namespace detail {

inline ROCKSDB_NAMESPACE::Slice to_slice(
    const turnstile::schema::bytes_view_t& bytes) {
  return ROCKSDB_NAMESPACE::Slice{reinterpret_cast<const char*>(bytes.data()),
                                  bytes.size()};
}

inline turnstile::schema::bytes_t to_bytes(
    const ROCKSDB_NAMESPACE::Slice& slice) {
  return {reinterpret_cast<const uint8_t*>(slice.data()),
          reinterpret_cast<const uint8_t*>(slice.data()) + slice.size()};
}

inline turnstile::schema::bytes_view_t to_bytes_view(const std::string& value) {
  return turnstile::schema::bytes_view_t{
      reinterpret_cast<const uint8_t*>(value.data()), value.size()};
}

/// Lock waits that expire, deadlock victims and write conflicts all mean
/// another transaction won the row.
inline bool is_contention(const ROCKSDB_NAMESPACE::Status& status) {
  return status.IsBusy() || status.IsTimedOut() || status.IsTryAgain() ||
         status.IsDeadlock();
}

std::vector<key_value_entry_t> drain_prefix(
    ROCKSDB_NAMESPACE::Iterator& iterator,
    const turnstile::schema::bytes_view_t& prefix);

}  // namespace detail

struct rocksdb_storage_tag {};

template <>
struct transaction<rocksdb_storage_tag> final {
  std::unique_ptr<ROCKSDB_NAMESPACE::Transaction> handle;

  transaction() = default;
  explicit transaction(std::unique_ptr<ROCKSDB_NAMESPACE::Transaction> txn);
  transaction(transaction&& other) noexcept = default;
  transaction& operator=(transaction&& other) = delete;
  transaction(const transaction&) = delete;
  transaction& operator=(const transaction&) = delete;
  ~transaction();

  template <typename T, typename Encoder>
  read_result<T> get(Encoder& encoder,
                     const turnstile::schema::bytes_view_t& key);

  template <typename T, typename Encoder>
  read_result<T> get_for_update(Encoder& encoder,
                                const turnstile::schema::bytes_view_t& key);

  template <typename T, typename Encoder>
  storage_status put(Encoder& encoder,
                     const turnstile::schema::bytes_view_t& key,
                     const T& value);

  template <typename T, typename Encoder, typename Mutate>
  write_result update(Encoder& encoder,
                      const turnstile::schema::bytes_view_t& key,
                      Mutate&& mutate);

  std::vector<key_value_entry_t> list_by_prefix(
      const turnstile::schema::bytes_view_t& prefix);

  storage_status commit();
  void rollback();

 private:
  bool finished_{false};
};

template <>
struct storage<rocksdb_storage_tag> final {
  std::unique_ptr<ROCKSDB_NAMESPACE::TransactionDB> database;
  int64_t lock_timeout_milliseconds{1000};

  template <typename T, typename Encoder>
  std::optional<T> get(Encoder& encoder,
                       const turnstile::schema::bytes_view_t& key) const;

  std::vector<key_value_entry_t> list_by_prefix(
      const turnstile::schema::bytes_view_t& prefix) const;

  transaction<rocksdb_storage_tag> begin() const;
};

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const storage_options& options);

template <typename T, typename Encoder>
read_result<T> transaction<rocksdb_storage_tag>::get(
    Encoder& encoder,
    const turnstile::schema::bytes_view_t& key) {
  if (!handle) {
    turnstile::common::critical("RocksDB transaction is not active");
  }
  auto value = std::string{};
  auto status = handle->Get(ROCKSDB_NAMESPACE::ReadOptions{},
                            detail::to_slice(key), &value);
  if (status.IsNotFound()) {
    return {};
  }
  if (detail::is_contention(status)) {
    return {storage_status::contended, std::nullopt};
  }
  if (!status.ok()) {
    spdlog::error("Failed to get value in transaction: {}", status.ToString());
    turnstile::common::critical("Failed to get value in transaction");
  }
  return {storage_status::ok,
          encoder.template decode<T>(detail::to_bytes_view(value))};
}

template <typename T, typename Encoder>
read_result<T> transaction<rocksdb_storage_tag>::get_for_update(
    Encoder& encoder,
    const turnstile::schema::bytes_view_t& key) {
  if (!handle) {
    turnstile::common::critical("RocksDB transaction is not active");
  }
  auto value = std::string{};
  auto status = handle->GetForUpdate(ROCKSDB_NAMESPACE::ReadOptions{},
                                     detail::to_slice(key), &value);
  if (status.IsNotFound()) {
    // The lock is still held, so a concurrent insert of this key waits on us.
    return {};
  }
  if (detail::is_contention(status)) {
    spdlog::debug("Lock contention on key: {}", status.ToString());
    return {storage_status::contended, std::nullopt};
  }
  if (!status.ok()) {
    spdlog::error("Failed to lock value in transaction: {}",
                  status.ToString());
    turnstile::common::critical("Failed to lock value in transaction");
  }
  return {storage_status::ok,
          encoder.template decode<T>(detail::to_bytes_view(value))};
}

template <typename T, typename Encoder>
storage_status transaction<rocksdb_storage_tag>::put(
    Encoder& encoder,
    const turnstile::schema::bytes_view_t& key,
    const T& value) {
  if (!handle) {
    turnstile::common::critical("RocksDB transaction is not active");
  }
  auto encoded_value = encoder.encode(value);
  auto status = handle->Put(
      detail::to_slice(key),
      detail::to_slice(turnstile::schema::bytes_view_t{encoded_value}));
  if (detail::is_contention(status)) {
    return storage_status::contended;
  }
  if (!status.ok()) {
    spdlog::error("Failed to put value in transaction: {}", status.ToString());
    turnstile::common::critical("Failed to put value in transaction");
  }
  return storage_status::ok;
}

template <typename T, typename Encoder, typename Mutate>
write_result transaction<rocksdb_storage_tag>::update(
    Encoder& encoder,
    const turnstile::schema::bytes_view_t& key,
    Mutate&& mutate) {
  auto current = get_for_update<T>(encoder, key);
  if (current.contended()) {
    return write_result{storage_status::contended, 0};
  }
  if (!current.value.has_value()) {
    return write_result{};
  }
  auto value = std::move(current.value.value());
  if (!mutate(value)) {
    return write_result{};
  }
  auto status = put(encoder, key, value);
  if (status != storage_status::ok) {
    return write_result{status, 0};
  }
  return write_result{storage_status::ok, 1};
}

template <typename T, typename Encoder>
std::optional<T> storage<rocksdb_storage_tag>::get(
    Encoder& encoder,
    const turnstile::schema::bytes_view_t& key) const {
  if (!database) {
    turnstile::common::critical("RocksDB database is not initialized");
  }
  auto& base = static_cast<ROCKSDB_NAMESPACE::DB&>(*database);
  auto value = std::string{};
  auto status =
      base.Get(ROCKSDB_NAMESPACE::ReadOptions{}, detail::to_slice(key), &value);
  if (!status.ok()) {
    if (status.IsNotFound()) {
      return std::nullopt;
    } else {
      spdlog::error("Failed to get value from RocksDB: {}", status.ToString());
      turnstile::common::critical("Failed to get value from RocksDB");
    }
  }
  return {encoder.template decode<T>(detail::to_bytes_view(value))};
}

}  // namespace turnstile::storage
