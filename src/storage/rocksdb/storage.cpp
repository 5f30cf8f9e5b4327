#include <turnstile/common/critical.hpp>
#include <turnstile/storage/rocksdb/storage.hpp>

namespace turnstile::storage {

namespace detail {

std::vector<key_value_entry_t> drain_prefix(
    ROCKSDB_NAMESPACE::Iterator& iterator,
    const turnstile::schema::bytes_view_t& prefix) {
  auto entries = std::vector<key_value_entry_t>{};
  auto prefix_string =
      std::string{reinterpret_cast<const char*>(prefix.data()), prefix.size()};
  iterator.Seek(prefix_string);
  while (iterator.Valid()) {
    auto key_view =
        std::string_view{iterator.key().data(), iterator.key().size()};
    if (!key_view.starts_with(prefix_string)) {
      break;
    }
    entries.push_back(key_value_entry_t{to_bytes(iterator.key()),
                                        to_bytes(iterator.value())});
    iterator.Next();
  }
  if (!iterator.status().ok()) {
    spdlog::error("Prefix scan failed: {}", iterator.status().ToString());
    turnstile::common::critical("Prefix scan failed");
  }
  return entries;
}

}  // namespace detail

transaction<rocksdb_storage_tag>::transaction(
    std::unique_ptr<ROCKSDB_NAMESPACE::Transaction> txn)
    : handle{std::move(txn)} {}

transaction<rocksdb_storage_tag>::~transaction() {
  if (handle && !finished_) {
    rollback();
  }
}

std::vector<key_value_entry_t> transaction<rocksdb_storage_tag>::list_by_prefix(
    const turnstile::schema::bytes_view_t& prefix) {
  if (!handle) {
    turnstile::common::critical("RocksDB transaction is not active");
  }
  auto iterator = std::unique_ptr<ROCKSDB_NAMESPACE::Iterator>{
      handle->GetIterator(ROCKSDB_NAMESPACE::ReadOptions{})};
  return detail::drain_prefix(*iterator, prefix);
}

storage_status transaction<rocksdb_storage_tag>::commit() {
  if (!handle || finished_) {
    turnstile::common::critical("RocksDB transaction is not active");
  }
  auto status = handle->Commit();
  if (detail::is_contention(status)) {
    spdlog::debug("Commit lost to contention: {}", status.ToString());
    rollback();
    return storage_status::contended;
  }
  if (!status.ok()) {
    spdlog::error("Failed to commit transaction: {}", status.ToString());
    turnstile::common::critical("Failed to commit transaction");
  }
  finished_ = true;
  return storage_status::ok;
}

void transaction<rocksdb_storage_tag>::rollback() {
  if (!handle || finished_) {
    return;
  }
  finished_ = true;
  auto status = handle->Rollback();
  if (!status.ok()) {
    spdlog::error("Failed to roll back transaction: {}", status.ToString());
    turnstile::common::critical("Failed to roll back transaction");
  }
}

std::vector<key_value_entry_t> storage<rocksdb_storage_tag>::list_by_prefix(
    const turnstile::schema::bytes_view_t& prefix) const {
  if (!database) {
    turnstile::common::critical("RocksDB database is not initialized");
  }
  auto& base = static_cast<ROCKSDB_NAMESPACE::DB&>(*database);
  auto iterator = std::unique_ptr<ROCKSDB_NAMESPACE::Iterator>{
      base.NewIterator(ROCKSDB_NAMESPACE::ReadOptions{})};
  return detail::drain_prefix(*iterator, prefix);
}

transaction<rocksdb_storage_tag> storage<rocksdb_storage_tag>::begin() const {
  if (!database) {
    turnstile::common::critical("RocksDB database is not initialized");
  }
  auto transaction_options = ROCKSDB_NAMESPACE::TransactionOptions{};
  transaction_options.deadlock_detect = true;
  transaction_options.lock_timeout = lock_timeout_milliseconds;
  return transaction<rocksdb_storage_tag>{
      std::unique_ptr<ROCKSDB_NAMESPACE::Transaction>{
          database->BeginTransaction(ROCKSDB_NAMESPACE::WriteOptions{},
                                     transaction_options)}};
}

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const storage_options& options) {
  auto store = storage<rocksdb_storage_tag>();
  store.lock_timeout_milliseconds = options.lock_timeout_milliseconds;

  auto db_options = ROCKSDB_NAMESPACE::Options{};
  db_options.create_if_missing = true;
  db_options.IncreaseParallelism();
  db_options.OptimizeLevelStyleCompaction();

  auto transaction_db_options = ROCKSDB_NAMESPACE::TransactionDBOptions{};
  transaction_db_options.transaction_lock_timeout =
      options.lock_timeout_milliseconds;

  ROCKSDB_NAMESPACE::TransactionDB* database{nullptr};
  auto status = ROCKSDB_NAMESPACE::TransactionDB::Open(
      db_options, transaction_db_options, std::string{options.path}, &database);
  if (!status.ok()) {
    spdlog::error("Failed to open RocksDB at {}: {}", options.path,
                  status.ToString());
    turnstile::common::critical("Failed to open RocksDB");
  }
  spdlog::info("Successfully opened RocksDB at {}", options.path);
  store.database.reset(database);

  return store;
}

}  // namespace turnstile::storage
