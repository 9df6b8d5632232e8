#pragma once
#include <rocksdb/db.h>
#include <rocksdb/iterator.h>
#include <rocksdb/options.h>
#include <rocksdb/slice.h>
#include <rocksdb/utilities/optimistic_transaction_db.h>
#include <rocksdb/utilities/transaction.h>
#include <spdlog/spdlog.h>
#include <swapdot/common/critical.hpp>
#include <swapdot/storage/storage.hpp>
#include <memory>
#include <string>
#include <string_view>

namespace swapdot::storage {

namespace detail {

inline ROCKSDB_NAMESPACE::Slice to_slice(
    const swapdot::schema::bytes_view_t& bytes) {
  return ROCKSDB_NAMESPACE::Slice{reinterpret_cast<const char*>(bytes.data()),
                                  bytes.size()};
}

inline swapdot::schema::bytes_t to_bytes(
    const ROCKSDB_NAMESPACE::Slice& slice) {
  return {reinterpret_cast<const uint8_t*>(slice.data()),
          reinterpret_cast<const uint8_t*>(slice.data()) + slice.size()};
}

inline std::vector<key_value_entry_t> collect_prefix(
    ROCKSDB_NAMESPACE::Iterator& iterator,
    const swapdot::schema::bytes_view_t& prefix,
    const std::size_t limit) {
  auto entries = std::vector<key_value_entry_t>{};
  auto prefix_string =
      std::string{reinterpret_cast<const char*>(prefix.data()), prefix.size()};
  iterator.Seek(prefix_string);
  while (iterator.Valid() && entries.size() < limit) {
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
    spdlog::error("RocksDB iteration failed: {}", iterator.status().ToString());
    swapdot::common::critical("RocksDB iteration failed");
  }
  return entries;
}

}  // namespace detail

struct rocksdb_storage_tag {};

template <>
struct transaction<rocksdb_storage_tag> final {
  std::unique_ptr<ROCKSDB_NAMESPACE::Transaction> handle;

  template <typename T, typename Encoder>
  std::optional<T> get_for_update(Encoder& encoder,
                                  const swapdot::schema::bytes_view_t& key);

  template <typename Encoder, typename T>
  void put(Encoder& encoder,
           const swapdot::schema::bytes_view_t& key,
           const T& value);

  void erase(const swapdot::schema::bytes_view_t& key);

  std::vector<key_value_entry_t> list_by_prefix(
      const swapdot::schema::bytes_view_t& prefix,
      std::size_t limit = kUnbounded);

  commit_status commit();
};

template <>
struct storage<rocksdb_storage_tag> final {
  std::unique_ptr<ROCKSDB_NAMESPACE::OptimisticTransactionDB> database;

  template <typename T, typename Encoder>
  std::optional<T> get(Encoder& encoder,
                       const swapdot::schema::bytes_view_t& key) const;

  template <typename Encoder, typename T>
  void put(Encoder& encoder,
           const swapdot::schema::bytes_view_t& key,
           const T& value) const;

  std::vector<key_value_entry_t> list_by_prefix(
      const swapdot::schema::bytes_view_t& prefix) const;

  transaction<rocksdb_storage_tag> begin_transaction() const;
};

using rocksdb_storage_t = storage<rocksdb_storage_tag>;
using rocksdb_transaction_t = transaction<rocksdb_storage_tag>;

template <>
inline storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path) {
  auto options = ROCKSDB_NAMESPACE::Options{};
  options.create_if_missing = true;
  auto* raw = static_cast<ROCKSDB_NAMESPACE::OptimisticTransactionDB*>(nullptr);
  auto status = ROCKSDB_NAMESPACE::OptimisticTransactionDB::Open(
      options, std::string{path}, &raw);
  if (!status.ok()) {
    spdlog::error("Failed to open RocksDB at '{}': {}", path,
                  status.ToString());
    swapdot::common::critical("Failed to open RocksDB");
  }
  auto result = storage<rocksdb_storage_tag>{};
  result.database.reset(raw);
  return result;
}

template <typename T, typename Encoder>
std::optional<T> transaction<rocksdb_storage_tag>::get_for_update(
    Encoder& encoder,
    const swapdot::schema::bytes_view_t& key) {
  if (!handle) {
    swapdot::common::critical("RocksDB transaction is not initialized");
  }
  auto value = std::string{};
  auto status = handle->GetForUpdate(ROCKSDB_NAMESPACE::ReadOptions{},
                                     detail::to_slice(key), &value);
  if (status.IsNotFound()) {
    return std::nullopt;
  }
  if (!status.ok()) {
    spdlog::error("Failed to read value in transaction: {}",
                  status.ToString());
    swapdot::common::critical("Failed to read value in transaction");
  }
  auto decoded = encoder.template try_decode<T>(swapdot::schema::bytes_view_t{
      reinterpret_cast<const uint8_t*>(value.data()), value.size()});
  if (!decoded.has_value()) {
    swapdot::common::critical("Failed to decode stored record");
  }
  return decoded;
}

template <typename Encoder, typename T>
void transaction<rocksdb_storage_tag>::put(
    Encoder& encoder,
    const swapdot::schema::bytes_view_t& key,
    const T& value) {
  if (!handle) {
    swapdot::common::critical("RocksDB transaction is not initialized");
  }
  auto encoded_value = encoder.encode(value);
  auto status = handle->Put(
      detail::to_slice(key),
      detail::to_slice(swapdot::schema::bytes_view_t{encoded_value}));
  if (!status.ok()) {
    spdlog::error("Failed to stage value in transaction: {}",
                  status.ToString());
    swapdot::common::critical("Failed to stage value in transaction");
  }
}

inline void transaction<rocksdb_storage_tag>::erase(
    const swapdot::schema::bytes_view_t& key) {
  if (!handle) {
    swapdot::common::critical("RocksDB transaction is not initialized");
  }
  auto status = handle->Delete(detail::to_slice(key));
  if (!status.ok()) {
    spdlog::error("Failed to stage delete in transaction: {}",
                  status.ToString());
    swapdot::common::critical("Failed to stage delete in transaction");
  }
}

inline std::vector<key_value_entry_t>
transaction<rocksdb_storage_tag>::list_by_prefix(
    const swapdot::schema::bytes_view_t& prefix,
    const std::size_t limit) {
  if (!handle) {
    swapdot::common::critical("RocksDB transaction is not initialized");
  }
  auto iterator = std::unique_ptr<ROCKSDB_NAMESPACE::Iterator>{
      handle->GetIterator(ROCKSDB_NAMESPACE::ReadOptions{})};
  return detail::collect_prefix(*iterator, prefix, limit);
}

inline commit_status transaction<rocksdb_storage_tag>::commit() {
  if (!handle) {
    swapdot::common::critical("RocksDB transaction is not initialized");
  }
  auto status = handle->Commit();
  if (status.ok()) {
    return commit_status::committed;
  }
  if (status.IsBusy() || status.IsTryAgain()) {
    spdlog::debug("Transaction conflict: {}", status.ToString());
    return commit_status::conflict;
  }
  spdlog::error("Failed to commit transaction: {}", status.ToString());
  swapdot::common::critical("Failed to commit transaction");
}

template <typename T, typename Encoder>
std::optional<T> storage<rocksdb_storage_tag>::get(
    Encoder& encoder,
    const swapdot::schema::bytes_view_t& key) const {
  if (!database) {
    swapdot::common::critical("RocksDB database is not initialized");
  }
  auto value = std::string{};
  auto status = database->Get(ROCKSDB_NAMESPACE::ReadOptions{},
                              detail::to_slice(key), &value);
  if (!status.ok()) {
    if (status.IsNotFound()) {
      return std::nullopt;
    } else {
      spdlog::error("Failed to get value from RocksDB: {}", status.ToString());
      swapdot::common::critical("Failed to get value from RocksDB");
    }
  }
  return {encoder.template decode<T>(swapdot::schema::bytes_view_t{
      reinterpret_cast<const uint8_t*>(value.data()), value.size()})};
}

template <typename Encoder, typename T>
void storage<rocksdb_storage_tag>::put(Encoder& encoder,
                                       const swapdot::schema::bytes_view_t& key,
                                       const T& value) const {
  if (!database) {
    swapdot::common::critical("RocksDB database is not initialized");
  }
  auto encoded_value = encoder.encode(value);
  auto status = database->Put(
      ROCKSDB_NAMESPACE::WriteOptions{}, detail::to_slice(key),
      detail::to_slice(swapdot::schema::bytes_view_t{encoded_value}));
  if (!status.ok()) {
    spdlog::error("Failed to put value into RocksDB: {}", status.ToString());
    swapdot::common::critical("Failed to put value into RocksDB");
  }
}

inline std::vector<key_value_entry_t>
storage<rocksdb_storage_tag>::list_by_prefix(
    const swapdot::schema::bytes_view_t& prefix) const {
  if (!database) {
    swapdot::common::critical("RocksDB database is not initialized");
  }
  auto iterator = std::unique_ptr<ROCKSDB_NAMESPACE::Iterator>{
      database->NewIterator(ROCKSDB_NAMESPACE::ReadOptions{})};
  return detail::collect_prefix(*iterator, prefix, kUnbounded);
}

inline transaction<rocksdb_storage_tag>
storage<rocksdb_storage_tag>::begin_transaction() const {
  if (!database) {
    swapdot::common::critical("RocksDB database is not initialized");
  }
  return transaction<rocksdb_storage_tag>{
      .handle = std::unique_ptr<ROCKSDB_NAMESPACE::Transaction>{
          database->BeginTransaction(ROCKSDB_NAMESPACE::WriteOptions{})}};
}

}  // namespace swapdot::storage
