#pragma once
#include <swapdot/schema/primitives.hpp>
#include <cstdint>
#include <limits>
#include <optional>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

namespace swapdot::storage {

using key_value_entry_t =
    std::pair<swapdot::schema::bytes_t, swapdot::schema::bytes_t>;

inline constexpr auto kUnbounded = std::numeric_limits<std::size_t>::max();

enum class commit_status : uint8_t { committed = 0, conflict = 1 };

/// Read-check-write unit. Reads that feed a decision go through
/// get_for_update so a concurrent commit on the same key fails this one.
template <typename Library>
struct transaction {
  /// Decode and return value at key, or std::nullopt when missing.
  template <typename T, typename Encoder>
  std::optional<T> get_for_update(Encoder& encoder,
                                  const swapdot::schema::bytes_view_t& key);

  /// Encode and stage value at key.
  template <typename Encoder, typename T>
  void put(Encoder& encoder,
           const swapdot::schema::bytes_view_t& key,
           const T& value);

  /// Stage removal of key.
  void erase(const swapdot::schema::bytes_view_t& key);

  /// Entries under prefix, including writes staged by this transaction.
  std::vector<key_value_entry_t> list_by_prefix(
      const swapdot::schema::bytes_view_t& prefix,
      std::size_t limit = kUnbounded);

  /// Validate tracked reads and apply staged writes atomically.
  commit_status commit();
};

template <typename Library>
struct storage {
  /// Decode and return value at key, or std::nullopt when missing.
  template <typename T, typename Encoder>
  std::optional<T> get(Encoder& encoder,
                       const swapdot::schema::bytes_view_t& key) const;

  /// Encode and persist value at key outside any transaction.
  template <typename Encoder, typename T>
  void put(Encoder& encoder,
           const swapdot::schema::bytes_view_t& key,
           const T& value) const;

  /// Return all key-value pairs that share the provided key prefix.
  std::vector<key_value_entry_t> list_by_prefix(
      const swapdot::schema::bytes_view_t& prefix) const;

  /// Open a fresh optimistic transaction.
  transaction<Library> begin_transaction() const;
};

/// Construct a concrete storage backend rooted at filesystem path.
template <typename Library>
storage<Library> make_storage(const std::string_view& path);

/// Run body inside fresh transactions until one commits or max_attempts
/// conflicts have been observed. Whatever the body staged is committed,
/// including the writes that accompany a failure result, so bodies validate
/// before they write. Returns std::nullopt when every attempt conflicted.
template <typename Library, typename Body>
auto run_transaction(const storage<Library>& store,
                     const uint32_t max_attempts,
                     Body&& body)
    -> std::optional<std::invoke_result_t<Body&, transaction<Library>&>> {
  for (auto attempt = uint32_t{1}; attempt <= max_attempts; ++attempt) {
    auto txn = store.begin_transaction();
    auto result = body(txn);
    if (txn.commit() == commit_status::committed) {
      return result;
    }
  }
  return std::nullopt;
}

}  // namespace swapdot::storage
