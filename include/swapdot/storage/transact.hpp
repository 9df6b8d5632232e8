#pragma once

#include <swapdot/schema/operation_result.hpp>
#include <swapdot/storage/storage.hpp>

#include <cstdint>
#include <string_view>
#include <utility>

namespace swapdot::storage {

inline constexpr auto kConflictLog =
    std::string_view{"concurrent update, retry after re-reading state"};

/// run_transaction for bodies returning operation_result<T>. An exhausted
/// retry budget becomes error_code_t::conflict.
template <typename T, typename Library, typename Body>
swapdot::schema::operation_result<T> transact(const storage<Library>& store,
                                              const uint32_t max_attempts,
                                              const std::string_view codespace,
                                              Body&& body) {
  auto result = run_transaction(store, max_attempts, std::forward<Body>(body));
  if (!result) {
    return swapdot::schema::make_failure<T>(
        swapdot::schema::error_code_t::conflict, codespace, kConflictLog);
  }
  return std::move(*result);
}

/// Same as transact for bodies returning a bare operation_status_t.
template <typename Library, typename Body>
swapdot::schema::operation_status_t transact_status(
    const storage<Library>& store,
    const uint32_t max_attempts,
    const std::string_view codespace,
    Body&& body) {
  auto result = run_transaction(store, max_attempts, std::forward<Body>(body));
  if (!result) {
    return swapdot::schema::make_error(swapdot::schema::error_code_t::conflict,
                                       codespace, kConflictLog);
  }
  return std::move(*result);
}

}  // namespace swapdot::storage
