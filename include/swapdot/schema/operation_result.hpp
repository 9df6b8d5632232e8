#pragma once

#include <swapdot/schema/error_code.hpp>

#include <string>
#include <string_view>
#include <utility>

namespace swapdot::schema {

/// Outcome of a service operation. code == ok means success; log carries a
/// human readable reason and codespace names the component that failed.
struct operation_status final {
  error_code_t code{error_code_t::ok};
  std::string log;
  std::string codespace;

  bool ok() const { return code == error_code_t::ok; }
};

using operation_status_t = operation_status;

inline operation_status_t make_error(const error_code_t code,
                                     const std::string_view codespace,
                                     const std::string_view log) {
  return operation_status_t{.code = code,
                            .log = std::string{log},
                            .codespace = std::string{codespace}};
}

template <typename T>
struct operation_result final {
  operation_status_t status;
  T value{};

  bool ok() const { return status.ok(); }
};

template <typename T>
operation_result<T> make_success(T value) {
  return operation_result<T>{.status = {}, .value = std::move(value)};
}

template <typename T>
operation_result<T> make_failure(const error_code_t code,
                                 const std::string_view codespace,
                                 const std::string_view log) {
  return operation_result<T>{.status = make_error(code, codespace, log),
                             .value = T{}};
}

}  // namespace swapdot::schema
