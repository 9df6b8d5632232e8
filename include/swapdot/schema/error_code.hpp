#pragma once

#include <swapdot/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

namespace swapdot::schema {

// Failure classes returned by every service operation.
enum class error_code_t : uint32_t {
  ok = 0,
  invalid_argument = 1,
  not_found = 2,
  protocol_error = 3,
  weak_key = 4,
  permission_denied = 5,
  conflict = 6,
  expired = 7,
  internal = 8,
  already_exists = 9,
  not_implemented = 10
};

inline constexpr auto kErrorCodeMappings = std::array{
    enum_mapping_t<error_code_t>{"ok", error_code_t::ok},
    enum_mapping_t<error_code_t>{"invalid_argument", error_code_t::invalid_argument},
    enum_mapping_t<error_code_t>{"not_found", error_code_t::not_found},
    enum_mapping_t<error_code_t>{"protocol_error", error_code_t::protocol_error},
    enum_mapping_t<error_code_t>{"weak_key", error_code_t::weak_key},
    enum_mapping_t<error_code_t>{"permission_denied", error_code_t::permission_denied},
    enum_mapping_t<error_code_t>{"conflict", error_code_t::conflict},
    enum_mapping_t<error_code_t>{"expired", error_code_t::expired},
    enum_mapping_t<error_code_t>{"internal", error_code_t::internal},
    enum_mapping_t<error_code_t>{"already_exists", error_code_t::already_exists},
    enum_mapping_t<error_code_t>{"not_implemented", error_code_t::not_implemented}};

template <>
inline std::optional<error_code_t> try_from_string<error_code_t>(
    const std::string_view value) {
  return from_string(value, kErrorCodeMappings);
}

inline constexpr std::string_view to_string(const error_code_t value) {
  return to_string(value, kErrorCodeMappings).value_or("unknown");
}

}  // namespace swapdot::schema
