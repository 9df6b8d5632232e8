#pragma once

#include <swapdot/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

namespace swapdot::schema {

// Token availability: idle or reserved by a legacy transfer.
enum class token_status_t : uint8_t {
  ok = 0,
  pending = 1
};

inline constexpr auto kTokenStatusMappings = std::array{
    enum_mapping_t<token_status_t>{"ok", token_status_t::ok},
    enum_mapping_t<token_status_t>{"pending", token_status_t::pending}};

template <>
inline std::optional<token_status_t> try_from_string<token_status_t>(
    const std::string_view value) {
  return from_string(value, kTokenStatusMappings);
}

inline constexpr std::string_view to_string(const token_status_t value) {
  return to_string(value, kTokenStatusMappings).value_or("unknown");
}

}  // namespace swapdot::schema
