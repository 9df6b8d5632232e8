#pragma once

#include <swapdot/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

namespace swapdot::schema {

// Two-phase transfer session lifecycle.
enum class transfer_session_status_t : uint8_t {
  pending = 0,
  staged = 1,
  committed = 2,
  expired = 3,
  canceled = 4
};

inline constexpr auto kTransferSessionStatusMappings = std::array{
    enum_mapping_t<transfer_session_status_t>{"pending", transfer_session_status_t::pending},
    enum_mapping_t<transfer_session_status_t>{"staged", transfer_session_status_t::staged},
    enum_mapping_t<transfer_session_status_t>{"committed", transfer_session_status_t::committed},
    enum_mapping_t<transfer_session_status_t>{"expired", transfer_session_status_t::expired},
    enum_mapping_t<transfer_session_status_t>{"canceled", transfer_session_status_t::canceled}};

template <>
inline std::optional<transfer_session_status_t> try_from_string<transfer_session_status_t>(
    const std::string_view value) {
  return from_string(value, kTransferSessionStatusMappings);
}

inline constexpr std::string_view to_string(const transfer_session_status_t value) {
  return to_string(value, kTransferSessionStatusMappings).value_or("unknown");
}

}  // namespace swapdot::schema
