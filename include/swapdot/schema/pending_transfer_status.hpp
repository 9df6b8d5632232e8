#pragma once

#include <swapdot/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

namespace swapdot::schema {

// Legacy transfer record state. committed only appears after a crashed write.
enum class pending_transfer_status_t : uint8_t {
  open = 0,
  committed = 1,
  expired = 2,
  canceled = 3
};

inline constexpr auto kPendingTransferStatusMappings = std::array{
    enum_mapping_t<pending_transfer_status_t>{"open", pending_transfer_status_t::open},
    enum_mapping_t<pending_transfer_status_t>{"committed", pending_transfer_status_t::committed},
    enum_mapping_t<pending_transfer_status_t>{"expired", pending_transfer_status_t::expired},
    enum_mapping_t<pending_transfer_status_t>{"canceled", pending_transfer_status_t::canceled}};

template <>
inline std::optional<pending_transfer_status_t> try_from_string<pending_transfer_status_t>(
    const std::string_view value) {
  return from_string(value, kPendingTransferStatusMappings);
}

inline constexpr std::string_view to_string(const pending_transfer_status_t value) {
  return to_string(value, kPendingTransferStatusMappings).value_or("unknown");
}

}  // namespace swapdot::schema
