#pragma once

#include <swapdot/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

namespace swapdot::schema {

// Staged ownership change lifecycle.
enum class staged_transfer_status_t : uint8_t {
  staged = 0,
  committed = 1,
  rolled_back = 2,
  expired = 3
};

inline constexpr auto kStagedTransferStatusMappings = std::array{
    enum_mapping_t<staged_transfer_status_t>{"staged", staged_transfer_status_t::staged},
    enum_mapping_t<staged_transfer_status_t>{"committed", staged_transfer_status_t::committed},
    enum_mapping_t<staged_transfer_status_t>{"rolled_back", staged_transfer_status_t::rolled_back},
    enum_mapping_t<staged_transfer_status_t>{"expired", staged_transfer_status_t::expired}};

template <>
inline std::optional<staged_transfer_status_t> try_from_string<staged_transfer_status_t>(
    const std::string_view value) {
  return from_string(value, kStagedTransferStatusMappings);
}

inline constexpr std::string_view to_string(const staged_transfer_status_t value) {
  return to_string(value, kStagedTransferStatusMappings).value_or("unknown");
}

}  // namespace swapdot::schema
