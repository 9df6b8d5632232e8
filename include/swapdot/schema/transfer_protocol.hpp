#pragma once

#include <swapdot/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

namespace swapdot::schema {

// Which flow produced a transfer event.
enum class transfer_protocol_t : uint8_t {
  legacy = 0,
  two_phase = 1,
  reconcile = 2,
  registration = 3
};

inline constexpr auto kTransferProtocolMappings = std::array{
    enum_mapping_t<transfer_protocol_t>{"legacy", transfer_protocol_t::legacy},
    enum_mapping_t<transfer_protocol_t>{"two_phase", transfer_protocol_t::two_phase},
    enum_mapping_t<transfer_protocol_t>{"reconcile", transfer_protocol_t::reconcile},
    enum_mapping_t<transfer_protocol_t>{"registration", transfer_protocol_t::registration}};

template <>
inline std::optional<transfer_protocol_t> try_from_string<transfer_protocol_t>(
    const std::string_view value) {
  return from_string(value, kTransferProtocolMappings);
}

inline constexpr std::string_view to_string(const transfer_protocol_t value) {
  return to_string(value, kTransferProtocolMappings).value_or("unknown");
}

}  // namespace swapdot::schema
