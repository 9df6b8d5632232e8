#pragma once

#include <swapdot/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

namespace swapdot::schema {

// DESFire file communication settings, using the card's own encodings.
enum class comm_mode_t : uint8_t {
  plain = 0,
  maced = 1,
  enciphered = 3
};

inline constexpr auto kCommModeMappings = std::array{
    enum_mapping_t<comm_mode_t>{"plain", comm_mode_t::plain},
    enum_mapping_t<comm_mode_t>{"maced", comm_mode_t::maced},
    enum_mapping_t<comm_mode_t>{"enciphered", comm_mode_t::enciphered}};

template <>
inline std::optional<comm_mode_t> try_from_string<comm_mode_t>(
    const std::string_view value) {
  return from_string(value, kCommModeMappings);
}

inline constexpr std::string_view to_string(const comm_mode_t value) {
  return to_string(value, kCommModeMappings).value_or("unknown");
}

}  // namespace swapdot::schema
