#pragma once

#include <swapdot/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

namespace swapdot::schema {

// Mutual authentication progress of one session.
enum class auth_phase_t : uint8_t {
  init = 0,
  challenge_sent = 1,
  authenticated = 2
};

inline constexpr auto kAuthPhaseMappings = std::array{
    enum_mapping_t<auth_phase_t>{"init", auth_phase_t::init},
    enum_mapping_t<auth_phase_t>{"challenge_sent", auth_phase_t::challenge_sent},
    enum_mapping_t<auth_phase_t>{"authenticated", auth_phase_t::authenticated}};

template <>
inline std::optional<auth_phase_t> try_from_string<auth_phase_t>(
    const std::string_view value) {
  return from_string(value, kAuthPhaseMappings);
}

inline constexpr std::string_view to_string(const auth_phase_t value) {
  return to_string(value, kAuthPhaseMappings).value_or("unknown");
}

}  // namespace swapdot::schema
