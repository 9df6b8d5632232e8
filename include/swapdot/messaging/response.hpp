#pragma once

#include <swapdot/schema/enum_string.hpp>
#include <swapdot/schema/primitives.hpp>

#include <array>
#include <cstdint>
#include <string_view>
#include <variant>
#include <vector>

namespace swapdot::messaging {

inline constexpr auto kStatusClass = uint8_t{0x91};
inline constexpr auto kStatusOk = uint8_t{0x00};
inline constexpr auto kStatusMoreFrames = uint8_t{0xAF};

enum class status_error_t : uint8_t {
  malformed = 0,
  length_error = 1,
  permission_denied = 2,
  not_found = 3,
  command_not_supported = 4,
  integrity_error = 5,
  authentication_error = 6,
  boundary_error = 7,
  unknown = 8
};

inline constexpr auto kStatusErrorMappings = std::array{
    swapdot::schema::enum_mapping_t<status_error_t>{"malformed",
                                                    status_error_t::malformed},
    swapdot::schema::enum_mapping_t<status_error_t>{
        "length_error", status_error_t::length_error},
    swapdot::schema::enum_mapping_t<status_error_t>{
        "permission_denied", status_error_t::permission_denied},
    swapdot::schema::enum_mapping_t<status_error_t>{"not_found",
                                                    status_error_t::not_found},
    swapdot::schema::enum_mapping_t<status_error_t>{
        "command_not_supported", status_error_t::command_not_supported},
    swapdot::schema::enum_mapping_t<status_error_t>{
        "integrity_error", status_error_t::integrity_error},
    swapdot::schema::enum_mapping_t<status_error_t>{
        "authentication_error", status_error_t::authentication_error},
    swapdot::schema::enum_mapping_t<status_error_t>{
        "boundary_error", status_error_t::boundary_error},
    swapdot::schema::enum_mapping_t<status_error_t>{"unknown",
                                                    status_error_t::unknown}};

inline constexpr std::string_view to_string(const status_error_t value) {
  return swapdot::schema::to_string(value, kStatusErrorMappings)
      .value_or("unknown");
}

/// 91 00. data is everything before the status word.
struct response_success final {
  swapdot::schema::bytes_t data;
};

/// 91 AF. The card expects another 0xAF request.
struct response_more_frames final {
  swapdot::schema::bytes_t data;
};

struct response_error final {
  status_error_t error{status_error_t::unknown};
  uint8_t sw1{};
  uint8_t sw2{};
};

using response_success_t = response_success;
using response_more_frames_t = response_more_frames;
using response_error_t = response_error;

using response_t =
    std::variant<response_success_t, response_more_frames_t, response_error_t>;

/// Classify a card response by its trailing status word.
response_t parse_response(const swapdot::schema::bytes_view_t& bytes);

/// Join the data of a chained exchange. Every response but the last must be
/// 91 AF and the last must be 91 00.
std::variant<response_success_t, response_error_t> assemble_response(
    const std::vector<swapdot::schema::bytes_t>& responses);

}  // namespace swapdot::messaging
