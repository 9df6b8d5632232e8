#pragma once

#include <swapdot/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <string_view>
#include <variant>

namespace swapdot::crypto {

enum class codec_error_t : uint8_t {
  weak_key = 0,
  cipher_failure = 1,
  invalid_key_length = 2,
  key_length_mismatch = 3,
  not_implemented = 4,
  parameter_out_of_range = 5
};

inline constexpr auto kCodecErrorMappings = std::array{
    swapdot::schema::enum_mapping_t<codec_error_t>{"weak_key",
                                                   codec_error_t::weak_key},
    swapdot::schema::enum_mapping_t<codec_error_t>{
        "cipher_failure", codec_error_t::cipher_failure},
    swapdot::schema::enum_mapping_t<codec_error_t>{
        "invalid_key_length", codec_error_t::invalid_key_length},
    swapdot::schema::enum_mapping_t<codec_error_t>{
        "key_length_mismatch", codec_error_t::key_length_mismatch},
    swapdot::schema::enum_mapping_t<codec_error_t>{
        "not_implemented", codec_error_t::not_implemented},
    swapdot::schema::enum_mapping_t<codec_error_t>{
        "parameter_out_of_range", codec_error_t::parameter_out_of_range}};

inline constexpr std::string_view to_string(const codec_error_t value) {
  return swapdot::schema::to_string(value, kCodecErrorMappings)
      .value_or("unknown");
}

/// Either the transformed bytes or the reason the transform was refused.
template <typename T>
using codec_result_t = std::variant<T, codec_error_t>;

}  // namespace swapdot::crypto
