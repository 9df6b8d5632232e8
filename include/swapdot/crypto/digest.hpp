#pragma once

#include <swapdot/schema/primitives.hpp>

#include <cstddef>
#include <string>

namespace swapdot::crypto {

swapdot::schema::hash32_t sha256(const swapdot::schema::bytes_view_t& data);

swapdot::schema::hash32_t hmac_sha256(
    const swapdot::schema::bytes_view_t& key,
    const swapdot::schema::bytes_view_t& message);

/// Cryptographically secure random bytes. Terminates when the RNG fails.
swapdot::schema::bytes_t random_bytes(std::size_t count);

/// Lower-case hex of count random bytes, used for session and lease ids.
std::string random_hex_id(std::size_t count);

/// Length-checked comparison whose timing does not depend on content.
bool constant_time_equal(const swapdot::schema::bytes_view_t& lhs,
                         const swapdot::schema::bytes_view_t& rhs);

}  // namespace swapdot::crypto
