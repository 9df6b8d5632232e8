#pragma once

#include <swapdot/crypto/codec_error.hpp>
#include <swapdot/schema/primitives.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <variant>

namespace swapdot::crypto {

inline constexpr auto kDesBlockSize = std::size_t{8};

/// Single DES key widened to K||K so it runs through two-key 3DES.
struct single_des_key final {
  std::array<uint8_t, 16> bytes{};
};

struct two_key_3des_key final {
  std::array<uint8_t, 16> bytes{};
};

struct three_key_3des_key final {
  std::array<uint8_t, 24> bytes{};
};

using single_des_key_t = single_des_key;
using two_key_3des_key_t = two_key_3des_key;
using three_key_3des_key_t = three_key_3des_key;

/// A parity-corrected DES family key. Only normalize_key builds these, so a
/// key of any other length cannot reach a cipher call.
using des_key_t =
    std::variant<single_des_key_t, two_key_3des_key_t, three_key_3des_key_t>;

/// Set the low bit so the byte has an odd number of set bits. Bits 1..7 are
/// never changed.
uint8_t with_odd_parity(uint8_t value);

/// Build a key from 8, 16 or 24 raw bytes; std::nullopt for any other length.
std::optional<des_key_t> normalize_key(const swapdot::schema::bytes_view_t& raw);

/// The normalized key material handed to the cipher (16 or 24 bytes).
swapdot::schema::bytes_view_t key_bytes(const des_key_t& key);

/// True when any 8 byte component is a DES weak or semi-weak key. Card keys
/// may legitimately be weak (the factory default is all zero); session keys
/// must not be.
bool is_weak_key(const des_key_t& key);

/// CBC without padding. data must be block aligned and iv one block long.
/// A cipher that refuses the key surfaces as codec_error_t::weak_key.
codec_result_t<swapdot::schema::bytes_t> encrypt_cbc(
    const des_key_t& key,
    const swapdot::schema::bytes_view_t& iv,
    const swapdot::schema::bytes_view_t& data);

codec_result_t<swapdot::schema::bytes_t> decrypt_cbc(
    const des_key_t& key,
    const swapdot::schema::bytes_view_t& iv,
    const swapdot::schema::bytes_view_t& data);

}  // namespace swapdot::crypto
