#include <swapdot/auth/key_provider.hpp>
#include <swapdot/common/critical.hpp>
#include <swapdot/crypto/des.hpp>
#include <swapdot/crypto/digest.hpp>

#include <algorithm>
#include <array>
#include <string_view>
#include <utility>

namespace swapdot::auth {

namespace {

inline constexpr auto kDiversificationLabel =
    std::string_view{"swapdot/card-key/v1"};

}  // namespace

master_key_provider::master_key_provider(swapdot::schema::bytes_t master_key,
                                         const bool diversify)
    : master_key_{std::move(master_key)}, diversify_{diversify} {
  if (!swapdot::crypto::normalize_key(master_key_)) {
    swapdot::common::critical("master key must be 8, 16 or 24 bytes");
  }
}

swapdot::schema::bytes_t master_key_provider::card_key(
    const swapdot::schema::token_id_t& token_id,
    const uint8_t key_version) const {
  if (!diversify_ || key_version == 0) {
    return master_key_;
  }
  auto derived = swapdot::crypto::hmac_sha256(
      master_key_,
      swapdot::schema::concat(
          swapdot::schema::make_bytes_view(kDiversificationLabel),
          swapdot::schema::make_bytes_view(token_id),
          std::array<uint8_t, 1>{key_version}));
  return swapdot::schema::bytes_t(
      std::begin(derived),
      std::begin(derived) + static_cast<std::ptrdiff_t>(master_key_.size()));
}

}  // namespace swapdot::auth
