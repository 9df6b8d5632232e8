// DES_is_weak_key is only exposed through the deprecated DES API.
#define OPENSSL_SUPPRESS_DEPRECATED

#include <swapdot/crypto/des.hpp>

#include <openssl/des.h>
#include <openssl/evp.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <bit>
#include <memory>

namespace swapdot::crypto {

namespace {

using evp_cipher_ctx_ptr =
    std::unique_ptr<EVP_CIPHER_CTX, decltype(&EVP_CIPHER_CTX_free)>;

template <typename Key, std::size_t N>
Key make_key(const std::array<uint8_t, N>& raw) {
  auto key = Key{};
  std::transform(std::begin(raw), std::end(raw), std::begin(key.bytes),
                 with_odd_parity);
  return key;
}

template <std::size_t N>
std::array<uint8_t, N> copy_array(const swapdot::schema::bytes_view_t& raw) {
  auto out = std::array<uint8_t, N>{};
  std::copy_n(std::begin(raw), N, std::begin(out));
  return out;
}

const EVP_CIPHER* cipher_for(const des_key_t& key) {
  return std::visit(
      overloaded{
          [](const three_key_3des_key_t&) { return EVP_des_ede3_cbc(); },
          [](const auto&) { return EVP_des_ede_cbc(); }},
      key);
}

codec_result_t<swapdot::schema::bytes_t> run_cbc(
    const des_key_t& key,
    const swapdot::schema::bytes_view_t& iv,
    const swapdot::schema::bytes_view_t& data,
    const int encrypt) {
  if (iv.size() != kDesBlockSize || (data.size() % kDesBlockSize) != 0) {
    return codec_error_t::cipher_failure;
  }

  auto ctx = evp_cipher_ctx_ptr{EVP_CIPHER_CTX_new(), EVP_CIPHER_CTX_free};
  if (!ctx) {
    return codec_error_t::cipher_failure;
  }

  auto material = key_bytes(key);
  if (EVP_CipherInit_ex(ctx.get(), cipher_for(key), nullptr, material.data(),
                        iv.data(), encrypt) != 1) {
    spdlog::warn("3DES cipher rejected key material");
    return codec_error_t::weak_key;
  }
  EVP_CIPHER_CTX_set_padding(ctx.get(), 0);

  auto out = swapdot::schema::bytes_t(data.size() + kDesBlockSize);
  auto written = 0;
  if (EVP_CipherUpdate(ctx.get(), out.data(), &written, data.data(),
                       static_cast<int>(data.size())) != 1) {
    return codec_error_t::weak_key;
  }
  auto tail = 0;
  if (EVP_CipherFinal_ex(ctx.get(), out.data() + written, &tail) != 1) {
    return codec_error_t::weak_key;
  }
  out.resize(static_cast<std::size_t>(written + tail));
  return out;
}

}  // namespace

uint8_t with_odd_parity(const uint8_t value) {
  auto high_bits = std::popcount(static_cast<unsigned>(value & 0xFEu));
  if ((high_bits % 2) == 0) {
    return static_cast<uint8_t>(value | 0x01u);
  }
  return static_cast<uint8_t>(value & 0xFEu);
}

std::optional<des_key_t> normalize_key(
    const swapdot::schema::bytes_view_t& raw) {
  switch (raw.size()) {
    case 8: {
      auto doubled = std::array<uint8_t, 16>{};
      std::copy_n(std::begin(raw), 8, std::begin(doubled));
      std::copy_n(std::begin(raw), 8, std::begin(doubled) + 8);
      return des_key_t{make_key<single_des_key_t>(doubled)};
    }
    case 16:
      return des_key_t{make_key<two_key_3des_key_t>(copy_array<16>(raw))};
    case 24:
      return des_key_t{make_key<three_key_3des_key_t>(copy_array<24>(raw))};
    default:
      return std::nullopt;
  }
}

swapdot::schema::bytes_view_t key_bytes(const des_key_t& key) {
  return std::visit(
      [](const auto& value) {
        return swapdot::schema::bytes_view_t{value.bytes.data(),
                                             value.bytes.size()};
      },
      key);
}

bool is_weak_key(const des_key_t& key) {
  auto material = key_bytes(key);
  for (std::size_t i = 0; i + kDesBlockSize <= material.size();
       i += kDesBlockSize) {
    DES_cblock block{};
    std::copy_n(std::begin(material) + static_cast<std::ptrdiff_t>(i),
                kDesBlockSize, std::begin(block));
    if (DES_is_weak_key(&block) == 1) {
      return true;
    }
  }
  return false;
}

codec_result_t<swapdot::schema::bytes_t> encrypt_cbc(
    const des_key_t& key,
    const swapdot::schema::bytes_view_t& iv,
    const swapdot::schema::bytes_view_t& data) {
  return run_cbc(key, iv, data, 1);
}

codec_result_t<swapdot::schema::bytes_t> decrypt_cbc(
    const des_key_t& key,
    const swapdot::schema::bytes_view_t& iv,
    const swapdot::schema::bytes_view_t& data) {
  return run_cbc(key, iv, data, 0);
}

}  // namespace swapdot::crypto
