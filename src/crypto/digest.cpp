#include <swapdot/common/critical.hpp>
#include <swapdot/crypto/digest.hpp>

#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <openssl/rand.h>

namespace swapdot::crypto {

swapdot::schema::hash32_t sha256(const swapdot::schema::bytes_view_t& data) {
  auto out = swapdot::schema::hash32_t{};
  auto length = 0u;
  if (EVP_Digest(data.data(), data.size(), out.data(), &length, EVP_sha256(),
                 nullptr) != 1 ||
      length != out.size()) {
    swapdot::common::critical("SHA-256 digest failed");
  }
  return out;
}

swapdot::schema::hash32_t hmac_sha256(
    const swapdot::schema::bytes_view_t& key,
    const swapdot::schema::bytes_view_t& message) {
  auto out = swapdot::schema::hash32_t{};
  auto length = 0u;
  if (HMAC(EVP_sha256(), key.data(), static_cast<int>(key.size()),
           message.data(), message.size(), out.data(), &length) == nullptr ||
      length != out.size()) {
    swapdot::common::critical("HMAC-SHA256 failed");
  }
  return out;
}

swapdot::schema::bytes_t random_bytes(const std::size_t count) {
  auto out = swapdot::schema::bytes_t(count);
  if (count > 0 && RAND_bytes(out.data(), static_cast<int>(count)) != 1) {
    swapdot::common::critical("RAND_bytes failed");
  }
  return out;
}

std::string random_hex_id(const std::size_t count) {
  return swapdot::schema::to_hex(random_bytes(count));
}

bool constant_time_equal(const swapdot::schema::bytes_view_t& lhs,
                         const swapdot::schema::bytes_view_t& rhs) {
  if (lhs.size() != rhs.size()) {
    return false;
  }
  return CRYPTO_memcmp(lhs.data(), rhs.data(), lhs.size()) == 0;
}

}  // namespace swapdot::crypto
