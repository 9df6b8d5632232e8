#include <blake3.h>
#include <swapdot/blake3/hash.hpp>

namespace swapdot::blake3 {

swapdot::schema::hash32_t hash(const std::string_view& str) {
  auto hasher = blake3_hasher{};
  blake3_hasher_init(&hasher);
  blake3_hasher_update(&hasher, str.data(), str.size());
  auto output = swapdot::schema::hash32_t{};
  blake3_hasher_finalize(&hasher, output.data(), output.size());
  return output;
}

swapdot::schema::hash32_t hash(const swapdot::schema::bytes_view_t& bytes) {
  auto hasher = blake3_hasher{};
  blake3_hasher_init(&hasher);
  blake3_hasher_update(&hasher, bytes.data(), bytes.size());
  auto output = swapdot::schema::hash32_t{};
  blake3_hasher_finalize(&hasher, output.data(), output.size());
  return output;
}

swapdot::schema::hash32_t chain(const swapdot::schema::hash32_t& previous,
                                const swapdot::schema::bytes_view_t& payload) {
  auto hasher = blake3_hasher{};
  blake3_hasher_init(&hasher);
  blake3_hasher_update(&hasher, previous.data(), previous.size());
  blake3_hasher_update(&hasher, payload.data(), payload.size());
  auto output = swapdot::schema::hash32_t{};
  blake3_hasher_finalize(&hasher, output.data(), output.size());
  return output;
}

}  // namespace swapdot::blake3
