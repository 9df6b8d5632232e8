#pragma once
#include <swapdot/common/critical.hpp>
#include <swapdot/schema/audit_record.hpp>
#include <swapdot/schema/auth_session.hpp>
#include <swapdot/schema/encoding/encoder.hpp>
#include <swapdot/schema/pending_transfer.hpp>
#include <swapdot/schema/staged_transfer.hpp>
#include <swapdot/schema/token_state.hpp>
#include <swapdot/schema/transfer_event.hpp>
#include <swapdot/schema/transfer_session.hpp>
#include <swapdot/schema/user_stats.hpp>
#include <iterator>
#include <scale/scale.hpp>

namespace swapdot::schema::encoding {

// Records are plain aggregates; SCALE encodes them field by field in
// declaration order, so reordering fields changes the stored format.
struct scale_encoder_tag {};

template <>
struct encoder<scale_encoder_tag> final {
  template <typename T>
  swapdot::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, swapdot::schema::bytes_t& out);

  template <typename T>
  T decode(const swapdot::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const swapdot::schema::bytes_view_t& bytes);
};

using scale_encoder_t = encoder<scale_encoder_tag>;

template <typename T>
swapdot::schema::bytes_t encoder<scale_encoder_tag>::encode(const T& obj) {
  auto encoded = ::scale::impl::memory::encode(obj);
  if (!encoded) {
    swapdot::common::critical("failed to encode SCALE object");
  }
  return encoded.value();
}

template <typename T>
void encoder<scale_encoder_tag>::encode(const T& obj,
                                        swapdot::schema::bytes_t& out) {
  auto encoded = encode(obj);
  out.insert(std::end(out), std::begin(encoded), std::end(encoded));
}

template <typename T>
T encoder<scale_encoder_tag>::decode(
    const swapdot::schema::bytes_view_t& bytes) {
  auto decoded = ::scale::impl::memory::decode<T>(bytes);
  if (!decoded) {
    swapdot::common::critical("failed to decode SCALE bytes");
  }
  return decoded.value();
}

template <typename T>
std::optional<T> encoder<scale_encoder_tag>::try_decode(
    const swapdot::schema::bytes_view_t& bytes) {
  auto decoded = ::scale::impl::memory::decode<T>(bytes);
  if (!decoded) {
    return std::nullopt;
  }
  return decoded.value();
}

}  // namespace swapdot::schema::encoding
