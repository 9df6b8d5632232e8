#pragma once
#include <swapdot/schema/auth_phase.hpp>
#include <swapdot/schema/primitives.hpp>
#include <optional>
#include <string>

namespace swapdot::schema {

template <uint16_t Version>
struct auth_session;

template <>
struct auth_session<1> final {
  uint16_t version{1};
  std::string session_id;
  token_id_t token_id;
  user_id_t user_id;
  auth_phase_t phase{auth_phase_t::init};
  uint8_t key_no{};
  uint8_t key_version{};
  bytes_t rnd_a;
  bytes_t rnd_b;
  bytes_t chained_iv;
  bytes_t session_key;
  std::string lease_id;
  std::optional<uint8_t> pending_key_version;
  std::optional<hash32_t> pending_key_hash;
  timestamp_milliseconds_t created_at{};
  timestamp_milliseconds_t expires_at{};
};

using auth_session_t = auth_session<1>;

}  // namespace swapdot::schema
