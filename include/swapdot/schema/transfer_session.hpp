#pragma once
#include <swapdot/schema/primitives.hpp>
#include <swapdot/schema/transfer_session_status.hpp>
#include <optional>
#include <string>

namespace swapdot::schema {

template <uint16_t Version>
struct transfer_session;

/// Two-phase transfer handle. The challenge binds the card-key proof to this
/// session; validated flips once the caller has shown the token's key.
template <>
struct transfer_session<1> final {
  uint16_t version{1};
  std::string session_id;
  token_id_t token_id;
  user_id_t from_uid;
  std::optional<user_id_t> to_uid;
  transfer_session_status_t status{transfer_session_status_t::pending};
  bytes_t challenge;
  bool validated{};
  std::optional<hash32_t> validated_key_hash;
  std::optional<hash32_t> proof;
  std::optional<hash32_t> pending_key_hash;
  std::optional<std::string> staged_transfer_id;
  timestamp_milliseconds_t created_at{};
  timestamp_milliseconds_t expires_at{};
};

using transfer_session_t = transfer_session<1>;

}  // namespace swapdot::schema
