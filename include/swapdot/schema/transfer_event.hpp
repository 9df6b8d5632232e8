#pragma once
#include <swapdot/schema/primitives.hpp>
#include <swapdot/schema/transfer_protocol.hpp>

namespace swapdot::schema {

template <uint16_t Version>
struct transfer_event;

/// Immutable ownership change record. chain_head folds every earlier event of
/// the same token.
template <>
struct transfer_event<1> final {
  uint16_t version{1};
  uint64_t sequence{};
  token_id_t token_id;
  user_id_t from_owner;
  user_id_t to_owner;
  uint64_t counter{};
  transfer_protocol_t protocol{transfer_protocol_t::legacy};
  timestamp_milliseconds_t timestamp{};
  hash32_t chain_head{};
};

using transfer_event_t = transfer_event<1>;

}  // namespace swapdot::schema
