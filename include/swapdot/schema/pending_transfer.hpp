#pragma once
#include <swapdot/schema/pending_transfer_status.hpp>
#include <swapdot/schema/primitives.hpp>
#include <optional>

namespace swapdot::schema {

template <uint16_t Version>
struct pending_transfer;

// Keyed by token id, so a token has at most one.
template <>
struct pending_transfer<1> final {
  uint16_t version{1};
  token_id_t token_id;
  user_id_t from_uid;
  std::optional<user_id_t> to_uid;
  uint64_t n_next{};
  pending_transfer_status_t status{pending_transfer_status_t::open};
  timestamp_milliseconds_t created_at{};
  timestamp_milliseconds_t expires_at{};
};

using pending_transfer_t = pending_transfer<1>;

}  // namespace swapdot::schema
