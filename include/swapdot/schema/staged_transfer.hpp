#pragma once
#include <swapdot/schema/primitives.hpp>
#include <swapdot/schema/staged_transfer_status.hpp>
#include <optional>
#include <string>
#include <vector>

namespace swapdot::schema {

/// Ownership fields of a token at one point in time.
struct token_snapshot final {
  user_id_t owner;
  std::vector<user_id_t> previous_owners;
  hash32_t key_hash{};
};

using token_snapshot_t = token_snapshot;

template <uint16_t Version>
struct staged_transfer;

template <>
struct staged_transfer<1> final {
  uint16_t version{1};
  std::string staged_id;
  std::string session_id;
  token_id_t token_id;
  user_id_t from_uid;
  user_id_t to_uid;
  token_snapshot_t original;
  token_snapshot_t proposed;
  staged_transfer_status_t status{staged_transfer_status_t::staged};
  std::optional<std::string> rollback_reason;
  timestamp_milliseconds_t created_at{};
  timestamp_milliseconds_t expires_at{};
};

using staged_transfer_t = staged_transfer<1>;

}  // namespace swapdot::schema
