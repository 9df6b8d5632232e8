#pragma once
#include <swapdot/schema/primitives.hpp>
#include <swapdot/schema/token_status.hpp>
#include <optional>
#include <string>
#include <vector>

namespace swapdot::schema {

/// Short-lived exclusion marker held while a physical tap authenticates.
struct token_lease final {
  std::string lease_id;
  std::string session_id;
  timestamp_milliseconds_t expires_at{};
};

using token_lease_t = token_lease;

template <uint16_t Version>
struct token_state;

/// Durable ownership record. Only the ledger mutates owner, counter,
/// previous_owners and status, and only inside a store transaction.
template <>
struct token_state<1> final {
  uint16_t version{1};
  token_id_t token_id;
  user_id_t current_owner;
  std::vector<user_id_t> previous_owners;
  hash32_t key_hash{};
  uint64_t counter{};
  token_status_t status{token_status_t::ok};
  std::optional<token_lease_t> lease;
  std::optional<std::string> tag_uid;
  uint8_t key_version{};
  hash32_t chain_head{};
  timestamp_milliseconds_t created_at{};
  timestamp_milliseconds_t last_transfer_at{};
};

using token_state_t = token_state<1>;

}  // namespace swapdot::schema
