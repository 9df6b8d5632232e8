#pragma once
#include <swapdot/schema/primitives.hpp>

namespace swapdot::schema {

template <uint16_t Version>
struct user_stats;

template <>
struct user_stats<1> final {
  uint16_t version{1};
  user_id_t user_id;
  uint64_t tokens_owned{};
  uint64_t tokens_transferred_out{};
  uint64_t tokens_received{};
  timestamp_milliseconds_t last_active_at{};
};

using user_stats_t = user_stats<1>;

}  // namespace swapdot::schema
