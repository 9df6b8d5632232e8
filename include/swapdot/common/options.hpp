#pragma once

#include <swapdot/schema/comm_mode.hpp>
#include <swapdot/schema/primitives.hpp>

#include <cstddef>
#include <cstdint>

namespace swapdot::common {

/// Runtime knobs shared by the protocol engine, the ledger and the janitor.
/// main fills this from the command line and the optional config file.
struct service_options final {
  swapdot::schema::duration_milliseconds_t auth_session_ttl_ms{60'000};
  swapdot::schema::duration_milliseconds_t token_lease_ttl_ms{15'000};
  swapdot::schema::duration_milliseconds_t pending_ttl_ms{600'000};
  swapdot::schema::duration_milliseconds_t transfer_session_ttl_ms{300'000};
  swapdot::schema::duration_milliseconds_t staged_ttl_ms{600'000};
  std::size_t sweep_batch{100};
  uint32_t transaction_attempts{5};
  uint8_t auth_key_no{0x00};
  uint8_t transfer_file_no{0x01};
  uint32_t default_read_length{200};
  swapdot::schema::comm_mode_t transfer_write_mode{
      swapdot::schema::comm_mode_t::plain};
  swapdot::schema::bytes_t master_key = swapdot::schema::bytes_t(16, 0x00);
  bool diversify_keys{false};
};

}  // namespace swapdot::common
