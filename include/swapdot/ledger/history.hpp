#pragma once

#include <swapdot/schema/primitives.hpp>

#include <vector>

namespace swapdot::ledger {

/// True when proposed keeps existing as an exact prefix and adds at most one
/// owner, which must not be new_owner. An empty existing history accepts
/// anything (first registration).
bool validate_append_only(const std::vector<swapdot::schema::user_id_t>& existing,
                          const std::vector<swapdot::schema::user_id_t>& proposed,
                          const swapdot::schema::user_id_t& new_owner);

/// existing plus previous_owner, unless previous_owner is already the last
/// entry.
std::vector<swapdot::schema::user_id_t> propose_history(
    const std::vector<swapdot::schema::user_id_t>& existing,
    const swapdot::schema::user_id_t& previous_owner);

}  // namespace swapdot::ledger
