#pragma once
#include <swapdot/schema/primitives.hpp>
#include <string_view>

namespace swapdot::blake3 {

swapdot::schema::hash32_t hash(const std::string_view& str);
swapdot::schema::hash32_t hash(const swapdot::schema::bytes_view_t& bytes);

/// blake3(previous ‖ payload). Folds one more record into a running chain.
swapdot::schema::hash32_t chain(const swapdot::schema::hash32_t& previous,
                                const swapdot::schema::bytes_view_t& payload);

}  // namespace swapdot::blake3
