#pragma once

#include <swapdot/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

namespace swapdot::schema {

// Audit trail categories for non-transfer ledger writes.
enum class audit_type_t : uint8_t {
  rollback = 0,
  correction = 1,
  expiry = 2,
  security_violation = 3
};

inline constexpr auto kAuditTypeMappings = std::array{
    enum_mapping_t<audit_type_t>{"rollback", audit_type_t::rollback},
    enum_mapping_t<audit_type_t>{"correction", audit_type_t::correction},
    enum_mapping_t<audit_type_t>{"expiry", audit_type_t::expiry},
    enum_mapping_t<audit_type_t>{"security_violation", audit_type_t::security_violation}};

template <>
inline std::optional<audit_type_t> try_from_string<audit_type_t>(
    const std::string_view value) {
  return from_string(value, kAuditTypeMappings);
}

inline constexpr std::string_view to_string(const audit_type_t value) {
  return to_string(value, kAuditTypeMappings).value_or("unknown");
}

}  // namespace swapdot::schema
