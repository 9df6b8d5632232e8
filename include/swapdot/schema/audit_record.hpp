#pragma once
#include <swapdot/schema/audit_type.hpp>
#include <swapdot/schema/primitives.hpp>
#include <string>

namespace swapdot::schema {

template <uint16_t Version>
struct audit_record;

template <>
struct audit_record<1> final {
  uint16_t version{1};
  uint64_t sequence{};
  audit_type_t type{audit_type_t::rollback};
  token_id_t token_id;
  std::string subject_id;
  user_id_t from_uid;
  user_id_t to_uid;
  std::string reason;
  timestamp_milliseconds_t timestamp{};
};

using audit_record_t = audit_record<1>;

}  // namespace swapdot::schema
