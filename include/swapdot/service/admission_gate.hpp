#pragma once

#include <swapdot/schema/operation_result.hpp>
#include <swapdot/schema/primitives.hpp>

#include <string>

namespace swapdot::service {

struct admission_request final {
  std::string operation;
  swapdot::schema::user_id_t caller;
  swapdot::schema::token_id_t token_id;
  std::string peer;
};

using admission_request_t = admission_request;

/// Pre-check run by the relay before any core operation. Anti-spoofing and
/// rate limiting live behind this seam; the core never depends on it.
class admission_gate {
 public:
  virtual ~admission_gate() = default;

  virtual swapdot::schema::operation_status_t admit(
      const admission_request_t& request) const = 0;
};

class allow_all_gate final : public admission_gate {
 public:
  swapdot::schema::operation_status_t admit(
      const admission_request_t& /*request*/) const override {
    return {};
  }
};

}  // namespace swapdot::service
