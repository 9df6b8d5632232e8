#pragma once

#include <swapdot/schema/primitives.hpp>

#include <chrono>
#include <functional>

namespace swapdot::common {

/// Wall clock seam. Every expiry decision reads time through one of these.
using time_source_t = std::function<swapdot::schema::timestamp_milliseconds_t()>;

inline time_source_t system_time_source() {
  return [] {
    return static_cast<swapdot::schema::timestamp_milliseconds_t>(
        std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::system_clock::now().time_since_epoch())
            .count());
  };
}

}  // namespace swapdot::common
