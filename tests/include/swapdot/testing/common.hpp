#pragma once

#include <swapdot/common/time_source.hpp>
#include <swapdot/schema/primitives.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <system_error>

namespace swapdot::testing {

inline swapdot::schema::hash32_t make_hash(const uint8_t seed) {
  auto out = swapdot::schema::hash32_t{};
  for (std::size_t i = 0; i < out.size(); ++i) {
    out[i] = static_cast<uint8_t>(seed + static_cast<uint8_t>(i));
  }
  return out;
}

inline swapdot::schema::bytes_t make_sequence(const std::size_t size,
                                              const uint8_t seed = 0) {
  auto out = swapdot::schema::bytes_t(size);
  for (std::size_t i = 0; i < out.size(); ++i) {
    out[i] = static_cast<uint8_t>(seed + static_cast<uint8_t>(i));
  }
  return out;
}

inline std::string make_db_path(const std::string_view prefix) {
  const auto now =
      std::chrono::high_resolution_clock::now().time_since_epoch().count();
  const auto path = std::filesystem::temp_directory_path() /
                    (std::string{prefix} + "_" +
                     std::to_string(static_cast<unsigned long long>(now)));
  return path.string();
}

inline void remove_path(const std::string& path) {
  auto error = std::error_code{};
  std::filesystem::remove_all(path, error);
}

/// Settable clock shared by every component built from source().
class manual_clock final {
 public:
  explicit manual_clock(
      const swapdot::schema::timestamp_milliseconds_t start = 1'700'000'000'000)
      : now_{std::make_shared<std::atomic<uint64_t>>(start)} {}

  swapdot::common::time_source_t source() const {
    auto now = now_;
    return [now] { return now->load(); };
  }

  swapdot::schema::timestamp_milliseconds_t now() const { return now_->load(); }

  void advance(const swapdot::schema::duration_milliseconds_t duration) {
    now_->fetch_add(duration);
  }

 private:
  std::shared_ptr<std::atomic<uint64_t>> now_;
};

}  // namespace swapdot::testing
