#pragma once
#include <swapdot/schema/primitives.hpp>
#include <optional>
#include <span>

namespace swapdot::schema::encoding {

/// Record codec selected at build time by tag. The ledger, session store and
/// key builders are written against this shape only.
template <typename Library>
struct encoder {
  template <typename T>
  swapdot::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, swapdot::schema::bytes_t& out);

  template <typename T>
  T decode(const swapdot::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const swapdot::schema::bytes_view_t& bytes);
};

}  // namespace swapdot::schema::encoding
