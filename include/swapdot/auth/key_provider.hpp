#pragma once

#include <swapdot/schema/primitives.hpp>

#include <cstdint>

namespace swapdot::auth {

/// Source of card keys. Keys never leave the backend; the engine asks for
/// the key a token holds at a given key version.
class key_provider {
 public:
  virtual ~key_provider() = default;

  /// Raw 8, 16 or 24 byte DES family key for token at key_version.
  virtual swapdot::schema::bytes_t card_key(
      const swapdot::schema::token_id_t& token_id,
      uint8_t key_version) const = 0;
};

/// Keys derived from one configured master key.
///
/// Without diversification every token and version uses the master key. With
/// it, version 0 stays the master (factory bootstrap) and later versions are
/// HMAC-SHA256(master, label ‖ token_id ‖ version) truncated to the master
/// key length.
class master_key_provider final : public key_provider {
 public:
  master_key_provider(swapdot::schema::bytes_t master_key, bool diversify);

  swapdot::schema::bytes_t card_key(const swapdot::schema::token_id_t& token_id,
                                    uint8_t key_version) const override;

 private:
  swapdot::schema::bytes_t master_key_;
  bool diversify_{false};
};

}  // namespace swapdot::auth
