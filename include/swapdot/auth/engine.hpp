#pragma once

#include <swapdot/auth/key_provider.hpp>
#include <swapdot/common/options.hpp>
#include <swapdot/common/time_source.hpp>
#include <swapdot/messaging/codec.hpp>
#include <swapdot/schema/encoding/scale/encoder.hpp>
#include <swapdot/schema/operation_result.hpp>
#include <swapdot/session/session_store.hpp>
#include <swapdot/storage/rocksdb/storage.hpp>

#include <cstdint>
#include <optional>
#include <string>

namespace swapdot::auth {

struct begin_output final {
  std::string session_id;
  swapdot::schema::bytes_t apdu;
  swapdot::schema::timestamp_milliseconds_t expires_at{};
};

struct continue_output final {
  bool authenticated{};
  /// Next command for the card. Empty once authenticated.
  swapdot::schema::bytes_t apdu;
};

struct change_key_output final {
  swapdot::messaging::frames_t apdus;
  swapdot::schema::hash32_t key_hash{};
  uint8_t key_version{};
};

struct write_transfer_output final {
  swapdot::messaging::frames_t apdus;
  swapdot::schema::hash32_t key_hash{};
};

/// Server side of the DESFire native 3DES mutual authentication and the
/// commands that need its session key.
///
/// Session phases: init -> challenge_sent -> authenticated. A wrong length,
/// wrong status word or failed RndA check destroys the session; so does a
/// key the cipher rejects. Every call re-checks expiry.
class engine final {
 public:
  engine(swapdot::schema::encoding::scale_encoder_t& encoder,
         const swapdot::storage::rocksdb_storage_t& storage,
         swapdot::session::session_store& sessions,
         const key_provider& keys,
         const swapdot::common::service_options& options,
         swapdot::common::time_source_t clock);

  /// Check ownership, take the token lease and open a session. Returns the
  /// first Authenticate command.
  ///
  /// allow_unowned only applies to tokens that are not registered yet; a
  /// registered token always requires its owner.
  swapdot::schema::operation_result<begin_output> begin(
      const swapdot::schema::token_id_t& token_id,
      const swapdot::schema::user_id_t& user_id,
      bool allow_unowned);

  /// Feed one card response. card_response is either the 8 data bytes or
  /// the data followed by its 91xx status word.
  swapdot::schema::operation_result<continue_output> continue_authenticate(
      const std::string& session_id,
      const swapdot::schema::bytes_view_t& card_response);

  /// ChangeKey frames rotating the authenticated key to new_key_version
  /// (current + 1 when absent). The new key is never stored, only its hash.
  swapdot::schema::operation_result<change_key_output> change_key(
      const std::string& session_id,
      std::optional<uint8_t> new_key_version);

  /// Record the card's answer to ChangeKey. On 91 00 the token's key version
  /// advances and the session ends, since the card drops authentication.
  swapdot::schema::operation_status_t confirm_change_key(
      const std::string& session_id,
      const swapdot::schema::bytes_view_t& card_response);

  /// WriteData frames carrying a fresh 32 byte ownership secret. Its SHA-256
  /// becomes the transfer session's pending key hash.
  swapdot::schema::operation_result<write_transfer_output> write_transfer_data(
      const std::string& session_id,
      const std::string& transfer_session_id);

  swapdot::schema::operation_result<swapdot::schema::bytes_t> read_file_data(
      const std::string& session_id,
      uint8_t file_no,
      uint32_t offset,
      std::optional<uint32_t> length);

 private:
  /// Load a session that must have finished authentication.
  swapdot::schema::operation_result<swapdot::schema::auth_session_t>
  load_authenticated(swapdot::storage::rocksdb_transaction_t& txn,
                     const std::string& session_id);

  std::optional<swapdot::crypto::des_key_t> card_key(
      const swapdot::schema::auth_session_t& session) const;

  void release_lease(swapdot::storage::rocksdb_transaction_t& txn,
                     const swapdot::schema::auth_session_t& session);

  swapdot::schema::encoding::scale_encoder_t& encoder_;
  const swapdot::storage::rocksdb_storage_t& storage_;
  swapdot::session::session_store& sessions_;
  const key_provider& keys_;
  const swapdot::common::service_options& options_;
  swapdot::common::time_source_t clock_;
};

}  // namespace swapdot::auth
