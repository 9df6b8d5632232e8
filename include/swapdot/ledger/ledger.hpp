#pragma once

#include <swapdot/common/options.hpp>
#include <swapdot/common/time_source.hpp>
#include <swapdot/schema/audit_record.hpp>
#include <swapdot/schema/encoding/scale/encoder.hpp>
#include <swapdot/schema/operation_result.hpp>
#include <swapdot/schema/pending_transfer.hpp>
#include <swapdot/schema/staged_transfer.hpp>
#include <swapdot/schema/token_state.hpp>
#include <swapdot/schema/transfer_event.hpp>
#include <swapdot/schema/transfer_session.hpp>
#include <swapdot/schema/user_stats.hpp>
#include <swapdot/storage/rocksdb/storage.hpp>

#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace swapdot::ledger {

/// Token ownership ledger.
///
/// Two transfer protocols share the append-only history rule:
///  - legacy: initiate writes a pending record, finalize applies it and
///    deletes the record in the same transaction.
///  - two-phase: open_session, validate_card_key, stage, then commit or
///    rollback once the physical write to the card is known. Only commit
///    touches the token.
///
/// Every operation is one optimistic transaction. Checks run before writes;
/// the writes that accompany a failure are expiry flips and audit entries.
class ledger final {
 public:
  ledger(swapdot::schema::encoding::scale_encoder_t& encoder,
         const swapdot::storage::rocksdb_storage_t& storage,
         const swapdot::common::service_options& options,
         swapdot::common::time_source_t clock);

  /// First registration makes caller the owner. An existing token is only
  /// re-keyed, by its owner, with force_overwrite.
  swapdot::schema::operation_result<swapdot::schema::token_state_t>
  register_token(const swapdot::schema::token_id_t& token_id,
                 const swapdot::schema::user_id_t& caller,
                 const swapdot::schema::hash32_t& key_hash,
                 const std::optional<std::string>& tag_uid,
                 bool force_overwrite);

  swapdot::schema::operation_result<swapdot::schema::pending_transfer_t>
  initiate(const swapdot::schema::token_id_t& token_id,
           const swapdot::schema::user_id_t& caller);

  /// Binds the receiver to caller when the pending record is unbound.
  swapdot::schema::operation_result<swapdot::schema::token_state_t> finalize(
      const swapdot::schema::token_id_t& token_id,
      const swapdot::schema::user_id_t& caller,
      const std::optional<std::string>& tag_uid);

  swapdot::schema::operation_result<swapdot::schema::transfer_session_t>
  open_session(const swapdot::schema::token_id_t& token_id,
               const swapdot::schema::user_id_t& caller,
               const std::optional<swapdot::schema::user_id_t>& to_uid,
               std::optional<swapdot::schema::duration_milliseconds_t> ttl_ms);

  /// card_bytes holds at least the 32 byte key read from the card. Returns
  /// the HMAC proof binding that key to the session challenge.
  swapdot::schema::operation_result<swapdot::schema::hash32_t>
  validate_card_key(const std::string& session_id,
                    const swapdot::schema::bytes_view_t& card_bytes);

  swapdot::schema::operation_result<swapdot::schema::staged_transfer_t> stage(
      const std::string& session_id,
      const swapdot::schema::user_id_t& caller,
      const swapdot::schema::hash32_t& new_key_hash,
      const std::optional<swapdot::schema::user_id_t>& to_uid);

  swapdot::schema::operation_result<swapdot::schema::token_state_t> commit(
      const std::string& staged_id,
      const swapdot::schema::user_id_t& caller);

  swapdot::schema::operation_result<swapdot::schema::staged_transfer_t>
  rollback(const std::string& staged_id,
           const swapdot::schema::user_id_t& caller,
           const std::optional<std::string>& reason);

  /// Open pending records past expiry become expired and release the token.
  std::size_t sweep_expired_pending(std::size_t batch);

  /// Expire pending transfer sessions and staged transfers. A staged
  /// transfer's session goes back to pending.
  std::size_t sweep_expired_two_phase(std::size_t batch);

  /// Repair the token from a committed pending record, then delete the
  /// record. Safe to repeat.
  swapdot::schema::operation_status_t reconcile_committed(
      const swapdot::schema::token_id_t& token_id);

  std::size_t reconcile_all_committed(std::size_t batch);

  swapdot::schema::operation_result<swapdot::schema::token_state_t> token(
      const swapdot::schema::token_id_t& token_id) const;

  /// Transfer events of a token in sequence order.
  std::vector<swapdot::schema::transfer_event_t> events(
      const swapdot::schema::token_id_t& token_id) const;

  std::vector<swapdot::schema::audit_record_t> audit_log() const;

  swapdot::schema::operation_result<swapdot::schema::user_stats_t> user_stats(
      const swapdot::schema::user_id_t& user_id) const;

  swapdot::schema::operation_result<swapdot::schema::pending_transfer_t>
  pending(const swapdot::schema::token_id_t& token_id) const;

  swapdot::schema::operation_result<swapdot::schema::transfer_session_t>
  transfer_session(const std::string& session_id) const;

  swapdot::schema::operation_result<swapdot::schema::staged_transfer_t>
  staged_transfer(const std::string& staged_id) const;

 private:
  void append_event(swapdot::storage::rocksdb_transaction_t& txn,
                    swapdot::schema::token_state_t& token,
                    const swapdot::schema::user_id_t& from_owner,
                    swapdot::schema::transfer_protocol_t protocol);

  void append_audit(swapdot::storage::rocksdb_transaction_t& txn,
                    swapdot::schema::audit_record_t record);

  void update_stats(
      swapdot::storage::rocksdb_transaction_t& txn,
      const swapdot::schema::user_id_t& user_id,
      const std::function<void(swapdot::schema::user_stats_t&)>& change);

  /// Apply a committed pending record to token and delete it. token is
  /// written back by the caller.
  void heal_committed(swapdot::storage::rocksdb_transaction_t& txn,
                      swapdot::schema::token_state_t& token,
                      const swapdot::schema::pending_transfer_t& pending);

  /// Mark an expired pending session expired and drop the active pointer.
  void expire_session(swapdot::storage::rocksdb_transaction_t& txn,
                      swapdot::schema::transfer_session_t& session);

  /// Cancel the token's active two-phase session, and its staged transfer if
  /// one exists. Used when a legacy transfer supersedes it.
  void cancel_transfer_session(swapdot::storage::rocksdb_transaction_t& txn,
                               const swapdot::schema::token_id_t& token_id,
                               std::string_view reason);

  /// Cancel an open legacy pending record superseded by a two-phase commit.
  void cancel_pending(swapdot::storage::rocksdb_transaction_t& txn,
                      const swapdot::schema::token_id_t& token_id,
                      std::string_view reason);

  /// Expire a staged transfer and hand its session back as pending.
  void expire_staged(swapdot::storage::rocksdb_transaction_t& txn,
                     swapdot::schema::staged_transfer_t& staged);

  swapdot::schema::encoding::scale_encoder_t& encoder_;
  const swapdot::storage::rocksdb_storage_t& storage_;
  const swapdot::common::service_options& options_;
  swapdot::common::time_source_t clock_;
};

}  // namespace swapdot::ledger
