#pragma once

#include <swapdot/auth/engine.hpp>
#include <swapdot/auth/key_provider.hpp>
#include <swapdot/common/options.hpp>
#include <swapdot/common/time_source.hpp>
#include <swapdot/ledger/ledger.hpp>
#include <swapdot/schema/encoding/scale/encoder.hpp>
#include <swapdot/session/session_store.hpp>
#include <swapdot/storage/rocksdb/storage.hpp>

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace swapdot::service {

struct janitor_report final {
  std::size_t auth_sessions{};
  std::size_t pending_transfers{};
  std::size_t two_phase{};
  std::size_t reconciled{};
};

using janitor_report_t = janitor_report;

/// Core-facing surface. Owns the database handle and wires the session
/// store, key provider, authentication engine and ledger over it.
class service final {
 public:
  service(swapdot::common::service_options options,
          swapdot::storage::rocksdb_storage_t storage,
          swapdot::common::time_source_t clock =
              swapdot::common::system_time_source(),
          std::unique_ptr<swapdot::auth::key_provider> keys = nullptr);

  service(const service&) = delete;
  service& operator=(const service&) = delete;

  swapdot::schema::operation_result<swapdot::auth::begin_output>
  begin_authenticate(const swapdot::schema::token_id_t& token_id,
                     const swapdot::schema::user_id_t& user_id,
                     bool allow_unowned);

  swapdot::schema::operation_result<swapdot::auth::continue_output>
  continue_authenticate(const std::string& session_id,
                        const swapdot::schema::bytes_view_t& card_response);

  swapdot::schema::operation_result<swapdot::auth::change_key_output>
  change_key(const std::string& session_id, std::optional<uint8_t> key_version);

  swapdot::schema::operation_status_t confirm_change_key(
      const std::string& session_id,
      const swapdot::schema::bytes_view_t& card_response);

  swapdot::schema::operation_result<swapdot::auth::write_transfer_output>
  write_transfer_data(const std::string& session_id,
                      const std::string& transfer_session_id);

  swapdot::schema::operation_result<swapdot::schema::bytes_t> read_file_data(
      const std::string& session_id,
      uint8_t file_no,
      uint32_t offset,
      std::optional<uint32_t> length);

  swapdot::schema::operation_result<swapdot::schema::token_state_t>
  register_token(const swapdot::schema::token_id_t& token_id,
                 const swapdot::schema::user_id_t& caller,
                 const swapdot::schema::hash32_t& key_hash,
                 const std::optional<std::string>& tag_uid,
                 bool force_overwrite);

  swapdot::schema::operation_result<swapdot::schema::pending_transfer_t>
  initiate_transfer(const swapdot::schema::token_id_t& token_id,
                    const swapdot::schema::user_id_t& caller);

  swapdot::schema::operation_result<swapdot::schema::token_state_t>
  finalize_transfer(const swapdot::schema::token_id_t& token_id,
                    const swapdot::schema::user_id_t& caller,
                    const std::optional<std::string>& tag_uid);

  swapdot::schema::operation_result<swapdot::schema::transfer_session_t>
  open_transfer_session(
      const swapdot::schema::token_id_t& token_id,
      const swapdot::schema::user_id_t& caller,
      const std::optional<swapdot::schema::user_id_t>& to_uid,
      std::optional<swapdot::schema::duration_milliseconds_t> ttl_ms);

  swapdot::schema::operation_result<swapdot::schema::hash32_t>
  validate_card_key(const std::string& transfer_session_id,
                    const swapdot::schema::bytes_view_t& card_bytes);

  swapdot::schema::operation_result<swapdot::schema::staged_transfer_t>
  stage_transfer(const std::string& transfer_session_id,
                 const swapdot::schema::user_id_t& caller,
                 const swapdot::schema::hash32_t& new_key_hash,
                 const std::optional<swapdot::schema::user_id_t>& to_uid);

  swapdot::schema::operation_result<swapdot::schema::token_state_t>
  commit_transfer(const std::string& staged_id,
                  const swapdot::schema::user_id_t& caller);

  swapdot::schema::operation_result<swapdot::schema::staged_transfer_t>
  rollback_transfer(const std::string& staged_id,
                    const swapdot::schema::user_id_t& caller,
                    const std::optional<std::string>& reason);

  swapdot::schema::operation_status_t reconcile_committed(
      const swapdot::schema::token_id_t& token_id);

  swapdot::schema::operation_result<swapdot::schema::token_state_t> get_token(
      const swapdot::schema::token_id_t& token_id) const;

  std::vector<swapdot::schema::transfer_event_t> token_events(
      const swapdot::schema::token_id_t& token_id) const;

  std::vector<swapdot::schema::audit_record_t> audit_log() const;

  swapdot::schema::operation_result<swapdot::schema::user_stats_t> user_stats(
      const swapdot::schema::user_id_t& user_id) const;

  /// One janitor pass over every expiring record class, each bounded by
  /// options.sweep_batch.
  janitor_report_t run_janitor();

  const swapdot::common::service_options& options() const { return options_; }

 private:
  swapdot::common::service_options options_;
  swapdot::schema::encoding::scale_encoder_t encoder_;
  swapdot::storage::rocksdb_storage_t storage_;
  swapdot::common::time_source_t clock_;
  std::unique_ptr<swapdot::auth::key_provider> keys_;
  swapdot::session::session_store sessions_;
  swapdot::auth::engine auth_;
  swapdot::ledger::ledger ledger_;
};

}  // namespace swapdot::service
