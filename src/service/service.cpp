#include <swapdot/service/service.hpp>

#include <spdlog/spdlog.h>

#include <utility>

using namespace swapdot::schema;

namespace swapdot::service {

namespace {

std::unique_ptr<swapdot::auth::key_provider> make_key_provider(
    std::unique_ptr<swapdot::auth::key_provider> keys,
    const swapdot::common::service_options& options) {
  if (keys) {
    return keys;
  }
  return std::make_unique<swapdot::auth::master_key_provider>(
      options.master_key, options.diversify_keys);
}

}  // namespace

service::service(swapdot::common::service_options options,
                 swapdot::storage::rocksdb_storage_t storage,
                 swapdot::common::time_source_t clock,
                 std::unique_ptr<swapdot::auth::key_provider> keys)
    : options_{std::move(options)},
      encoder_{},
      storage_{std::move(storage)},
      clock_{std::move(clock)},
      keys_{make_key_provider(std::move(keys), options_)},
      sessions_{encoder_, storage_, clock_, options_.transaction_attempts},
      auth_{encoder_, storage_, sessions_, *keys_, options_, clock_},
      ledger_{encoder_, storage_, options_, clock_} {}

operation_result<swapdot::auth::begin_output> service::begin_authenticate(
    const token_id_t& token_id,
    const user_id_t& user_id,
    const bool allow_unowned) {
  return auth_.begin(token_id, user_id, allow_unowned);
}

operation_result<swapdot::auth::continue_output> service::continue_authenticate(
    const std::string& session_id,
    const bytes_view_t& card_response) {
  return auth_.continue_authenticate(session_id, card_response);
}

operation_result<swapdot::auth::change_key_output> service::change_key(
    const std::string& session_id,
    const std::optional<uint8_t> key_version) {
  return auth_.change_key(session_id, key_version);
}

operation_status_t service::confirm_change_key(
    const std::string& session_id,
    const bytes_view_t& card_response) {
  return auth_.confirm_change_key(session_id, card_response);
}

operation_result<swapdot::auth::write_transfer_output>
service::write_transfer_data(const std::string& session_id,
                             const std::string& transfer_session_id) {
  return auth_.write_transfer_data(session_id, transfer_session_id);
}

operation_result<bytes_t> service::read_file_data(
    const std::string& session_id,
    const uint8_t file_no,
    const uint32_t offset,
    const std::optional<uint32_t> length) {
  return auth_.read_file_data(session_id, file_no, offset, length);
}

operation_result<token_state_t> service::register_token(
    const token_id_t& token_id,
    const user_id_t& caller,
    const hash32_t& key_hash,
    const std::optional<std::string>& tag_uid,
    const bool force_overwrite) {
  return ledger_.register_token(token_id, caller, key_hash, tag_uid,
                                force_overwrite);
}

operation_result<pending_transfer_t> service::initiate_transfer(
    const token_id_t& token_id,
    const user_id_t& caller) {
  return ledger_.initiate(token_id, caller);
}

operation_result<token_state_t> service::finalize_transfer(
    const token_id_t& token_id,
    const user_id_t& caller,
    const std::optional<std::string>& tag_uid) {
  return ledger_.finalize(token_id, caller, tag_uid);
}

operation_result<transfer_session_t> service::open_transfer_session(
    const token_id_t& token_id,
    const user_id_t& caller,
    const std::optional<user_id_t>& to_uid,
    const std::optional<duration_milliseconds_t> ttl_ms) {
  return ledger_.open_session(token_id, caller, to_uid, ttl_ms);
}

operation_result<hash32_t> service::validate_card_key(
    const std::string& transfer_session_id,
    const bytes_view_t& card_bytes) {
  return ledger_.validate_card_key(transfer_session_id, card_bytes);
}

operation_result<staged_transfer_t> service::stage_transfer(
    const std::string& transfer_session_id,
    const user_id_t& caller,
    const hash32_t& new_key_hash,
    const std::optional<user_id_t>& to_uid) {
  return ledger_.stage(transfer_session_id, caller, new_key_hash, to_uid);
}

operation_result<token_state_t> service::commit_transfer(
    const std::string& staged_id,
    const user_id_t& caller) {
  return ledger_.commit(staged_id, caller);
}

operation_result<staged_transfer_t> service::rollback_transfer(
    const std::string& staged_id,
    const user_id_t& caller,
    const std::optional<std::string>& reason) {
  return ledger_.rollback(staged_id, caller, reason);
}

operation_status_t service::reconcile_committed(const token_id_t& token_id) {
  return ledger_.reconcile_committed(token_id);
}

operation_result<token_state_t> service::get_token(
    const token_id_t& token_id) const {
  return ledger_.token(token_id);
}

std::vector<transfer_event_t> service::token_events(
    const token_id_t& token_id) const {
  return ledger_.events(token_id);
}

std::vector<audit_record_t> service::audit_log() const {
  return ledger_.audit_log();
}

operation_result<user_stats_t> service::user_stats(
    const user_id_t& user_id) const {
  return ledger_.user_stats(user_id);
}

janitor_report_t service::run_janitor() {
  auto report = janitor_report_t{};
  report.auth_sessions = sessions_.sweep_expired(options_.sweep_batch);
  report.pending_transfers = ledger_.sweep_expired_pending(options_.sweep_batch);
  report.two_phase = ledger_.sweep_expired_two_phase(options_.sweep_batch);
  report.reconciled = ledger_.reconcile_all_committed(options_.sweep_batch);
  spdlog::debug(
      "Janitor pass: auth_sessions={} pending={} two_phase={} reconciled={}",
      report.auth_sessions, report.pending_transfers, report.two_phase,
      report.reconciled);
  return report;
}

}  // namespace swapdot::service
