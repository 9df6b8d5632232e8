#include <swapdot/auth/engine.hpp>
#include <swapdot/crypto/digest.hpp>
#include <swapdot/messaging/response.hpp>
#include <swapdot/schema/key/ledger_keys.hpp>
#include <swapdot/storage/transact.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <array>
#include <utility>

using namespace swapdot::schema;

namespace swapdot::auth {

namespace {

inline constexpr auto kCodespace = std::string_view{"swapdot.auth"};
inline constexpr auto kStatusMoreFrames = uint8_t{0xAF};
inline constexpr auto kStatusOk = uint8_t{0x00};

/// Card data from an authentication response: the bare 8 bytes, or the 8
/// bytes followed by 91 <expected_sw2>.
std::optional<bytes_t> extract_card_data(const bytes_view_t& response,
                                         const uint8_t expected_sw2) {
  if (response.size() == crypto::kDesBlockSize) {
    return make_bytes(response);
  }
  if (response.size() == crypto::kDesBlockSize + 2 &&
      response[crypto::kDesBlockSize] == 0x91 &&
      response[crypto::kDesBlockSize + 1] == expected_sw2) {
    return make_bytes(response.first(crypto::kDesBlockSize));
  }
  return std::nullopt;
}

bytes_t rotate_left(const bytes_view_t& bytes) {
  auto rotated = make_bytes(bytes);
  if (!rotated.empty()) {
    std::rotate(std::begin(rotated), std::begin(rotated) + 1,
                std::end(rotated));
  }
  return rotated;
}

error_code_t to_error_code(const crypto::codec_error_t error) {
  switch (error) {
    case crypto::codec_error_t::weak_key:
      return error_code_t::weak_key;
    case crypto::codec_error_t::parameter_out_of_range:
      return error_code_t::invalid_argument;
    case crypto::codec_error_t::not_implemented:
      return error_code_t::not_implemented;
    default:
      return error_code_t::internal;
  }
}

}  // namespace

engine::engine(encoding::scale_encoder_t& encoder,
               const swapdot::storage::rocksdb_storage_t& storage,
               swapdot::session::session_store& sessions,
               const key_provider& keys,
               const swapdot::common::service_options& options,
               swapdot::common::time_source_t clock)
    : encoder_{encoder},
      storage_{storage},
      sessions_{sessions},
      keys_{keys},
      options_{options},
      clock_{std::move(clock)} {}

operation_result<begin_output> engine::begin(const token_id_t& token_id,
                                             const user_id_t& user_id,
                                             const bool allow_unowned) {
  if (token_id.empty() || user_id.empty()) {
    return make_failure<begin_output>(error_code_t::invalid_argument,
                                      kCodespace,
                                      "token_id and user_id are required");
  }

  return swapdot::storage::transact<begin_output>(
      storage_, options_.transaction_attempts, kCodespace,
      [&](swapdot::storage::rocksdb_transaction_t& txn)
          -> operation_result<begin_output> {
        auto now = clock_();
        auto session = auth_session_t{};
        session.session_id = crypto::random_hex_id(16);
        session.token_id = token_id;
        session.user_id = user_id;
        session.phase = auth_phase_t::init;
        session.key_no = options_.auth_key_no;
        session.created_at = now;
        session.expires_at = now + options_.auth_session_ttl_ms;

        auto token_key = key::make_token_key(encoder_, token_id);
        auto token = txn.get_for_update<token_state_t>(encoder_, token_key);
        if (token) {
          if (token->current_owner != user_id) {
            return make_failure<begin_output>(
                error_code_t::permission_denied, kCodespace,
                "only the current owner may authenticate this token");
          }
          if (token->lease && token->lease->expires_at > now) {
            return make_failure<begin_output>(
                error_code_t::conflict, kCodespace,
                "token is locked by another authentication");
          }
          session.lease_id = crypto::random_hex_id(8);
          session.key_version = token->key_version;
          token->lease =
              token_lease_t{.lease_id = session.lease_id,
                            .session_id = session.session_id,
                            .expires_at = now + options_.token_lease_ttl_ms};
          txn.put(encoder_, token_key, *token);
        } else if (!allow_unowned) {
          return make_failure<begin_output>(error_code_t::not_found,
                                            kCodespace, "token not found");
        }

        sessions_.create(txn, session);
        spdlog::debug("Auth session {} started for token {}",
                      session.session_id, token_id);
        return make_success(begin_output{
            .session_id = session.session_id,
            .apdu = messaging::build_authenticate_frame(session.key_no),
            .expires_at = session.expires_at});
      });
}

operation_result<continue_output> engine::continue_authenticate(
    const std::string& session_id,
    const bytes_view_t& card_response) {
  return swapdot::storage::transact<continue_output>(
      storage_, options_.transaction_attempts, kCodespace,
      [&](swapdot::storage::rocksdb_transaction_t& txn)
          -> operation_result<continue_output> {
        auto loaded = sessions_.load(txn, session_id);
        if (!loaded.ok()) {
          return {.status = std::move(loaded.status), .value = {}};
        }
        auto session = std::move(loaded.value);

        auto fail = [&](const error_code_t code, const std::string_view log) {
          sessions_.destroy(txn, session.session_id);
          release_lease(txn, session);
          spdlog::warn("Auth session {} aborted: {}", session.session_id, log);
          return make_failure<continue_output>(code, kCodespace, log);
        };

        if (session.phase == auth_phase_t::authenticated) {
          return make_failure<continue_output>(
              error_code_t::protocol_error, kCodespace,
              "session is already authenticated");
        }

        auto key = card_key(session);
        if (!key) {
          return fail(error_code_t::internal, "card key has invalid length");
        }

        if (session.phase == auth_phase_t::init) {
          auto encrypted_rnd_b =
              extract_card_data(card_response, kStatusMoreFrames);
          if (!encrypted_rnd_b) {
            return fail(error_code_t::protocol_error,
                         "expected 8 byte challenge with status 91 AF");
          }
          auto zero_iv = std::array<uint8_t, crypto::kDesBlockSize>{};
          auto rnd_b = crypto::decrypt_cbc(*key, zero_iv, *encrypted_rnd_b);
          if (auto* error = std::get_if<crypto::codec_error_t>(&rnd_b)) {
            return fail(to_error_code(*error), crypto::to_string(*error));
          }

          session.rnd_a = crypto::random_bytes(crypto::kDesBlockSize);
          session.rnd_b = std::get<bytes_t>(std::move(rnd_b));
          auto answer = crypto::encrypt_cbc(
              *key, *encrypted_rnd_b,
              concat(session.rnd_a, rotate_left(session.rnd_b)));
          if (auto* error = std::get_if<crypto::codec_error_t>(&answer)) {
            return fail(to_error_code(*error), crypto::to_string(*error));
          }
          const auto& ciphertext = std::get<bytes_t>(answer);
          session.chained_iv = bytes_t(
              std::end(ciphertext) -
                  static_cast<std::ptrdiff_t>(crypto::kDesBlockSize),
              std::end(ciphertext));
          session.phase = auth_phase_t::challenge_sent;
          sessions_.update(txn, session);
          return make_success(continue_output{
              .authenticated = false,
              .apdu = messaging::build_additional_frame(ciphertext)});
        }

        auto encrypted_rnd_a = extract_card_data(card_response, kStatusOk);
        if (!encrypted_rnd_a) {
          return fail(error_code_t::protocol_error,
                       "expected 8 byte answer with status 91 00");
        }
        auto rotated_rnd_a =
            crypto::decrypt_cbc(*key, session.chained_iv, *encrypted_rnd_a);
        if (auto* error = std::get_if<crypto::codec_error_t>(&rotated_rnd_a)) {
          return fail(to_error_code(*error), crypto::to_string(*error));
        }
        if (!crypto::constant_time_equal(std::get<bytes_t>(rotated_rnd_a),
                                         rotate_left(session.rnd_a))) {
          return fail(error_code_t::protocol_error,
                       "card failed RndA verification");
        }

        const auto& a = session.rnd_a;
        const auto& b = session.rnd_b;
        session.session_key =
            concat(bytes_view_t{a}.first(4), bytes_view_t{b}.first(4),
                   bytes_view_t{a}.subspan(4, 4), bytes_view_t{b}.subspan(4, 4));
        session.rnd_a.clear();
        session.rnd_b.clear();
        session.chained_iv.clear();
        session.phase = auth_phase_t::authenticated;
        sessions_.update(txn, session);
        release_lease(txn, session);
        spdlog::info("Auth session {} authenticated token {}",
                     session.session_id, session.token_id);
        return make_success(continue_output{.authenticated = true, .apdu = {}});
      });
}

operation_result<change_key_output> engine::change_key(
    const std::string& session_id,
    const std::optional<uint8_t> new_key_version) {
  return swapdot::storage::transact<change_key_output>(
      storage_, options_.transaction_attempts, kCodespace,
      [&](swapdot::storage::rocksdb_transaction_t& txn)
          -> operation_result<change_key_output> {
        auto loaded = load_authenticated(txn, session_id);
        if (!loaded.ok()) {
          return {.status = std::move(loaded.status), .value = {}};
        }
        auto session = std::move(loaded.value);

        if (!new_key_version && session.key_version == 0xFF) {
          return make_failure<change_key_output>(
              error_code_t::invalid_argument, kCodespace,
              "key version space exhausted");
        }
        auto version =
            new_key_version.value_or(static_cast<uint8_t>(session.key_version + 1));
        auto session_key = crypto::normalize_key(session.session_key);
        if (!session_key) {
          return make_failure<change_key_output>(
              error_code_t::internal, kCodespace, "session key is malformed");
        }

        auto old_key = keys_.card_key(session.token_id, session.key_version);
        auto new_key = keys_.card_key(session.token_id, version);
        auto frames = messaging::build_change_key_frames(
            session.key_no, old_key, new_key, *session_key, version);
        if (auto* error = std::get_if<crypto::codec_error_t>(&frames)) {
          if (*error == crypto::codec_error_t::weak_key) {
            sessions_.destroy(txn, session.session_id);
            release_lease(txn, session);
            spdlog::warn("Auth session {} dropped on weak key",
                         session.session_id);
            return make_failure<change_key_output>(
                error_code_t::weak_key, kCodespace,
                "session key rejected, authenticate again");
          }
          return make_failure<change_key_output>(
              to_error_code(*error), kCodespace, crypto::to_string(*error));
        }

        auto key_hash = crypto::sha256(new_key);
        session.pending_key_version = version;
        session.pending_key_hash = key_hash;
        sessions_.update(txn, session);
        return make_success(
            change_key_output{.apdus = std::get<messaging::frames_t>(
                                  std::move(frames)),
                              .key_hash = key_hash,
                              .key_version = version});
      });
}

operation_status_t engine::confirm_change_key(
    const std::string& session_id,
    const bytes_view_t& card_response) {
  return swapdot::storage::transact_status(
      storage_, options_.transaction_attempts, kCodespace,
      [&](swapdot::storage::rocksdb_transaction_t& txn) -> operation_status_t {
        auto loaded = load_authenticated(txn, session_id);
        if (!loaded.ok()) {
          return std::move(loaded.status);
        }
        auto session = std::move(loaded.value);
        if (!session.pending_key_version) {
          return make_error(error_code_t::invalid_argument, kCodespace,
                            "no key change in progress");
        }

        auto parsed = messaging::parse_response(card_response);
        if (auto* error = std::get_if<messaging::response_error_t>(&parsed)) {
          session.pending_key_version.reset();
          session.pending_key_hash.reset();
          sessions_.update(txn, session);
          return make_error(
              error_code_t::protocol_error, kCodespace,
              fmt::format("card rejected ChangeKey: {}",
                          messaging::to_string(error->error)));
        }
        if (!std::holds_alternative<messaging::response_success_t>(parsed)) {
          return make_error(error_code_t::protocol_error, kCodespace,
                            "ChangeKey expects a final 91 00 response");
        }

        auto token_key = key::make_token_key(encoder_, session.token_id);
        if (auto token = txn.get_for_update<token_state_t>(encoder_, token_key)) {
          token->key_version = *session.pending_key_version;
          txn.put(encoder_, token_key, *token);
        }
        sessions_.destroy(txn, session.session_id);
        spdlog::info("Token {} key rotated to version {}", session.token_id,
                     *session.pending_key_version);
        return operation_status_t{};
      });
}

operation_result<write_transfer_output> engine::write_transfer_data(
    const std::string& session_id,
    const std::string& transfer_session_id) {
  return swapdot::storage::transact<write_transfer_output>(
      storage_, options_.transaction_attempts, kCodespace,
      [&](swapdot::storage::rocksdb_transaction_t& txn)
          -> operation_result<write_transfer_output> {
        auto loaded = load_authenticated(txn, session_id);
        if (!loaded.ok()) {
          return {.status = std::move(loaded.status), .value = {}};
        }
        auto session = std::move(loaded.value);

        auto transfer_key =
            key::make_transfer_session_key(encoder_, transfer_session_id);
        auto transfer =
            txn.get_for_update<transfer_session_t>(encoder_, transfer_key);
        if (!transfer) {
          return make_failure<write_transfer_output>(
              error_code_t::not_found, kCodespace, "transfer session not found");
        }
        if (transfer->token_id != session.token_id) {
          return make_failure<write_transfer_output>(
              error_code_t::invalid_argument, kCodespace,
              "transfer session belongs to another token");
        }
        if (transfer->from_uid != session.user_id) {
          return make_failure<write_transfer_output>(
              error_code_t::permission_denied, kCodespace,
              "only the sender may write transfer data");
        }
        if (transfer->status != transfer_session_status_t::pending) {
          return make_failure<write_transfer_output>(
              error_code_t::conflict, kCodespace,
              "transfer session is not pending");
        }
        if (transfer->expires_at <= clock_()) {
          return make_failure<write_transfer_output>(
              error_code_t::expired, kCodespace, "transfer session expired");
        }

        auto session_key = crypto::normalize_key(session.session_key);
        if (!session_key) {
          return make_failure<write_transfer_output>(
              error_code_t::internal, kCodespace, "session key is malformed");
        }
        auto secret = crypto::random_bytes(32);
        auto frames = messaging::build_write_frames(
            options_.transfer_file_no, 0, secret, *session_key,
            options_.transfer_write_mode);
        if (auto* error = std::get_if<crypto::codec_error_t>(&frames)) {
          if (*error == crypto::codec_error_t::weak_key) {
            sessions_.destroy(txn, session.session_id);
            release_lease(txn, session);
          }
          return make_failure<write_transfer_output>(
              to_error_code(*error), kCodespace, crypto::to_string(*error));
        }

        auto key_hash = crypto::sha256(secret);
        transfer->pending_key_hash = key_hash;
        txn.put(encoder_, transfer_key, *transfer);
        return make_success(write_transfer_output{
            .apdus = std::get<messaging::frames_t>(std::move(frames)),
            .key_hash = key_hash});
      });
}

operation_result<bytes_t> engine::read_file_data(
    const std::string& session_id,
    const uint8_t file_no,
    const uint32_t offset,
    const std::optional<uint32_t> length) {
  return swapdot::storage::transact<bytes_t>(
      storage_, options_.transaction_attempts, kCodespace,
      [&](swapdot::storage::rocksdb_transaction_t& txn)
          -> operation_result<bytes_t> {
        auto loaded = load_authenticated(txn, session_id);
        if (!loaded.ok()) {
          return {.status = std::move(loaded.status), .value = {}};
        }
        auto frame = messaging::build_read_frame(
            file_no, offset, length.value_or(options_.default_read_length));
        if (auto* error = std::get_if<crypto::codec_error_t>(&frame)) {
          return make_failure<bytes_t>(to_error_code(*error), kCodespace,
                                       crypto::to_string(*error));
        }
        return make_success(std::get<bytes_t>(std::move(frame)));
      });
}

operation_result<auth_session_t> engine::load_authenticated(
    swapdot::storage::rocksdb_transaction_t& txn,
    const std::string& session_id) {
  auto loaded = sessions_.load(txn, session_id);
  if (!loaded.ok()) {
    return loaded;
  }
  if (loaded.value.phase != auth_phase_t::authenticated ||
      loaded.value.session_key.empty()) {
    return make_failure<auth_session_t>(error_code_t::protocol_error,
                                        kCodespace,
                                        "session is not authenticated");
  }
  return loaded;
}

std::optional<crypto::des_key_t> engine::card_key(
    const auth_session_t& session) const {
  return crypto::normalize_key(
      keys_.card_key(session.token_id, session.key_version));
}

void engine::release_lease(swapdot::storage::rocksdb_transaction_t& txn,
                           const auth_session_t& session) {
  if (session.lease_id.empty()) {
    return;
  }
  auto token_key = key::make_token_key(encoder_, session.token_id);
  auto token = txn.get_for_update<token_state_t>(encoder_, token_key);
  if (token && token->lease && token->lease->session_id == session.session_id) {
    token->lease.reset();
    txn.put(encoder_, token_key, *token);
  }
}

}  // namespace swapdot::auth
