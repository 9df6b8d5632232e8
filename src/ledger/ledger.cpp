#include <swapdot/blake3/hash.hpp>
#include <swapdot/crypto/digest.hpp>
#include <swapdot/ledger/history.hpp>
#include <swapdot/ledger/ledger.hpp>
#include <swapdot/schema/key/ledger_keys.hpp>
#include <swapdot/storage/transact.hpp>

#include <boost/endian/buffers.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <utility>

using namespace swapdot::schema;
using swapdot::storage::rocksdb_transaction_t;

namespace swapdot::ledger {

namespace {

inline constexpr auto kCodespace = std::string_view{"swapdot.ledger"};
inline constexpr auto kProofLabel = std::string_view{"SwapDotz/transfer/v1"};
inline constexpr auto kDefaultRollbackReason =
    std::string_view{"NFC write failed"};
inline constexpr auto kChallengeSize = std::size_t{16};
inline constexpr auto kCardKeySize = std::size_t{32};

bytes_t length_prefixed(const bytes_view_t& bytes) {
  auto length = boost::endian::big_uint32_buf_t{
      static_cast<uint32_t>(bytes.size())};
  auto out = bytes_t{length.data(), length.data() + sizeof(length)};
  out.insert(std::end(out), std::begin(bytes), std::end(bytes));
  return out;
}

bool matches_snapshot(const token_state_t& token,
                      const token_snapshot_t& snapshot) {
  return token.current_owner == snapshot.owner &&
         token.previous_owners == snapshot.previous_owners &&
         token.key_hash == snapshot.key_hash;
}

bool is_active(const transfer_session_status_t status) {
  return status == transfer_session_status_t::pending ||
         status == transfer_session_status_t::staged;
}

template <typename T>
std::vector<T> decode_all(encoding::scale_encoder_t& encoder,
                          const std::vector<storage::key_value_entry_t>& rows) {
  auto records = std::vector<T>{};
  records.reserve(rows.size());
  for (const auto& row : rows) {
    if (auto record = encoder.try_decode<T>(row.second)) {
      records.push_back(std::move(*record));
    } else {
      spdlog::warn("Skipping undecodable ledger row");
    }
  }
  return records;
}

}  // namespace

ledger::ledger(encoding::scale_encoder_t& encoder,
               const swapdot::storage::rocksdb_storage_t& storage,
               const swapdot::common::service_options& options,
               swapdot::common::time_source_t clock)
    : encoder_{encoder},
      storage_{storage},
      options_{options},
      clock_{std::move(clock)} {}

operation_result<token_state_t> ledger::register_token(
    const token_id_t& token_id,
    const user_id_t& caller,
    const hash32_t& key_hash,
    const std::optional<std::string>& tag_uid,
    const bool force_overwrite) {
  if (token_id.empty() || caller.empty()) {
    return make_failure<token_state_t>(error_code_t::invalid_argument,
                                       kCodespace,
                                       "token_id and caller are required");
  }
  return swapdot::storage::transact<token_state_t>(
      storage_, options_.transaction_attempts, kCodespace,
      [&](rocksdb_transaction_t& txn) -> operation_result<token_state_t> {
        auto now = clock_();
        auto token_key = key::make_token_key(encoder_, token_id);
        auto existing = txn.get_for_update<token_state_t>(encoder_, token_key);
        if (existing) {
          if (!force_overwrite) {
            return make_failure<token_state_t>(error_code_t::already_exists,
                                               kCodespace,
                                               "token already registered");
          }
          if (existing->current_owner != caller) {
            return make_failure<token_state_t>(
                error_code_t::permission_denied, kCodespace,
                "only the current owner may overwrite a registration");
          }
          existing->key_hash = key_hash;
          if (tag_uid) {
            existing->tag_uid = tag_uid;
          }
          txn.put(encoder_, token_key, *existing);
          spdlog::info("Token {} re-keyed by owner", token_id);
          return make_success(std::move(*existing));
        }

        auto token = token_state_t{};
        token.token_id = token_id;
        token.current_owner = caller;
        token.key_hash = key_hash;
        token.tag_uid = tag_uid;
        token.created_at = now;
        append_event(txn, token, user_id_t{},
                     transfer_protocol_t::registration);
        txn.put(encoder_, token_key, token);
        update_stats(txn, caller, [](user_stats_t& stats) {
          ++stats.tokens_owned;
        });
        spdlog::info("Token {} registered", token_id);
        return make_success(std::move(token));
      });
}

operation_result<pending_transfer_t> ledger::initiate(
    const token_id_t& token_id,
    const user_id_t& caller) {
  return swapdot::storage::transact<pending_transfer_t>(
      storage_, options_.transaction_attempts, kCodespace,
      [&](rocksdb_transaction_t& txn) -> operation_result<pending_transfer_t> {
        auto now = clock_();
        auto token_key = key::make_token_key(encoder_, token_id);
        auto token = txn.get_for_update<token_state_t>(encoder_, token_key);
        if (!token) {
          return make_failure<pending_transfer_t>(
              error_code_t::not_found, kCodespace, "token not found");
        }

        auto pending_key = key::make_pending_transfer_key(encoder_, token_id);
        auto existing =
            txn.get_for_update<pending_transfer_t>(encoder_, pending_key);
        if (existing && existing->status == pending_transfer_status_t::committed) {
          heal_committed(txn, *token, *existing);
          txn.put(encoder_, token_key, *token);
          existing.reset();
        }

        if (token->current_owner != caller) {
          return make_failure<pending_transfer_t>(
              error_code_t::permission_denied, kCodespace,
              "only the current owner may initiate a transfer");
        }
        if (existing && existing->status == pending_transfer_status_t::open &&
            existing->expires_at > now && existing->from_uid != caller) {
          return make_failure<pending_transfer_t>(
              error_code_t::conflict, kCodespace,
              "another transfer is already pending for this token");
        }

        auto pending = pending_transfer_t{};
        pending.token_id = token_id;
        pending.from_uid = caller;
        pending.n_next = token->counter + 1;
        pending.status = pending_transfer_status_t::open;
        pending.created_at = now;
        pending.expires_at = now + options_.pending_ttl_ms;
        txn.put(encoder_, pending_key, pending);
        cancel_transfer_session(txn, token_id,
                                "superseded by legacy transfer initiation");

        token->status = token_status_t::pending;
        txn.put(encoder_, token_key, *token);
        spdlog::info("Transfer of token {} initiated, n_next={}", token_id,
                     pending.n_next);
        return make_success(std::move(pending));
      });
}

operation_result<token_state_t> ledger::finalize(
    const token_id_t& token_id,
    const user_id_t& caller,
    const std::optional<std::string>& tag_uid) {
  return swapdot::storage::transact<token_state_t>(
      storage_, options_.transaction_attempts, kCodespace,
      [&](rocksdb_transaction_t& txn) -> operation_result<token_state_t> {
        auto now = clock_();
        auto token_key = key::make_token_key(encoder_, token_id);
        auto token = txn.get_for_update<token_state_t>(encoder_, token_key);
        if (!token) {
          return make_failure<token_state_t>(error_code_t::not_found,
                                             kCodespace, "token not found");
        }
        auto pending_key = key::make_pending_transfer_key(encoder_, token_id);
        auto pending =
            txn.get_for_update<pending_transfer_t>(encoder_, pending_key);
        if (!pending) {
          return make_failure<token_state_t>(error_code_t::not_found,
                                             kCodespace,
                                             "no pending transfer");
        }

        switch (pending->status) {
          case pending_transfer_status_t::committed:
            heal_committed(txn, *token, *pending);
            txn.put(encoder_, token_key, *token);
            return make_success(std::move(*token));
          case pending_transfer_status_t::canceled:
            return make_failure<token_state_t>(error_code_t::conflict,
                                               kCodespace,
                                               "pending transfer canceled");
          case pending_transfer_status_t::expired:
          case pending_transfer_status_t::open:
            break;
        }
        if (pending->status == pending_transfer_status_t::expired ||
            pending->expires_at <= now) {
          pending->status = pending_transfer_status_t::expired;
          txn.put(encoder_, pending_key, *pending);
          token->status = token_status_t::ok;
          txn.put(encoder_, token_key, *token);
          return make_failure<token_state_t>(error_code_t::expired, kCodespace,
                                             "pending transfer expired");
        }

        if (pending->from_uid != token->current_owner) {
          spdlog::warn("Token {} changed owner while a transfer was pending",
                       token_id);
          return make_failure<token_state_t>(
              error_code_t::conflict, kCodespace,
              "token owner changed since the transfer was initiated");
        }
        if (tag_uid && token->tag_uid && *tag_uid != *token->tag_uid) {
          spdlog::warn("Tag uid mismatch finalizing token {}", token_id);
          return make_failure<token_state_t>(error_code_t::permission_denied,
                                             kCodespace,
                                             "physical tag does not match");
        }
        auto to_uid = pending->to_uid.value_or(caller);
        if (to_uid != caller) {
          return make_failure<token_state_t>(
              error_code_t::permission_denied, kCodespace,
              "transfer is bound to another receiver");
        }
        if (to_uid == token->current_owner) {
          return make_failure<token_state_t>(
              error_code_t::invalid_argument, kCodespace,
              "owner cannot transfer a token to themselves");
        }

        auto proposed =
            propose_history(token->previous_owners, token->current_owner);
        if (!validate_append_only(token->previous_owners, proposed, to_uid)) {
          return make_failure<token_state_t>(
              error_code_t::permission_denied, kCodespace,
              "ownership history must be append-only");
        }

        auto from_owner = token->current_owner;
        token->current_owner = to_uid;
        token->previous_owners = std::move(proposed);
        token->counter = pending->n_next;
        token->status = token_status_t::ok;
        token->last_transfer_at = now;
        append_event(txn, *token, from_owner, transfer_protocol_t::legacy);
        txn.put(encoder_, token_key, *token);
        txn.erase(pending_key);
        cancel_transfer_session(txn, token_id,
                                "superseded by legacy transfer completion");

        update_stats(txn, from_owner, [now](user_stats_t& stats) {
          stats.tokens_owned = stats.tokens_owned > 0 ? stats.tokens_owned - 1 : 0;
          ++stats.tokens_transferred_out;
          stats.last_active_at = now;
        });
        update_stats(txn, to_uid, [now](user_stats_t& stats) {
          ++stats.tokens_owned;
          ++stats.tokens_received;
          stats.last_active_at = now;
        });
        spdlog::info("Token {} transferred, counter={}", token_id,
                     token->counter);
        return make_success(std::move(*token));
      });
}

operation_result<transfer_session_t> ledger::open_session(
    const token_id_t& token_id,
    const user_id_t& caller,
    const std::optional<user_id_t>& to_uid,
    const std::optional<duration_milliseconds_t> ttl_ms) {
  if (to_uid && *to_uid == caller) {
    return make_failure<transfer_session_t>(
        error_code_t::invalid_argument, kCodespace,
        "receiver must differ from the owner");
  }
  return swapdot::storage::transact<transfer_session_t>(
      storage_, options_.transaction_attempts, kCodespace,
      [&](rocksdb_transaction_t& txn) -> operation_result<transfer_session_t> {
        auto now = clock_();
        auto token = txn.get_for_update<token_state_t>(
            encoder_, key::make_token_key(encoder_, token_id));
        if (!token) {
          return make_failure<transfer_session_t>(
              error_code_t::not_found, kCodespace, "token not found");
        }
        if (token->current_owner != caller) {
          return make_failure<transfer_session_t>(
              error_code_t::permission_denied, kCodespace,
              "only the current owner may open a transfer session");
        }

        auto active_key =
            key::make_active_transfer_session_key(encoder_, token_id);
        if (auto active_id = txn.get_for_update<std::string>(encoder_, active_key)) {
          auto active = txn.get_for_update<transfer_session_t>(
              encoder_, key::make_transfer_session_key(encoder_, *active_id));
          if (active && active->status == transfer_session_status_t::pending &&
              active->expires_at <= now) {
            expire_session(txn, *active);
          } else if (active && is_active(active->status)) {
            return make_failure<transfer_session_t>(
                error_code_t::already_exists, kCodespace,
                "an active transfer session exists for this token");
          }
        }

        auto session = transfer_session_t{};
        session.session_id = crypto::random_hex_id(16);
        session.token_id = token_id;
        session.from_uid = caller;
        session.to_uid = to_uid;
        session.status = transfer_session_status_t::pending;
        session.challenge = crypto::random_bytes(kChallengeSize);
        session.created_at = now;
        session.expires_at =
            now + ttl_ms.value_or(options_.transfer_session_ttl_ms);
        txn.put(encoder_,
                key::make_transfer_session_key(encoder_, session.session_id),
                session);
        txn.put(encoder_, active_key, session.session_id);
        spdlog::info("Transfer session {} opened for token {}",
                     session.session_id, token_id);
        return make_success(std::move(session));
      });
}

operation_result<hash32_t> ledger::validate_card_key(
    const std::string& session_id,
    const bytes_view_t& card_bytes) {
  if (card_bytes.size() < kCardKeySize) {
    return make_failure<hash32_t>(error_code_t::invalid_argument, kCodespace,
                                  "card key must be at least 32 bytes");
  }
  return swapdot::storage::transact<hash32_t>(
      storage_, options_.transaction_attempts, kCodespace,
      [&](rocksdb_transaction_t& txn) -> operation_result<hash32_t> {
        auto now = clock_();
        auto session_key = key::make_transfer_session_key(encoder_, session_id);
        auto session =
            txn.get_for_update<transfer_session_t>(encoder_, session_key);
        if (!session) {
          return make_failure<hash32_t>(error_code_t::not_found, kCodespace,
                                        "transfer session not found");
        }
        if (session->status != transfer_session_status_t::pending) {
          return make_failure<hash32_t>(error_code_t::conflict, kCodespace,
                                        "transfer session is not pending");
        }
        if (session->expires_at <= now) {
          expire_session(txn, *session);
          return make_failure<hash32_t>(error_code_t::expired, kCodespace,
                                        "transfer session expired");
        }
        auto token = txn.get_for_update<token_state_t>(
            encoder_, key::make_token_key(encoder_, session->token_id));
        if (!token) {
          return make_failure<hash32_t>(error_code_t::not_found, kCodespace,
                                        "token not found");
        }

        auto card_key = card_bytes.first(kCardKeySize);
        auto key_hash = crypto::sha256(card_key);
        auto matches_pending =
            session->pending_key_hash &&
            crypto::constant_time_equal(key_hash, *session->pending_key_hash);
        if (!matches_pending &&
            !crypto::constant_time_equal(key_hash, token->key_hash)) {
          spdlog::warn("Card key mismatch for transfer session {}", session_id);
          auto audit = audit_record_t{};
          audit.type = audit_type_t::security_violation;
          audit.token_id = session->token_id;
          audit.subject_id = session_id;
          audit.from_uid = session->from_uid;
          audit.to_uid = session->to_uid.value_or(user_id_t{});
          audit.reason = "card key does not match the ledger";
          append_audit(txn, std::move(audit));
          return make_failure<hash32_t>(error_code_t::permission_denied,
                                        kCodespace,
                                        "card key does not match the ledger");
        }

        auto message = concat(
            make_bytes_view(kProofLabel), length_prefixed(session->challenge),
            length_prefixed(make_bytes_view(session->token_id)));
        auto proof = crypto::hmac_sha256(card_key, message);
        session->validated = true;
        session->validated_key_hash = key_hash;
        session->proof = proof;
        txn.put(encoder_, session_key, *session);
        return make_success(proof);
      });
}

operation_result<staged_transfer_t> ledger::stage(
    const std::string& session_id,
    const user_id_t& caller,
    const hash32_t& new_key_hash,
    const std::optional<user_id_t>& to_uid) {
  return swapdot::storage::transact<staged_transfer_t>(
      storage_, options_.transaction_attempts, kCodespace,
      [&](rocksdb_transaction_t& txn) -> operation_result<staged_transfer_t> {
        auto now = clock_();
        auto session_key = key::make_transfer_session_key(encoder_, session_id);
        auto session =
            txn.get_for_update<transfer_session_t>(encoder_, session_key);
        if (!session) {
          return make_failure<staged_transfer_t>(
              error_code_t::not_found, kCodespace, "transfer session not found");
        }
        if (caller != session->from_uid && caller != session->to_uid) {
          return make_failure<staged_transfer_t>(
              error_code_t::permission_denied, kCodespace,
              "caller is not a party to this transfer");
        }
        if (session->status != transfer_session_status_t::pending) {
          return make_failure<staged_transfer_t>(
              error_code_t::conflict, kCodespace,
              "transfer session is not pending");
        }
        if (session->expires_at <= now) {
          expire_session(txn, *session);
          return make_failure<staged_transfer_t>(
              error_code_t::expired, kCodespace, "transfer session expired");
        }
        if (!session->validated) {
          return make_failure<staged_transfer_t>(
              error_code_t::permission_denied, kCodespace,
              "card key has not been validated");
        }

        auto receiver = to_uid ? *to_uid : session->to_uid.value_or(caller);
        if (session->to_uid && receiver != *session->to_uid) {
          return make_failure<staged_transfer_t>(
              error_code_t::permission_denied, kCodespace,
              "transfer session is bound to another receiver");
        }
        if (receiver == session->from_uid) {
          return make_failure<staged_transfer_t>(
              error_code_t::invalid_argument, kCodespace,
              "receiver must differ from the owner");
        }

        auto token = txn.get_for_update<token_state_t>(
            encoder_, key::make_token_key(encoder_, session->token_id));
        if (!token) {
          return make_failure<staged_transfer_t>(
              error_code_t::not_found, kCodespace, "token not found");
        }
        if (token->current_owner != session->from_uid) {
          return make_failure<staged_transfer_t>(
              error_code_t::conflict, kCodespace,
              "token owner changed since the session was opened");
        }
        auto history = token->previous_owners;
        history.push_back(session->from_uid);
        if (!validate_append_only(token->previous_owners, history, receiver)) {
          return make_failure<staged_transfer_t>(
              error_code_t::permission_denied, kCodespace,
              "ownership history must be append-only");
        }

        auto staged = staged_transfer_t{};
        staged.staged_id = crypto::random_hex_id(16);
        staged.session_id = session->session_id;
        staged.token_id = session->token_id;
        staged.from_uid = session->from_uid;
        staged.to_uid = receiver;
        staged.original = token_snapshot_t{.owner = token->current_owner,
                                           .previous_owners =
                                               token->previous_owners,
                                           .key_hash = token->key_hash};
        staged.proposed = token_snapshot_t{.owner = receiver,
                                           .previous_owners = std::move(history),
                                           .key_hash = new_key_hash};
        staged.status = staged_transfer_status_t::staged;
        staged.created_at = now;
        staged.expires_at = now + options_.staged_ttl_ms;
        txn.put(encoder_, key::make_staged_transfer_key(encoder_, staged.staged_id),
                staged);

        session->status = transfer_session_status_t::staged;
        session->to_uid = receiver;
        session->staged_transfer_id = staged.staged_id;
        txn.put(encoder_, session_key, *session);
        spdlog::info("Transfer {} staged for token {}", staged.staged_id,
                     staged.token_id);
        return make_success(std::move(staged));
      });
}

operation_result<token_state_t> ledger::commit(const std::string& staged_id,
                                               const user_id_t& caller) {
  return swapdot::storage::transact<token_state_t>(
      storage_, options_.transaction_attempts, kCodespace,
      [&](rocksdb_transaction_t& txn) -> operation_result<token_state_t> {
        auto now = clock_();
        auto staged_key = key::make_staged_transfer_key(encoder_, staged_id);
        auto staged = txn.get_for_update<staged_transfer_t>(encoder_, staged_key);
        if (!staged) {
          return make_failure<token_state_t>(
              error_code_t::not_found, kCodespace, "staged transfer not found");
        }
        if (caller != staged->from_uid && caller != staged->to_uid) {
          return make_failure<token_state_t>(
              error_code_t::permission_denied, kCodespace,
              "caller is not a party to this transfer");
        }
        if (staged->status != staged_transfer_status_t::staged) {
          return make_failure<token_state_t>(error_code_t::conflict,
                                             kCodespace,
                                             "transfer is not staged");
        }
        if (staged->expires_at <= now) {
          expire_staged(txn, *staged);
          return make_failure<token_state_t>(error_code_t::expired, kCodespace,
                                             "staged transfer expired");
        }

        auto session_key =
            key::make_transfer_session_key(encoder_, staged->session_id);
        auto session =
            txn.get_for_update<transfer_session_t>(encoder_, session_key);
        if (!session || session->status != transfer_session_status_t::staged) {
          return make_failure<token_state_t>(
              error_code_t::conflict, kCodespace,
              "transfer session is not staged");
        }
        auto token_key = key::make_token_key(encoder_, staged->token_id);
        auto token = txn.get_for_update<token_state_t>(encoder_, token_key);
        if (!token) {
          return make_failure<token_state_t>(error_code_t::not_found,
                                             kCodespace, "token not found");
        }
        if (!matches_snapshot(*token, staged->original)) {
          spdlog::warn("Token {} changed after transfer {} was staged",
                       staged->token_id, staged_id);
          return make_failure<token_state_t>(
              error_code_t::conflict, kCodespace,
              "token changed since the transfer was staged");
        }

        token->current_owner = staged->proposed.owner;
        token->previous_owners = staged->proposed.previous_owners;
        token->key_hash = staged->proposed.key_hash;
        token->counter += 1;
        token->status = token_status_t::ok;
        token->last_transfer_at = now;
        append_event(txn, *token, staged->from_uid,
                     transfer_protocol_t::two_phase);
        txn.put(encoder_, token_key, *token);

        session->status = transfer_session_status_t::committed;
        txn.put(encoder_, session_key, *session);
        txn.erase(key::make_active_transfer_session_key(encoder_,
                                                        staged->token_id));
        staged->status = staged_transfer_status_t::committed;
        txn.put(encoder_, staged_key, *staged);
        cancel_pending(txn, staged->token_id,
                       "superseded by two-phase transfer commit");

        update_stats(txn, staged->from_uid, [now](user_stats_t& stats) {
          stats.tokens_owned = stats.tokens_owned > 0 ? stats.tokens_owned - 1 : 0;
          ++stats.tokens_transferred_out;
          stats.last_active_at = now;
        });
        update_stats(txn, staged->to_uid, [now](user_stats_t& stats) {
          ++stats.tokens_owned;
          ++stats.tokens_received;
          stats.last_active_at = now;
        });
        spdlog::info("Transfer {} committed, token {} counter={}", staged_id,
                     token->token_id, token->counter);
        return make_success(std::move(*token));
      });
}

operation_result<staged_transfer_t> ledger::rollback(
    const std::string& staged_id,
    const user_id_t& caller,
    const std::optional<std::string>& reason) {
  return swapdot::storage::transact<staged_transfer_t>(
      storage_, options_.transaction_attempts, kCodespace,
      [&](rocksdb_transaction_t& txn) -> operation_result<staged_transfer_t> {
        auto staged_key = key::make_staged_transfer_key(encoder_, staged_id);
        auto staged = txn.get_for_update<staged_transfer_t>(encoder_, staged_key);
        if (!staged) {
          return make_failure<staged_transfer_t>(
              error_code_t::not_found, kCodespace, "staged transfer not found");
        }
        if (caller != staged->from_uid && caller != staged->to_uid) {
          return make_failure<staged_transfer_t>(
              error_code_t::permission_denied, kCodespace,
              "caller is not a party to this transfer");
        }
        if (staged->status != staged_transfer_status_t::staged) {
          return make_failure<staged_transfer_t>(error_code_t::conflict,
                                                 kCodespace,
                                                 "transfer is not staged");
        }

        auto session_key =
            key::make_transfer_session_key(encoder_, staged->session_id);
        if (auto session =
                txn.get_for_update<transfer_session_t>(encoder_, session_key)) {
          session->status = transfer_session_status_t::pending;
          session->staged_transfer_id.reset();
          txn.put(encoder_, session_key, *session);
        }

        auto why = reason.value_or(std::string{kDefaultRollbackReason});
        staged->status = staged_transfer_status_t::rolled_back;
        staged->rollback_reason = why;
        txn.put(encoder_, staged_key, *staged);

        auto audit = audit_record_t{};
        audit.type = audit_type_t::rollback;
        audit.token_id = staged->token_id;
        audit.subject_id = staged_id;
        audit.from_uid = staged->from_uid;
        audit.to_uid = staged->to_uid;
        audit.reason = why;
        append_audit(txn, std::move(audit));
        spdlog::info("Transfer {} rolled back: {}", staged_id, why);
        return make_success(std::move(*staged));
      });
}

std::size_t ledger::sweep_expired_pending(const std::size_t batch) {
  auto now = clock_();
  auto candidates = std::vector<token_id_t>{};
  for (auto& pending : decode_all<pending_transfer_t>(
           encoder_, storage_.list_by_prefix(key::make_prefix_key(
                         encoder_, key::kPendingTransferKeyPrefix)))) {
    if (candidates.size() >= batch) {
      break;
    }
    if (pending.status == pending_transfer_status_t::open &&
        pending.expires_at <= now) {
      candidates.push_back(std::move(pending.token_id));
    }
  }

  auto expired = std::size_t{0};
  for (const auto& token_id : candidates) {
    auto flipped = swapdot::storage::run_transaction(
        storage_, options_.transaction_attempts,
        [&](rocksdb_transaction_t& txn) {
          auto pending_key = key::make_pending_transfer_key(encoder_, token_id);
          auto pending =
              txn.get_for_update<pending_transfer_t>(encoder_, pending_key);
          if (!pending || pending->status != pending_transfer_status_t::open ||
              pending->expires_at > clock_()) {
            return false;
          }
          pending->status = pending_transfer_status_t::expired;
          txn.put(encoder_, pending_key, *pending);

          auto token_key = key::make_token_key(encoder_, token_id);
          if (auto token =
                  txn.get_for_update<token_state_t>(encoder_, token_key)) {
            token->status = token_status_t::ok;
            txn.put(encoder_, token_key, *token);
          }
          auto audit = audit_record_t{};
          audit.type = audit_type_t::expiry;
          audit.token_id = token_id;
          audit.subject_id = token_id;
          audit.from_uid = pending->from_uid;
          audit.to_uid = pending->to_uid.value_or(user_id_t{});
          audit.reason = "pending transfer expired";
          append_audit(txn, std::move(audit));
          return true;
        });
    if (flipped.value_or(false)) {
      ++expired;
    }
  }
  if (expired > 0) {
    spdlog::info("Expired {} pending transfers", expired);
  }
  return expired;
}

std::size_t ledger::sweep_expired_two_phase(const std::size_t batch) {
  auto now = clock_();
  auto sessions = std::vector<std::string>{};
  for (auto& session : decode_all<transfer_session_t>(
           encoder_, storage_.list_by_prefix(key::make_prefix_key(
                         encoder_, key::kTransferSessionKeyPrefix)))) {
    if (sessions.size() >= batch) {
      break;
    }
    if (session.status == transfer_session_status_t::pending &&
        session.expires_at <= now) {
      sessions.push_back(std::move(session.session_id));
    }
  }
  auto staged_ids = std::vector<std::string>{};
  for (auto& staged : decode_all<staged_transfer_t>(
           encoder_, storage_.list_by_prefix(key::make_prefix_key(
                         encoder_, key::kStagedTransferKeyPrefix)))) {
    if (staged_ids.size() >= batch) {
      break;
    }
    if (staged.status == staged_transfer_status_t::staged &&
        staged.expires_at <= now) {
      staged_ids.push_back(std::move(staged.staged_id));
    }
  }

  auto expired = std::size_t{0};
  for (const auto& session_id : sessions) {
    auto flipped = swapdot::storage::run_transaction(
        storage_, options_.transaction_attempts,
        [&](rocksdb_transaction_t& txn) {
          auto session = txn.get_for_update<transfer_session_t>(
              encoder_, key::make_transfer_session_key(encoder_, session_id));
          if (!session ||
              session->status != transfer_session_status_t::pending ||
              session->expires_at > clock_()) {
            return false;
          }
          expire_session(txn, *session);
          return true;
        });
    if (flipped.value_or(false)) {
      ++expired;
    }
  }
  for (const auto& staged_id : staged_ids) {
    auto flipped = swapdot::storage::run_transaction(
        storage_, options_.transaction_attempts,
        [&](rocksdb_transaction_t& txn) {
          auto staged = txn.get_for_update<staged_transfer_t>(
              encoder_, key::make_staged_transfer_key(encoder_, staged_id));
          if (!staged || staged->status != staged_transfer_status_t::staged ||
              staged->expires_at > clock_()) {
            return false;
          }
          expire_staged(txn, *staged);
          return true;
        });
    if (flipped.value_or(false)) {
      ++expired;
    }
  }
  if (expired > 0) {
    spdlog::info("Expired {} two-phase records", expired);
  }
  return expired;
}

operation_status_t ledger::reconcile_committed(const token_id_t& token_id) {
  return swapdot::storage::transact_status(
      storage_, options_.transaction_attempts, kCodespace,
      [&](rocksdb_transaction_t& txn) -> operation_status_t {
        auto pending = txn.get_for_update<pending_transfer_t>(
            encoder_, key::make_pending_transfer_key(encoder_, token_id));
        if (!pending || pending->status != pending_transfer_status_t::committed) {
          return make_error(error_code_t::not_found, kCodespace,
                            "no committed pending record");
        }
        auto token_key = key::make_token_key(encoder_, token_id);
        auto token = txn.get_for_update<token_state_t>(encoder_, token_key);
        if (!token) {
          return make_error(error_code_t::not_found, kCodespace,
                            "token not found");
        }
        heal_committed(txn, *token, *pending);
        txn.put(encoder_, token_key, *token);
        return operation_status_t{};
      });
}

std::size_t ledger::reconcile_all_committed(const std::size_t batch) {
  auto candidates = std::vector<token_id_t>{};
  for (auto& pending : decode_all<pending_transfer_t>(
           encoder_, storage_.list_by_prefix(key::make_prefix_key(
                         encoder_, key::kPendingTransferKeyPrefix)))) {
    if (candidates.size() >= batch) {
      break;
    }
    if (pending.status == pending_transfer_status_t::committed) {
      candidates.push_back(std::move(pending.token_id));
    }
  }
  auto healed = std::size_t{0};
  for (const auto& token_id : candidates) {
    if (reconcile_committed(token_id).ok()) {
      ++healed;
    }
  }
  return healed;
}

operation_result<token_state_t> ledger::token(const token_id_t& token_id) const {
  auto token =
      storage_.get<token_state_t>(encoder_, key::make_token_key(encoder_, token_id));
  if (!token) {
    return make_failure<token_state_t>(error_code_t::not_found, kCodespace,
                                       "token not found");
  }
  return make_success(std::move(*token));
}

std::vector<transfer_event_t> ledger::events(const token_id_t& token_id) const {
  auto events = decode_all<transfer_event_t>(
      encoder_, storage_.list_by_prefix(
                    key::make_token_event_prefix(encoder_, token_id)));
  std::sort(std::begin(events), std::end(events),
            [](const auto& lhs, const auto& rhs) {
              return lhs.sequence < rhs.sequence;
            });
  return events;
}

std::vector<audit_record_t> ledger::audit_log() const {
  auto records = decode_all<audit_record_t>(
      encoder_, storage_.list_by_prefix(
                    key::make_prefix_key(encoder_, key::kAuditPrefix)));
  std::sort(std::begin(records), std::end(records),
            [](const auto& lhs, const auto& rhs) {
              return lhs.sequence < rhs.sequence;
            });
  return records;
}

operation_result<user_stats_t> ledger::user_stats(
    const user_id_t& user_id) const {
  auto stats = storage_.get<user_stats_t>(
      encoder_, key::make_user_stats_key(encoder_, user_id));
  if (!stats) {
    return make_failure<user_stats_t>(error_code_t::not_found, kCodespace,
                                      "no statistics for user");
  }
  return make_success(std::move(*stats));
}

operation_result<pending_transfer_t> ledger::pending(
    const token_id_t& token_id) const {
  auto pending = storage_.get<pending_transfer_t>(
      encoder_, key::make_pending_transfer_key(encoder_, token_id));
  if (!pending) {
    return make_failure<pending_transfer_t>(error_code_t::not_found,
                                            kCodespace, "no pending transfer");
  }
  return make_success(std::move(*pending));
}

operation_result<transfer_session_t> ledger::transfer_session(
    const std::string& session_id) const {
  auto session = storage_.get<transfer_session_t>(
      encoder_, key::make_transfer_session_key(encoder_, session_id));
  if (!session) {
    return make_failure<transfer_session_t>(
        error_code_t::not_found, kCodespace, "transfer session not found");
  }
  return make_success(std::move(*session));
}

operation_result<staged_transfer_t> ledger::staged_transfer(
    const std::string& staged_id) const {
  auto staged = storage_.get<staged_transfer_t>(
      encoder_, key::make_staged_transfer_key(encoder_, staged_id));
  if (!staged) {
    return make_failure<staged_transfer_t>(
        error_code_t::not_found, kCodespace, "staged transfer not found");
  }
  return make_success(std::move(*staged));
}

void ledger::append_event(rocksdb_transaction_t& txn,
                          token_state_t& token,
                          const user_id_t& from_owner,
                          const transfer_protocol_t protocol) {
  auto sequence_key = key::make_event_sequence_key(encoder_);
  auto sequence =
      txn.get_for_update<uint64_t>(encoder_, sequence_key).value_or(0) + 1;
  txn.put(encoder_, sequence_key, sequence);

  auto event = transfer_event_t{};
  event.sequence = sequence;
  event.token_id = token.token_id;
  event.from_owner = from_owner;
  event.to_owner = token.current_owner;
  event.counter = token.counter;
  event.protocol = protocol;
  event.timestamp = clock_();
  // The head covers the event with a zero head field.
  event.chain_head = blake3::chain(token.chain_head, encoder_.encode(event));
  token.chain_head = event.chain_head;
  txn.put(encoder_, key::make_event_key(encoder_, token.token_id, sequence),
          event);
}

void ledger::append_audit(rocksdb_transaction_t& txn, audit_record_t record) {
  auto sequence_key = key::make_audit_sequence_key(encoder_);
  auto sequence =
      txn.get_for_update<uint64_t>(encoder_, sequence_key).value_or(0) + 1;
  txn.put(encoder_, sequence_key, sequence);
  record.sequence = sequence;
  record.timestamp = clock_();
  txn.put(encoder_, key::make_audit_key(encoder_, sequence), record);
}

void ledger::update_stats(rocksdb_transaction_t& txn,
                          const user_id_t& user_id,
                          const std::function<void(user_stats_t&)>& change) {
  auto stats_key = key::make_user_stats_key(encoder_, user_id);
  auto stats = txn.get_for_update<user_stats_t>(encoder_, stats_key)
                   .value_or(user_stats_t{});
  stats.user_id = user_id;
  change(stats);
  txn.put(encoder_, stats_key, stats);
}

void ledger::heal_committed(rocksdb_transaction_t& txn,
                            token_state_t& token,
                            const pending_transfer_t& pending) {
  spdlog::error("Committed pending record found for token {}, reconciling",
                token.token_id);
  auto audit = audit_record_t{};
  audit.type = audit_type_t::correction;
  audit.token_id = token.token_id;
  audit.subject_id = token.token_id;
  audit.from_uid = pending.from_uid;
  audit.to_uid = pending.to_uid.value_or(user_id_t{});

  if (pending.to_uid && token.current_owner != *pending.to_uid) {
    auto from_owner = token.current_owner;
    token.previous_owners =
        propose_history(token.previous_owners, token.current_owner);
    token.current_owner = *pending.to_uid;
    token.counter = std::max(token.counter, pending.n_next);
    token.last_transfer_at = clock_();
    append_event(txn, token, from_owner, transfer_protocol_t::reconcile);
    audit.reason = "owner reconciled from committed pending record";
  } else {
    audit.reason = "stale committed pending record removed";
  }
  token.status = token_status_t::ok;
  append_audit(txn, std::move(audit));
  txn.erase(key::make_pending_transfer_key(encoder_, token.token_id));
}

void ledger::expire_session(rocksdb_transaction_t& txn,
                            transfer_session_t& session) {
  session.status = transfer_session_status_t::expired;
  txn.put(encoder_, key::make_transfer_session_key(encoder_, session.session_id),
          session);
  auto active_key =
      key::make_active_transfer_session_key(encoder_, session.token_id);
  auto active = txn.get_for_update<std::string>(encoder_, active_key);
  if (active && *active == session.session_id) {
    txn.erase(active_key);
  }

  auto audit = audit_record_t{};
  audit.type = audit_type_t::expiry;
  audit.token_id = session.token_id;
  audit.subject_id = session.session_id;
  audit.from_uid = session.from_uid;
  audit.to_uid = session.to_uid.value_or(user_id_t{});
  audit.reason = "transfer session expired";
  append_audit(txn, std::move(audit));
}

void ledger::cancel_transfer_session(rocksdb_transaction_t& txn,
                                     const token_id_t& token_id,
                                     const std::string_view reason) {
  auto active_key = key::make_active_transfer_session_key(encoder_, token_id);
  auto active_id = txn.get_for_update<std::string>(encoder_, active_key);
  if (!active_id) {
    return;
  }
  txn.erase(active_key);
  auto session_key = key::make_transfer_session_key(encoder_, *active_id);
  auto session = txn.get_for_update<transfer_session_t>(encoder_, session_key);
  if (!session || !is_active(session->status)) {
    return;
  }
  if (session->staged_transfer_id) {
    auto staged_key =
        key::make_staged_transfer_key(encoder_, *session->staged_transfer_id);
    auto staged = txn.get_for_update<staged_transfer_t>(encoder_, staged_key);
    if (staged && staged->status == staged_transfer_status_t::staged) {
      staged->status = staged_transfer_status_t::rolled_back;
      staged->rollback_reason = std::string{reason};
      txn.put(encoder_, staged_key, *staged);
    }
  }
  session->status = transfer_session_status_t::canceled;
  txn.put(encoder_, session_key, *session);

  auto audit = audit_record_t{};
  audit.type = audit_type_t::correction;
  audit.token_id = token_id;
  audit.subject_id = session->session_id;
  audit.from_uid = session->from_uid;
  audit.to_uid = session->to_uid.value_or(user_id_t{});
  audit.reason = std::string{reason};
  append_audit(txn, std::move(audit));
  spdlog::info("Transfer session {} canceled: {}", session->session_id,
               reason);
}

void ledger::cancel_pending(rocksdb_transaction_t& txn,
                            const token_id_t& token_id,
                            const std::string_view reason) {
  auto pending_key = key::make_pending_transfer_key(encoder_, token_id);
  auto pending = txn.get_for_update<pending_transfer_t>(encoder_, pending_key);
  if (!pending || pending->status != pending_transfer_status_t::open) {
    return;
  }
  pending->status = pending_transfer_status_t::canceled;
  txn.put(encoder_, pending_key, *pending);

  auto audit = audit_record_t{};
  audit.type = audit_type_t::correction;
  audit.token_id = token_id;
  audit.subject_id = token_id;
  audit.from_uid = pending->from_uid;
  audit.to_uid = pending->to_uid.value_or(user_id_t{});
  audit.reason = std::string{reason};
  append_audit(txn, std::move(audit));
  spdlog::info("Pending transfer of token {} canceled: {}", token_id, reason);
}

void ledger::expire_staged(rocksdb_transaction_t& txn,
                           staged_transfer_t& staged) {
  staged.status = staged_transfer_status_t::expired;
  txn.put(encoder_, key::make_staged_transfer_key(encoder_, staged.staged_id),
          staged);
  auto session_key = key::make_transfer_session_key(encoder_, staged.session_id);
  if (auto session =
          txn.get_for_update<transfer_session_t>(encoder_, session_key)) {
    if (session->status == transfer_session_status_t::staged) {
      session->status = transfer_session_status_t::pending;
      session->staged_transfer_id.reset();
      txn.put(encoder_, session_key, *session);
    }
  }

  auto audit = audit_record_t{};
  audit.type = audit_type_t::expiry;
  audit.token_id = staged.token_id;
  audit.subject_id = staged.staged_id;
  audit.from_uid = staged.from_uid;
  audit.to_uid = staged.to_uid;
  audit.reason = "staged transfer expired";
  append_audit(txn, std::move(audit));
}

}  // namespace swapdot::ledger
