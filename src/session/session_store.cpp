#include <swapdot/schema/key/ledger_keys.hpp>
#include <swapdot/session/session_store.hpp>

#include <spdlog/spdlog.h>

#include <utility>
#include <vector>

using namespace swapdot::schema;

namespace swapdot::session {

namespace {

inline constexpr auto kCodespace = std::string_view{"swapdot.session"};

}  // namespace

session_store::session_store(encoding::scale_encoder_t& encoder,
                             const swapdot::storage::rocksdb_storage_t& storage,
                             swapdot::common::time_source_t clock,
                             const uint32_t transaction_attempts)
    : encoder_{encoder},
      storage_{storage},
      clock_{std::move(clock)},
      transaction_attempts_{transaction_attempts} {}

void session_store::create(swapdot::storage::rocksdb_transaction_t& txn,
                           const auth_session_t& session) {
  txn.put(encoder_, key::make_auth_session_key(encoder_, session.session_id),
          session);
}

operation_result<auth_session_t> session_store::load(
    swapdot::storage::rocksdb_transaction_t& txn,
    const std::string& session_id) {
  auto record_key = key::make_auth_session_key(encoder_, session_id);
  auto session = txn.get_for_update<auth_session_t>(encoder_, record_key);
  if (!session) {
    return make_failure<auth_session_t>(error_code_t::not_found, kCodespace,
                                        "session not found");
  }
  if (session->expires_at <= clock_()) {
    txn.erase(record_key);
    spdlog::info("Auth session {} expired", session_id);
    return make_failure<auth_session_t>(error_code_t::expired, kCodespace,
                                        "session expired");
  }
  return make_success(std::move(*session));
}

void session_store::update(swapdot::storage::rocksdb_transaction_t& txn,
                           const auth_session_t& session) {
  txn.put(encoder_, key::make_auth_session_key(encoder_, session.session_id),
          session);
}

void session_store::destroy(swapdot::storage::rocksdb_transaction_t& txn,
                            const std::string& session_id) {
  txn.erase(key::make_auth_session_key(encoder_, session_id));
}

operation_result<auth_session_t> session_store::get(
    const std::string& session_id) {
  auto result = swapdot::storage::run_transaction(
      storage_, transaction_attempts_,
      [&](swapdot::storage::rocksdb_transaction_t& txn) {
        return load(txn, session_id);
      });
  if (!result) {
    return make_failure<auth_session_t>(error_code_t::conflict, kCodespace,
                                        "session store contention");
  }
  return std::move(*result);
}

std::size_t session_store::sweep_expired(const std::size_t batch) {
  auto now = clock_();
  auto expired = std::vector<std::string>{};
  for (const auto& entry : storage_.list_by_prefix(
           key::make_prefix_key(encoder_, key::kAuthSessionKeyPrefix))) {
    if (expired.size() >= batch) {
      break;
    }
    auto session = encoder_.try_decode<auth_session_t>(entry.second);
    if (session && session->expires_at <= now) {
      expired.push_back(session->session_id);
    }
  }

  auto erased = std::size_t{0};
  for (const auto& session_id : expired) {
    auto outcome = swapdot::storage::run_transaction(
        storage_, transaction_attempts_,
        [&](swapdot::storage::rocksdb_transaction_t& txn) {
          return load(txn, session_id).status.code == error_code_t::expired;
        });
    if (outcome.value_or(false)) {
      ++erased;
    }
  }
  if (erased > 0) {
    spdlog::info("Swept {} expired auth sessions", erased);
  }
  return erased;
}

}  // namespace swapdot::session
