#pragma once

#include <swapdot/common/time_source.hpp>
#include <swapdot/schema/auth_session.hpp>
#include <swapdot/schema/encoding/scale/encoder.hpp>
#include <swapdot/schema/operation_result.hpp>
#include <swapdot/storage/rocksdb/storage.hpp>

#include <cstddef>
#include <string>

namespace swapdot::session {

/// Authentication sessions with TTL, persisted beside the ledger so every
/// protocol round can run as an independent call.
///
/// Each instance owns nothing but references; independent instances over
/// independent databases never share state. The transactional overloads let
/// a caller combine session changes with token changes in one commit.
class session_store final {
 public:
  session_store(swapdot::schema::encoding::scale_encoder_t& encoder,
                const swapdot::storage::rocksdb_storage_t& storage,
                swapdot::common::time_source_t clock,
                uint32_t transaction_attempts = 5);

  void create(swapdot::storage::rocksdb_transaction_t& txn,
              const swapdot::schema::auth_session_t& session);

  /// not_found when absent. An expired session is erased in txn and
  /// reported as expired.
  swapdot::schema::operation_result<swapdot::schema::auth_session_t> load(
      swapdot::storage::rocksdb_transaction_t& txn,
      const std::string& session_id);

  void update(swapdot::storage::rocksdb_transaction_t& txn,
              const swapdot::schema::auth_session_t& session);

  void destroy(swapdot::storage::rocksdb_transaction_t& txn,
               const std::string& session_id);

  /// Standalone read in its own transaction, with the same expiry rules.
  swapdot::schema::operation_result<swapdot::schema::auth_session_t> get(
      const std::string& session_id);

  /// Erase up to batch expired sessions. Returns the number erased.
  std::size_t sweep_expired(std::size_t batch);

 private:
  swapdot::schema::encoding::scale_encoder_t& encoder_;
  const swapdot::storage::rocksdb_storage_t& storage_;
  swapdot::common::time_source_t clock_;
  uint32_t transaction_attempts_{5};
};

}  // namespace swapdot::session
